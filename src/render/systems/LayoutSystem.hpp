/**
 * ************************************************************************
 *
 * @file LayoutSystem.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.5
 * @brief 约束驱动的布局系统
 *
 * 父节点把约束传给子节点，子节点给出满足约束的几何：
    - 布局按约束类型泛化（盒约束 / 滚动轴约束）
    - 重新布局边界：尺寸不影响父节点的节点，脏标记只传播到这里
    - 相同约束且干净的节点直接返回缓存几何
    - sizedByParent 节点的尺寸只由约束决定，走 performResize
    - 盒节点支持无副作用的试算布局（dry layout），结果按约束缓存
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <entt/entt.hpp>
#include "../common/Constraints.hpp"
#include "../traits/ConstraintsTraits.hpp"

namespace render
{
class PipelineOwner;
}

namespace render::systems
{

class LayoutSystem
{
public:
    /**
     * @brief 以给定约束布局节点，返回其几何
     *
     * 约束不合法、几何不满足约束、sizedByParent 节点在 performLayout 中改变尺寸
     * 都会抛出 ContractViolation。
     */
    template <traits::Constraints C>
    static typename C::Geometry layout(PipelineOwner& owner,
                                       entt::entity node,
                                       const C& constraints,
                                       bool parentUsesSize);

    /**
     * @brief 用上次的约束重新布局已登记的边界节点（根节点使用根约束）
     */
    static void relayout(PipelineOwner& owner, entt::entity node);

    static void markNeedsLayout(PipelineOwner& owner, entt::entity node);

    /**
     * @brief 标记自身为脏并把脏标记交给父节点
     */
    static void markParentNeedsLayout(PipelineOwner& owner, entt::entity node);

    /**
     * @brief sizedByParent 取值改变时调用，同时标记节点与父节点
     */
    static void markNeedsLayoutForSizedByParentChange(PipelineOwner& owner, entt::entity node);

    /**
     * @brief 盒节点在给定约束下的尺寸，不改变节点状态
     */
    static Vec2 getDryLayout(PipelineOwner& owner, entt::entity node, const BoxConstraints& constraints);

    [[nodiscard]] static bool isRelayoutBoundary(const entt::registry& registry, entt::entity node);

    /**
     * @brief 节点使用的布局协议，未知节点抛出 ContractViolation
     */
    [[nodiscard]] static Protocol protocolOf(const entt::registry& registry, entt::entity node);

    /**
     * @brief 清除子孙继承来的边界，下次布局时重新计算
     */
    static void cleanChildRelayoutBoundaries(entt::registry& registry, entt::entity node);

private:
    template <traits::Constraints C>
    static void verifyGeometry(const PipelineOwner& owner,
                               entt::entity node,
                               const C& constraints,
                               const typename C::Geometry& geometry);
};

} // namespace render::systems
