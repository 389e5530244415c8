/**
 * ************************************************************************
 *
 * @file LayoutScope.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 布局作用域
 *
 * performLayout 期间节点类型与子节点交互的唯一入口：
    - 读取约束与子节点列表
    - layoutBoxChild / layoutSliverChild 布局子节点
    - positionChild / transformChild 写入子节点 ParentData
    - setGeometry 给出自身几何
 *
 * 试算模式（isDryRun）下子节点布局同样是试算，定位写入被忽略，节点状态不变。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <optional>
#include <span>
#include <entt/entt.hpp>
#include "../common/Constraints.hpp"
#include "../traits/ConstraintsTraits.hpp"

namespace render
{
class PipelineOwner;

template <traits::Constraints C>
class LayoutScope
{
public:
    using Geometry = typename C::Geometry;

    LayoutScope(PipelineOwner& owner, entt::entity self, const C& constraints, bool dryRun);

    [[nodiscard]] PipelineOwner& owner() const { return m_owner; }
    [[nodiscard]] entt::entity self() const { return m_self; }
    [[nodiscard]] const C& constraints() const { return m_constraints; }
    [[nodiscard]] bool isDryRun() const { return m_dryRun; }

    /**
     * @brief 子节点列表（绘制顺序）
     */
    [[nodiscard]] std::span<const entt::entity> children() const;

    /**
     * @brief 第一个子节点，没有时为 entt::null
     */
    [[nodiscard]] entt::entity firstChild() const;

    /**
     * @brief 布局盒子节点并返回其尺寸
     * @param parentUsesSize 为 true 表示本节点的布局依赖子节点尺寸
     */
    Vec2 layoutBoxChild(entt::entity child, const BoxConstraints& constraints, bool parentUsesSize = false);

    /**
     * @brief 布局滚动轴子节点并返回其几何
     */
    SliverGeometry layoutSliverChild(entt::entity child,
                                     const SliverConstraints& constraints,
                                     bool parentUsesSize = false);

    /**
     * @brief 设置子节点在本节点坐标系中的绘制偏移
     */
    void positionChild(entt::entity child, const Vec2& offset);

    /**
     * @brief 设置子节点的绘制变换（子坐标 -> 本节点坐标）
     */
    void transformChild(entt::entity child, const Transform2D& transform);

    void setGeometry(const Geometry& geometry) { m_geometry = geometry; }
    [[nodiscard]] bool hasGeometry() const { return m_geometry.has_value(); }

    /**
     * @brief 已设置的几何，未设置时抛出 ContractViolation
     */
    [[nodiscard]] const Geometry& geometry() const;

private:
    void requireChild(entt::entity child, Protocol protocol) const;

    PipelineOwner& m_owner;
    entt::entity m_self;
    const C& m_constraints;
    bool m_dryRun;
    std::optional<Geometry> m_geometry;
};

} // namespace render
