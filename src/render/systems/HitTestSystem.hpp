/**
 * ************************************************************************
 *
 * @file HitTestSystem.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.3
 * @brief 命中测试系统

  - 从根节点自顶向下测试，坐标在每条父子边上转换到子节点局部坐标
  - 子节点按绘制逆序测试（后绘制的在上层），命中后停止
  - 结果按最内层优先排列，每个条目记录 全局 -> 局部 变换
  - 盒节点按 [0, w) x [0, h) 判断，滚动轴节点按主轴 / 交叉轴范围判断
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <expected>
#include <entt/entt.hpp>
#include "../common/Errors.hpp"
#include "../common/Types.hpp"
#include "../core/HitTestResult.hpp"

namespace render
{
class PipelineOwner;
}

namespace render::systems
{

class HitTestSystem
{
public:
    /**
     * @brief 以全局坐标测试整棵树
     * @return 布局未完成时返回 LayoutPending，没有根节点时返回 NoRoot
     */
    static std::expected<HitTestResult, TreeError> hitTest(PipelineOwner& owner, const Vec2& globalPosition);

    /**
     * @brief 测试单个节点，position 为节点局部坐标
     */
    static bool hitTestNode(PipelineOwner& owner, entt::entity node, HitTestResult& result, const Vec2& position);

    /**
     * @brief 局部坐标是否落在节点的命中范围内
     */
    [[nodiscard]] static bool isWithinBounds(const entt::registry& registry, entt::entity node, const Vec2& position);
};

} // namespace render::systems
