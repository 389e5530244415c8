/**
 * ************************************************************************
 *
 * @file SliverNodes.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 滚动轴节点类型
  - RenderViewport: 盒节点，沿滚动轴依次布局滚动轴子节点
  - RenderSliverToBoxAdapter: 滚动轴节点，包装一个盒子节点
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstddef>
#include "../common/Constraints.hpp"
#include "../interface/IRenderObject.hpp"

namespace render::nodes
{

/**
 * @brief 视口
 *
 * 尺寸撑满约束（约束必须有界），主轴方向按 scrollOffset 滚动，
 * 可见区域前后各保留 cacheExtent 的缓存范围。
 */
struct RenderViewport : interface::EnableRenderBox
{
    AxisDirection axisDirection = AxisDirection::DOWN;
    float scrollOffset = 0.0F;
    float cacheExtent = 0.0F;

    // 布局结果：所有子节点的滚动长度之和
    float maxScrollExtent = 0.0F;

    RenderViewport() = default;
    explicit RenderViewport(AxisDirection direction, float offset = 0.0F, float cache = 0.0F)
        : axisDirection(direction), scrollOffset(offset), cacheExtent(cache)
    {
    }

    [[nodiscard]] bool sizedByParent() const { return true; }
    [[nodiscard]] Vec2 performResize(const BoxConstraints& constraints) const;
    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

struct RenderSliverToBoxAdapter : interface::EnableRenderSliver
{
    void performLayout(LayoutScope<SliverConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

} // namespace render::nodes
