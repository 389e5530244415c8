/**
 * ************************************************************************
 *
 * @file BoxNodes.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 基础盒节点类型
  - RenderSolidBox: 带首选尺寸的不透明叶子
  - RenderConstrainedBox: 给子节点附加约束
  - RenderFractionalBox: 按父约束最大值的比例确定尺寸
  - RenderPadding: 内边距
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include "../common/Constraints.hpp"
#include "../common/Events.hpp"
#include "../core/HitTestResult.hpp"
#include "../interface/IRenderObject.hpp"

namespace render::nodes
{

/**
 * @brief 不透明叶子节点，尺寸为约束内最接近首选尺寸的值
 */
struct RenderSolidBox : interface::EnableRenderBox
{
    using PointerHandler = std::function<void(EventScope&, const events::PointerEvent&, const HitTestEntry&)>;

    Vec2 preferredSize{0.0F, 0.0F};
    bool opaque = true;      // false 时自身不参与命中
    PointerHandler onPointer;

    RenderSolidBox() = default;
    explicit RenderSolidBox(const Vec2& size, bool isOpaque = true) : preferredSize(size), opaque(isOpaque) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestSelf(const Vec2& position) const;
    void handleEvent(EventScope& scope, const events::PointerEvent& event, const HitTestEntry& entry);
};

/**
 * @brief 给子节点附加约束，附加约束会被收紧到父约束之内
 */
struct RenderConstrainedBox : interface::EnableRenderBox
{
    BoxConstraints additionalConstraints;

    RenderConstrainedBox() = default;
    explicit RenderConstrainedBox(const BoxConstraints& additional) : additionalConstraints(additional) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

/**
 * @brief 百分比尺寸
 *
 * 指定比例的轴在父约束有界时解析为 factor * max（再受约束限制），
 * 无界或未指定时取子节点尺寸，没有子节点时取约束最小值。
 */
struct RenderFractionalBox : interface::EnableRenderBox
{
    std::optional<float> widthFactor;
    std::optional<float> heightFactor;

    RenderFractionalBox() = default;
    RenderFractionalBox(std::optional<float> width, std::optional<float> height)
        : widthFactor(width), heightFactor(height)
    {
    }

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;

    /**
     * @brief 解析后传给子节点的约束
     */
    [[nodiscard]] BoxConstraints resolve(const BoxConstraints& constraints) const;
};

struct RenderPadding : interface::EnableRenderBox
{
    EdgeInsets padding;

    RenderPadding() = default;
    explicit RenderPadding(const EdgeInsets& insets) : padding(insets) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

} // namespace render::nodes
