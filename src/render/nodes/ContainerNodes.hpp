/**
 * ************************************************************************
 *
 * @file ContainerNodes.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 容器盒节点类型
  - RenderAlignBox: 在自身范围内对齐唯一子节点
  - RenderStack: 子节点重叠，按对齐方式定位
  - RenderFlex: 子节点沿主轴依次排列
  - RenderRepaintBoundary: 拥有独立绘制层
  - RenderTransformBox: 对子节点施加绘制变换，命中测试时取逆
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
 * @brief 对齐容器
 *
 * 不收缩时尺寸取约束允许的最大值（无界轴取最小值），只由约束决定；
 * 收缩时尺寸跟随子节点。
 */
struct RenderAlignBox : interface::EnableRenderBox
{
    Alignment alignment = Alignment::Center();
    bool shrinkWrap = false;

    RenderAlignBox() = default;
    explicit RenderAlignBox(Alignment align, bool shrink = false) : alignment(align), shrinkWrap(shrink) {}

    [[nodiscard]] bool sizedByParent() const { return !shrinkWrap; }
    [[nodiscard]] Vec2 performResize(const BoxConstraints& constraints) const;
    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

/**
 * @brief 重叠容器，后面的子节点绘制在上层
 */
struct RenderStack : interface::EnableRenderBox
{
    Alignment alignment = Alignment::TopLeft();

    RenderStack() = default;
    explicit RenderStack(Alignment align) : alignment(align) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

/**
 * @brief 线性容器，子节点主轴不受限、交叉轴松约束
 */
struct RenderFlex : interface::EnableRenderBox
{
    Axis direction = Axis::HORIZONTAL;
    float spacing = 0.0F;

    RenderFlex() = default;
    explicit RenderFlex(Axis axis, float gap = 0.0F) : direction(axis), spacing(gap) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

struct RenderRepaintBoundary : interface::EnableRenderBox
{
    [[nodiscard]] bool isRepaintBoundary() const { return true; }
    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

/**
 * @brief 绘制变换容器，变换以自身原点为中心
 */
struct RenderTransformBox : interface::EnableRenderBox
{
    Transform2D transform = Transform2D::Identity();

    RenderTransformBox() = default;
    explicit RenderTransformBox(const Transform2D& paintTransform) : transform(paintTransform) {}

    void performLayout(LayoutScope<BoxConstraints>& scope);
    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const;
    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const;
};

} // namespace render::nodes
