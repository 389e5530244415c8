/**
 * ************************************************************************
 *
 * @file IRenderObject.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染节点类型接口
 *
 * 每种节点类型（盒、滚动轴）实现同一组能力，按约束类型参数化：
    - sizedByParent / performResize: 尺寸只由约束决定时走快速路径
    - performLayout: 通过 LayoutScope 布局子节点并给出自身几何
    - hitTestSelf / hitTestChildren: 命中测试
    - handleEvent: 命中后的指针事件处理
    - acceptsChild: 子节点模型
 *
 * 节点类型是普通值类型，通过 entt::poly 存放在 RenderObject 组件中，
 * 新增类型不需要继承任何基类，只需满足概念。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <cstddef>
#include <entt/entt.hpp>
#include "../common/Events.hpp"
#include "../traits/ConstraintsTraits.hpp"

namespace render
{
template <traits::Constraints C>
class LayoutScope;
class HitTestScope;
class EventScope;
struct HitTestEntry;
} // namespace render

namespace render::interface
{
/**
 * @brief 渲染节点接口 - C 为节点所用的约束类型
 */
template <traits::Constraints C>
struct IRenderObject : entt::type_list<>
{
    using Geometry = typename C::Geometry;

    template <typename Base>
    struct type : Base
    {
        [[nodiscard]] bool sizedByParent() const { return entt::poly_call<0>(*this); }
        [[nodiscard]] bool isRepaintBoundary() const { return entt::poly_call<1>(*this); }
        [[nodiscard]] Geometry performResize(const C& constraints) const
        {
            return entt::poly_call<2>(*this, constraints);
        }
        void performLayout(LayoutScope<C>& scope) { entt::poly_call<3>(*this, scope); }
        [[nodiscard]] bool hitTestSelf(const Vec2& position) const { return entt::poly_call<4>(*this, position); }
        [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const
        {
            return entt::poly_call<5>(*this, scope, position);
        }
        void handleEvent(EventScope& scope, const events::PointerEvent& event, const HitTestEntry& entry)
        {
            entt::poly_call<6>(*this, scope, event, entry);
        }
        [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const
        {
            return entt::poly_call<7>(*this, protocol, childCount);
        }
    };

    template <typename T>
    using impl = entt::value_list<&T::sizedByParent,
                                  &T::isRepaintBoundary,
                                  &T::performResize,
                                  &T::performLayout,
                                  &T::hitTestSelf,
                                  &T::hitTestChildren,
                                  &T::handleEvent,
                                  &T::acceptsChild>;
};

/**
 * @brief 节点类型的默认实现，叶子节点只需提供 performLayout
 */
template <traits::Constraints C>
struct EnableRenderObject
{
    using constraints_type = C;

    [[nodiscard]] bool sizedByParent() const { return false; }
    [[nodiscard]] bool isRepaintBoundary() const { return false; }

    /**
     * @brief 默认取约束允许的最小几何
     */
    [[nodiscard]] typename C::Geometry performResize(const C& constraints) const
    {
        if constexpr (traits::protocol_of_v<C> == Protocol::BOX)
        {
            return constraints.smallest();
        }
        else
        {
            return SliverGeometry{};
        }
    }

    [[nodiscard]] bool hitTestSelf(const Vec2& /*position*/) const { return false; }
    [[nodiscard]] bool hitTestChildren(HitTestScope& /*scope*/, const Vec2& /*position*/) const { return false; }
    void handleEvent(EventScope& /*scope*/, const events::PointerEvent& /*event*/, const HitTestEntry& /*entry*/) {}
    [[nodiscard]] bool acceptsChild(Protocol /*protocol*/, std::size_t /*childCount*/) const { return false; }
};

using EnableRenderBox = EnableRenderObject<BoxConstraints>;
using EnableRenderSliver = EnableRenderObject<SliverConstraints>;

/**
 * @brief 满足接口的节点类型
 */
template <typename T>
concept RenderKind = requires { typename T::constraints_type; } && traits::Constraints<typename T::constraints_type> &&
                     std::copy_constructible<T>;

} // namespace render::interface
