#include "ContainerNodes.hpp"

#include <algorithm>
#include <vector>
#include "SingleChild.hpp"
#include "../core/LayoutScope.hpp"

namespace render::nodes
{
namespace
{
using detail::HitTestOnlyChild;

bool AcceptsSingleBox(Protocol protocol, std::size_t childCount)
{
    return detail::AcceptsSingle(Protocol::BOX, protocol, childCount);
}

/**
 * @brief 单子节点透传：子节点使用相同约束，自身尺寸跟随子节点
 */
entt::entity LayoutPassThrough(LayoutScope<BoxConstraints>& scope)
{
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        scope.setGeometry(scope.constraints().smallest());
        return child;
    }
    scope.setGeometry(scope.layoutBoxChild(child, scope.constraints(), true));
    return child;
}
} // namespace

// ===================== RenderAlignBox =====================

Vec2 RenderAlignBox::performResize(const BoxConstraints& constraints) const
{
    return {constraints.hasBoundedWidth() ? constraints.maxWidth : constraints.minWidth,
            constraints.hasBoundedHeight() ? constraints.maxHeight : constraints.minHeight};
}

void RenderAlignBox::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        if (shrinkWrap)
        {
            scope.setGeometry(constraints.smallest());
        }
        return;
    }

    const Vec2 childSize = scope.layoutBoxChild(child, constraints.loosen(), shrinkWrap);
    if (shrinkWrap)
    {
        scope.setGeometry(constraints.constrain(childSize));
    }
    scope.positionChild(child, alignment.alongOffset(scope.geometry() - childSize));
}

bool RenderAlignBox::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderAlignBox::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

// ===================== RenderStack =====================

void RenderStack::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const auto children = scope.children();
    const auto childConstraints = constraints.loosen();

    std::vector<Vec2> sizes;
    sizes.reserve(children.size());
    Vec2 extent(0.0F, 0.0F);
    for (const auto child : children)
    {
        sizes.push_back(scope.layoutBoxChild(child, childConstraints, true));
        extent = extent.cwiseMax(sizes.back());
    }

    const Vec2 size = constraints.constrain(extent);
    scope.setGeometry(size);
    for (std::size_t i = 0; i < children.size(); ++i)
    {
        scope.positionChild(children[i], alignment.alongOffset(size - sizes[i]));
    }
}

bool RenderStack::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return scope.hitTestChildrenInReverse(position);
}

bool RenderStack::acceptsChild(Protocol protocol, std::size_t /*childCount*/) const
{
    return protocol == Protocol::BOX;
}

// ===================== RenderFlex =====================

void RenderFlex::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const bool horizontal = direction == Axis::HORIZONTAL;
    const BoxConstraints childConstraints = horizontal ? BoxConstraints{0.0F, INFINITE_EXTENT, 0.0F, constraints.maxHeight}
                                                       : BoxConstraints{0.0F, constraints.maxWidth, 0.0F, INFINITE_EXTENT};

    const auto children = scope.children();
    float main = 0.0F;
    float cross = 0.0F;
    for (std::size_t i = 0; i < children.size(); ++i)
    {
        if (i > 0) main += spacing;
        const Vec2 childSize = scope.layoutBoxChild(children[i], childConstraints, true);
        scope.positionChild(children[i], horizontal ? Vec2(main, 0.0F) : Vec2(0.0F, main));
        main += horizontal ? childSize.x() : childSize.y();
        cross = std::max(cross, horizontal ? childSize.y() : childSize.x());
    }
    scope.setGeometry(constraints.constrain(horizontal ? Vec2(main, cross) : Vec2(cross, main)));
}

bool RenderFlex::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return scope.hitTestChildrenInReverse(position);
}

bool RenderFlex::acceptsChild(Protocol protocol, std::size_t /*childCount*/) const
{
    return protocol == Protocol::BOX;
}

// ===================== RenderRepaintBoundary =====================

void RenderRepaintBoundary::performLayout(LayoutScope<BoxConstraints>& scope)
{
    if (const auto child = LayoutPassThrough(scope); child != entt::null)
    {
        scope.positionChild(child, Vec2(0.0F, 0.0F));
    }
}

bool RenderRepaintBoundary::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderRepaintBoundary::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

// ===================== RenderTransformBox =====================

void RenderTransformBox::performLayout(LayoutScope<BoxConstraints>& scope)
{
    if (const auto child = LayoutPassThrough(scope); child != entt::null)
    {
        scope.transformChild(child, transform);
    }
}

bool RenderTransformBox::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderTransformBox::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

} // namespace render::nodes
