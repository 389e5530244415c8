#include "BoxNodes.hpp"

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
} // namespace

// ===================== RenderSolidBox =====================

void RenderSolidBox::performLayout(LayoutScope<BoxConstraints>& scope)
{
    scope.setGeometry(scope.constraints().constrain(preferredSize));
}

bool RenderSolidBox::hitTestSelf(const Vec2& /*position*/) const
{
    return opaque;
}

void RenderSolidBox::handleEvent(EventScope& scope, const events::PointerEvent& event, const HitTestEntry& entry)
{
    if (onPointer)
    {
        onPointer(scope, event, entry);
    }
}

// ===================== RenderConstrainedBox =====================

void RenderConstrainedBox::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto enforced = additionalConstraints.enforce(scope.constraints());
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        scope.setGeometry(enforced.constrain(Vec2(0.0F, 0.0F)));
        return;
    }
    scope.setGeometry(scope.layoutBoxChild(child, enforced, true));
    scope.positionChild(child, Vec2(0.0F, 0.0F));
}

bool RenderConstrainedBox::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderConstrainedBox::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

// ===================== RenderFractionalBox =====================

BoxConstraints RenderFractionalBox::resolve(const BoxConstraints& constraints) const
{
    BoxConstraints resolved = constraints;
    if (widthFactor && constraints.hasBoundedWidth())
    {
        resolved = resolved.tighten(constraints.maxWidth * *widthFactor, std::nullopt);
    }
    if (heightFactor && constraints.hasBoundedHeight())
    {
        resolved = resolved.tighten(std::nullopt, constraints.maxHeight * *heightFactor);
    }
    return resolved;
}

void RenderFractionalBox::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const auto resolved = resolve(constraints);
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        scope.setGeometry(constraints.constrain(resolved.smallest()));
        return;
    }
    scope.setGeometry(constraints.constrain(scope.layoutBoxChild(child, resolved, true)));
    scope.positionChild(child, Vec2(0.0F, 0.0F));
}

bool RenderFractionalBox::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderFractionalBox::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

// ===================== RenderPadding =====================

void RenderPadding::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const Vec2 insets(padding.horizontal(), padding.vertical());
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        scope.setGeometry(constraints.constrain(insets));
        return;
    }
    const Vec2 childSize = scope.layoutBoxChild(child, constraints.deflate(padding), true);
    scope.positionChild(child, padding.topLeft());
    scope.setGeometry(constraints.constrain(childSize + insets));
}

bool RenderPadding::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return HitTestOnlyChild(scope, position);
}

bool RenderPadding::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return AcceptsSingleBox(protocol, childCount);
}

} // namespace render::nodes
