#include "SliverNodes.hpp"

#include <algorithm>
#include "SingleChild.hpp"
#include "../common/Errors.hpp"
#include "../core/LayoutScope.hpp"
#include "../singleton/Logger.hpp"

namespace render::nodes
{

// ===================== RenderViewport =====================

Vec2 RenderViewport::performResize(const BoxConstraints& constraints) const
{
    if (!constraints.hasBoundedWidth() || !constraints.hasBoundedHeight()) [[unlikely]]
    {
        Logger::error("Viewport received unbounded {}", constraints.toString());
        throw ContractViolation("viewport requires bounded constraints");
    }
    return constraints.biggest();
}

void RenderViewport::performLayout(LayoutScope<BoxConstraints>& scope)
{
    const Vec2 size = scope.geometry();
    const Axis axis = AxisOf(axisDirection);
    const float mainAxisExtent = axis == Axis::VERTICAL ? size.y() : size.x();
    const float crossAxisExtent = axis == Axis::VERTICAL ? size.x() : size.y();

    const float centerOffset = -scrollOffset;
    const float fullCacheExtent = mainAxisExtent + 2.0F * cacheExtent;
    const float centerCacheOffset = centerOffset + cacheExtent;

    float remainingCacheExtent = std::clamp(fullCacheExtent - centerCacheOffset, 0.0F, fullCacheExtent);
    float cacheOrigin = std::clamp(centerOffset, -cacheExtent, 0.0F);
    float layoutOffset = std::clamp(centerOffset, 0.0F, mainAxisExtent);
    float childScrollOffset = std::max(0.0F, -centerOffset);
    float maxPaintOffset = layoutOffset;
    float precedingScrollExtent = 0.0F;

    SliverConstraints constraints;
    constraints.axisDirection = axisDirection;
    constraints.growthDirection = GrowthDirection::FORWARD;
    constraints.crossAxisExtent = crossAxisExtent;
    constraints.crossAxisDirection = axis == Axis::VERTICAL ? AxisDirection::RIGHT : AxisDirection::DOWN;
    constraints.viewportMainAxisExtent = mainAxisExtent;

    for (const auto child : scope.children())
    {
        const float sliverScrollOffset = std::max(0.0F, childScrollOffset);
        const float correctedCacheOrigin = std::max(cacheOrigin, -sliverScrollOffset);
        const float cacheExtentCorrection = cacheOrigin - correctedCacheOrigin;

        constraints.scrollOffset = sliverScrollOffset;
        constraints.precedingScrollExtent = precedingScrollExtent;
        constraints.overlap = std::max(0.0F, maxPaintOffset - layoutOffset);
        constraints.remainingPaintExtent = std::max(0.0F, mainAxisExtent - layoutOffset);
        constraints.remainingCacheExtent = std::max(0.0F, remainingCacheExtent + cacheExtentCorrection);
        constraints.cacheOrigin = correctedCacheOrigin;

        const SliverGeometry geometry = scope.layoutSliverChild(child, constraints, true);

        const float effectiveLayoutOffset = layoutOffset + geometry.paintOrigin;
        switch (constraints.paintDirection())
        {
            case AxisDirection::DOWN:
                scope.positionChild(child, Vec2(0.0F, effectiveLayoutOffset));
                break;
            case AxisDirection::UP:
                scope.positionChild(child, Vec2(0.0F, size.y() - effectiveLayoutOffset - geometry.paintExtent));
                break;
            case AxisDirection::RIGHT:
                scope.positionChild(child, Vec2(effectiveLayoutOffset, 0.0F));
                break;
            case AxisDirection::LEFT:
                scope.positionChild(child, Vec2(size.x() - effectiveLayoutOffset - geometry.paintExtent, 0.0F));
                break;
        }

        maxPaintOffset = std::max(effectiveLayoutOffset + geometry.paintExtent, maxPaintOffset);
        childScrollOffset -= geometry.scrollExtent;
        precedingScrollExtent += geometry.scrollExtent;
        layoutOffset += geometry.layoutExtent;
        if (geometry.cacheExtent != 0.0F)
        {
            remainingCacheExtent -= geometry.cacheExtent - cacheExtentCorrection;
            cacheOrigin = std::min(correctedCacheOrigin + geometry.cacheExtent, 0.0F);
        }
    }

    maxScrollExtent = precedingScrollExtent;
}

bool RenderViewport::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return scope.hitTestChildrenInReverse(position);
}

bool RenderViewport::acceptsChild(Protocol protocol, std::size_t /*childCount*/) const
{
    return protocol == Protocol::SLIVER;
}

// ===================== RenderSliverToBoxAdapter =====================

void RenderSliverToBoxAdapter::performLayout(LayoutScope<SliverConstraints>& scope)
{
    const auto& constraints = scope.constraints();
    const auto child = scope.firstChild();
    if (child == entt::null)
    {
        scope.setGeometry(SliverGeometry{});
        return;
    }

    const Vec2 childSize = scope.layoutBoxChild(child, constraints.asBoxConstraints(), true);
    const float childExtent = constraints.axis() == Axis::VERTICAL ? childSize.y() : childSize.x();
    const float paintExtent = CalculatePaintOffset(constraints, 0.0F, childExtent);

    SliverGeometry::Params params;
    params.scrollExtent = childExtent;
    params.paintExtent = paintExtent;
    params.maxPaintExtent = childExtent;
    params.hitTestExtent = paintExtent;
    params.cacheExtent = CalculateCacheOffset(constraints, 0.0F, childExtent);
    params.hasVisualOverflow = childExtent > constraints.remainingPaintExtent || constraints.scrollOffset > 0.0F;
    const auto geometry = SliverGeometry::From(params);
    scope.setGeometry(geometry);

    // 子节点相对滚动轴节点的绘制偏移
    switch (constraints.paintDirection())
    {
        case AxisDirection::DOWN:
            scope.positionChild(child, Vec2(0.0F, -constraints.scrollOffset));
            break;
        case AxisDirection::RIGHT:
            scope.positionChild(child, Vec2(-constraints.scrollOffset, 0.0F));
            break;
        case AxisDirection::UP:
            scope.positionChild(
                child, Vec2(0.0F, -(geometry.scrollExtent - (geometry.paintExtent + constraints.scrollOffset))));
            break;
        case AxisDirection::LEFT:
            scope.positionChild(
                child, Vec2(-(geometry.scrollExtent - (geometry.paintExtent + constraints.scrollOffset)), 0.0F));
            break;
    }
}

bool RenderSliverToBoxAdapter::hitTestChildren(HitTestScope& scope, const Vec2& position) const
{
    return detail::HitTestOnlyChild(scope, position);
}

bool RenderSliverToBoxAdapter::acceptsChild(Protocol protocol, std::size_t childCount) const
{
    return detail::AcceptsSingle(Protocol::BOX, protocol, childCount);
}

} // namespace render::nodes
