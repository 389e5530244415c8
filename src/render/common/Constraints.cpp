#include "Constraints.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace render
{
namespace
{
// -0.0 与 0.0 相等，哈希也必须一致
std::size_t HashFloat(float value)
{
    return std::hash<float>{}(value == 0.0F ? 0.0F : value);
}

void HashCombine(std::size_t& seed, std::size_t value)
{
    seed ^= value + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
}

std::string FormatExtent(float value)
{
    return std::isinf(value) ? std::string("Infinity") : fmt::format("{:.1f}", value);
}

const char* AxisDirectionName(AxisDirection direction)
{
    switch (direction)
    {
        case AxisDirection::UP:
            return "up";
        case AxisDirection::RIGHT:
            return "right";
        case AxisDirection::DOWN:
            return "down";
        case AxisDirection::LEFT:
            return "left";
    }
    return "?";
}
} // namespace

// ===================== BoxConstraints =====================

BoxConstraints BoxConstraints::Tight(const Vec2& size)
{
    return {size.x(), size.x(), size.y(), size.y()};
}

BoxConstraints BoxConstraints::Loose(const Vec2& size)
{
    return {0.0F, size.x(), 0.0F, size.y()};
}

BoxConstraints BoxConstraints::TightFor(std::optional<float> width, std::optional<float> height)
{
    return {width.value_or(0.0F),
            width.value_or(INFINITE_EXTENT),
            height.value_or(0.0F),
            height.value_or(INFINITE_EXTENT)};
}

BoxConstraints BoxConstraints::Expand(std::optional<float> width, std::optional<float> height)
{
    return {width.value_or(INFINITE_EXTENT),
            width.value_or(INFINITE_EXTENT),
            height.value_or(INFINITE_EXTENT),
            height.value_or(INFINITE_EXTENT)};
}

bool BoxConstraints::isNormalized() const
{
    return std::isfinite(minWidth) && std::isfinite(minHeight) && minWidth >= 0.0F && minHeight >= 0.0F &&
           minWidth <= maxWidth && minHeight <= maxHeight;
}

float BoxConstraints::constrainWidth(float width) const
{
    return std::clamp(width, minWidth, maxWidth);
}

float BoxConstraints::constrainHeight(float height) const
{
    return std::clamp(height, minHeight, maxHeight);
}

Vec2 BoxConstraints::constrain(const Vec2& size) const
{
    return {constrainWidth(size.x()), constrainHeight(size.y())};
}

BoxConstraints BoxConstraints::loosen() const
{
    return {0.0F, maxWidth, 0.0F, maxHeight};
}

BoxConstraints BoxConstraints::enforce(const BoxConstraints& other) const
{
    return {std::clamp(minWidth, other.minWidth, other.maxWidth),
            std::clamp(maxWidth, other.minWidth, other.maxWidth),
            std::clamp(minHeight, other.minHeight, other.maxHeight),
            std::clamp(maxHeight, other.minHeight, other.maxHeight)};
}

BoxConstraints BoxConstraints::tighten(std::optional<float> width, std::optional<float> height) const
{
    BoxConstraints result = *this;
    if (width)
    {
        const float clamped = std::clamp(*width, minWidth, maxWidth);
        result.minWidth = clamped;
        result.maxWidth = clamped;
    }
    if (height)
    {
        const float clamped = std::clamp(*height, minHeight, maxHeight);
        result.minHeight = clamped;
        result.maxHeight = clamped;
    }
    return result;
}

BoxConstraints BoxConstraints::deflate(const EdgeInsets& edges) const
{
    const float horizontal = edges.horizontal();
    const float vertical = edges.vertical();
    const float deflatedMinWidth = std::max(0.0F, minWidth - horizontal);
    const float deflatedMinHeight = std::max(0.0F, minHeight - vertical);
    return {deflatedMinWidth,
            std::max(deflatedMinWidth, maxWidth - horizontal),
            deflatedMinHeight,
            std::max(deflatedMinHeight, maxHeight - vertical)};
}

bool BoxConstraints::isSatisfiedBy(const Vec2& size) const
{
    return size.x() >= minWidth - PRECISION_TOLERANCE && size.x() <= maxWidth + PRECISION_TOLERANCE &&
           size.y() >= minHeight - PRECISION_TOLERANCE && size.y() <= maxHeight + PRECISION_TOLERANCE &&
           std::isfinite(size.x()) && std::isfinite(size.y());
}

std::string BoxConstraints::toString() const
{
    if (!isNormalized())
    {
        return fmt::format("BoxConstraints(NOT NORMALIZED w=[{}, {}] h=[{}, {}])",
                           FormatExtent(minWidth),
                           FormatExtent(maxWidth),
                           FormatExtent(minHeight),
                           FormatExtent(maxHeight));
    }
    if (isTight())
    {
        return fmt::format("BoxConstraints(tight {}x{})", FormatExtent(minWidth), FormatExtent(minHeight));
    }
    return fmt::format("BoxConstraints(w=[{}, {}] h=[{}, {}])",
                       FormatExtent(minWidth),
                       FormatExtent(maxWidth),
                       FormatExtent(minHeight),
                       FormatExtent(maxHeight));
}

// ===================== SliverGeometry =====================

SliverGeometry SliverGeometry::From(const Params& params)
{
    SliverGeometry geometry;
    geometry.scrollExtent = params.scrollExtent;
    geometry.paintOrigin = params.paintOrigin;
    geometry.paintExtent = params.paintExtent;
    geometry.layoutExtent = params.layoutExtent.value_or(params.paintExtent);
    geometry.maxPaintExtent = params.maxPaintExtent;
    geometry.hitTestExtent = params.hitTestExtent.value_or(params.paintExtent);
    geometry.cacheExtent = params.cacheExtent.value_or(geometry.layoutExtent);
    geometry.visible = params.visible.value_or(params.paintExtent > 0.0F);
    geometry.hasVisualOverflow = params.hasVisualOverflow;
    return geometry;
}

bool SliverGeometry::isValid() const
{
    const bool finite = std::isfinite(scrollExtent) && std::isfinite(paintExtent) && std::isfinite(layoutExtent) &&
                        std::isfinite(hitTestExtent) && std::isfinite(cacheExtent) && std::isfinite(paintOrigin);
    if (!finite) return false;
    if (scrollExtent < 0.0F || paintExtent < 0.0F || hitTestExtent < 0.0F || cacheExtent < 0.0F) return false;
    if (layoutExtent < 0.0F || layoutExtent > paintExtent + PRECISION_TOLERANCE) return false;
    return maxPaintExtent + PRECISION_TOLERANCE >= paintExtent;
}

std::string SliverGeometry::toString() const
{
    return fmt::format("SliverGeometry(scroll={}, paint={}, layout={}, maxPaint={}, hitTest={}{})",
                       FormatExtent(scrollExtent),
                       FormatExtent(paintExtent),
                       FormatExtent(layoutExtent),
                       FormatExtent(maxPaintExtent),
                       FormatExtent(hitTestExtent),
                       visible ? "" : ", hidden");
}

// ===================== SliverConstraints =====================

bool SliverConstraints::isNormalized() const
{
    return std::isfinite(scrollOffset) && scrollOffset >= 0.0F && crossAxisExtent >= 0.0F &&
           std::isfinite(crossAxisExtent) && AxisOf(axisDirection) != AxisOf(crossAxisDirection) &&
           viewportMainAxisExtent >= 0.0F && remainingPaintExtent >= 0.0F && remainingCacheExtent >= 0.0F &&
           cacheOrigin <= 0.0F && std::isfinite(precedingScrollExtent);
}

BoxConstraints SliverConstraints::asBoxConstraints(float minExtent,
                                                   float maxExtent,
                                                   std::optional<float> crossAxisExtent) const
{
    const float cross = crossAxisExtent.value_or(this->crossAxisExtent);
    if (axis() == Axis::HORIZONTAL)
    {
        return {minExtent, maxExtent, cross, cross};
    }
    return {cross, cross, minExtent, maxExtent};
}

bool SliverConstraints::isSatisfiedBy(const SliverGeometry& geometry) const
{
    return geometry.isValid() && geometry.paintExtent <= remainingPaintExtent + PRECISION_TOLERANCE;
}

std::string SliverConstraints::toString() const
{
    return fmt::format("SliverConstraints({}, scrollOffset={}, remainingPaint={}, crossAxis={}, viewport={})",
                       AxisDirectionName(axisDirection),
                       FormatExtent(scrollOffset),
                       FormatExtent(remainingPaintExtent),
                       FormatExtent(crossAxisExtent),
                       FormatExtent(viewportMainAxisExtent));
}

float CalculatePaintOffset(const SliverConstraints& constraints, float from, float to)
{
    const float start = constraints.scrollOffset;
    const float end = constraints.scrollOffset + constraints.remainingPaintExtent;
    return std::clamp(std::clamp(to, start, end) - std::clamp(from, start, end), 0.0F,
                      constraints.remainingPaintExtent);
}

float CalculateCacheOffset(const SliverConstraints& constraints, float from, float to)
{
    const float start = constraints.scrollOffset + constraints.cacheOrigin;
    const float end = constraints.scrollOffset + constraints.remainingCacheExtent;
    return std::clamp(std::clamp(to, start, end) - std::clamp(from, start, end), 0.0F,
                      constraints.remainingCacheExtent);
}

} // namespace render

std::size_t std::hash<render::BoxConstraints>::operator()(const render::BoxConstraints& constraints) const noexcept
{
    std::size_t seed = 0;
    render::HashCombine(seed, render::HashFloat(constraints.minWidth));
    render::HashCombine(seed, render::HashFloat(constraints.maxWidth));
    render::HashCombine(seed, render::HashFloat(constraints.minHeight));
    render::HashCombine(seed, render::HashFloat(constraints.maxHeight));
    return seed;
}

std::size_t std::hash<render::SliverConstraints>::operator()(const render::SliverConstraints& constraints) const noexcept
{
    std::size_t seed = 0;
    render::HashCombine(seed, static_cast<std::size_t>(constraints.axisDirection));
    render::HashCombine(seed, static_cast<std::size_t>(constraints.growthDirection));
    render::HashCombine(seed, static_cast<std::size_t>(constraints.userScrollDirection));
    render::HashCombine(seed, render::HashFloat(constraints.scrollOffset));
    render::HashCombine(seed, render::HashFloat(constraints.precedingScrollExtent));
    render::HashCombine(seed, render::HashFloat(constraints.overlap));
    render::HashCombine(seed, render::HashFloat(constraints.remainingPaintExtent));
    render::HashCombine(seed, render::HashFloat(constraints.crossAxisExtent));
    render::HashCombine(seed, static_cast<std::size_t>(constraints.crossAxisDirection));
    render::HashCombine(seed, render::HashFloat(constraints.viewportMainAxisExtent));
    render::HashCombine(seed, render::HashFloat(constraints.remainingCacheExtent));
    render::HashCombine(seed, render::HashFloat(constraints.cacheOrigin));
    return seed;
}
