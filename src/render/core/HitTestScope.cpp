#include "HitTestScope.hpp"

#include <ranges>
#include "PipelineOwner.hpp"
#include "../common/Components.hpp"
#include "../common/Errors.hpp"
#include "../systems/HitTestSystem.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render
{

std::span<const entt::entity> HitTestScope::children() const
{
    const auto& hierarchy = m_owner.registry().get<components::Hierarchy>(m_self);
    return {hierarchy.children.data(), hierarchy.children.size()};
}

bool HitTestScope::hitTestChild(entt::entity child, const Vec2& position) const
{
    const auto& registry = m_owner.registry();
    const auto* hierarchy = registry.valid(child) ? registry.try_get<components::Hierarchy>(child) : nullptr;
    if (hierarchy == nullptr || hierarchy->parent != m_self) [[unlikely]]
    {
        throw ContractViolation("hit testing may only descend into direct children");
    }

    auto descend = [this, child](HitTestResult& result, const Vec2& local)
    { return systems::HitTestSystem::hitTestNode(m_owner, child, result, local); };

    const auto* parentData = registry.try_get<components::ParentData>(child);
    if (parentData == nullptr)
    {
        return descend(m_result, position);
    }
    if (parentData->transform)
    {
        return m_result.addWithPaintTransform(*parentData->transform, position, descend);
    }
    return m_result.addWithPaintOffset(parentData->offset, position, descend);
}

bool HitTestScope::hitTestChildrenInReverse(const Vec2& position) const
{
    for (const auto child : std::views::reverse(children()))
    {
        if (hitTestChild(child, position)) return true;
    }
    return false;
}

void EventScope::markNeedsLayout() const
{
    systems::LayoutSystem::markNeedsLayout(m_owner, m_self);
}

void EventScope::markNeedsPaint() const
{
    systems::PaintSystem::markNeedsPaint(m_owner, m_self);
}

} // namespace render
