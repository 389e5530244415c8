#include "LayoutScope.hpp"

#include "PipelineOwner.hpp"
#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../singleton/Logger.hpp"
#include "../systems/LayoutSystem.hpp"

namespace render
{

template <traits::Constraints C>
LayoutScope<C>::LayoutScope(PipelineOwner& owner, entt::entity self, const C& constraints, bool dryRun)
    : m_owner(owner), m_self(self), m_constraints(constraints), m_dryRun(dryRun)
{
}

template <traits::Constraints C>
std::span<const entt::entity> LayoutScope<C>::children() const
{
    const auto& hierarchy = m_owner.registry().get<components::Hierarchy>(m_self);
    return {hierarchy.children.data(), hierarchy.children.size()};
}

template <traits::Constraints C>
entt::entity LayoutScope<C>::firstChild() const
{
    const auto& hierarchy = m_owner.registry().get<components::Hierarchy>(m_self);
    return hierarchy.children.empty() ? entt::entity{entt::null} : hierarchy.children.front();
}

template <traits::Constraints C>
void LayoutScope<C>::requireChild(entt::entity child, Protocol protocol) const
{
    const auto& registry = m_owner.registry();
    const auto* hierarchy = registry.valid(child) ? registry.try_get<components::Hierarchy>(child) : nullptr;
    if (hierarchy == nullptr || hierarchy->parent != m_self) [[unlikely]]
    {
        Logger::error("Layout of node {} touched node {}, which is not its child",
                      entt::to_integral(m_self),
                      entt::to_integral(child));
        throw ContractViolation("layout may only be called on a direct child");
    }
    const bool isBox = registry.all_of<components::RenderObject<BoxConstraints>>(child);
    if ((protocol == Protocol::BOX) != isBox) [[unlikely]]
    {
        Logger::error("Node {} laid out child {} with {} constraints, but the child uses the other protocol",
                      entt::to_integral(m_self),
                      entt::to_integral(child),
                      traits::ProtocolName(protocol));
        throw ContractViolation("child laid out with the wrong constraint type");
    }
}

template <traits::Constraints C>
Vec2 LayoutScope<C>::layoutBoxChild(entt::entity child, const BoxConstraints& constraints, bool parentUsesSize)
{
    requireChild(child, Protocol::BOX);
    if (m_dryRun)
    {
        return systems::LayoutSystem::getDryLayout(m_owner, child, constraints);
    }
    return systems::LayoutSystem::layout(m_owner, child, constraints, parentUsesSize);
}

template <traits::Constraints C>
SliverGeometry LayoutScope<C>::layoutSliverChild(entt::entity child,
                                                 const SliverConstraints& constraints,
                                                 bool parentUsesSize)
{
    requireChild(child, Protocol::SLIVER);
    if (m_dryRun) [[unlikely]]
    {
        Logger::error("Dry layout of node {} reached sliver child {}",
                      entt::to_integral(m_self),
                      entt::to_integral(child));
        throw ContractViolation("slivers do not support dry layout");
    }
    return systems::LayoutSystem::layout(m_owner, child, constraints, parentUsesSize);
}

template <traits::Constraints C>
void LayoutScope<C>::positionChild(entt::entity child, const Vec2& offset)
{
    if (m_dryRun) return;
    auto& registry = m_owner.registry();
    const auto* hierarchy = registry.valid(child) ? registry.try_get<components::Hierarchy>(child) : nullptr;
    if (hierarchy == nullptr || hierarchy->parent != m_self) [[unlikely]]
    {
        throw ContractViolation("only direct children can be positioned");
    }
    auto& parentData = registry.get_or_emplace<components::ParentData>(child);
    parentData.offset = offset;
    parentData.transform.reset();
}

template <traits::Constraints C>
void LayoutScope<C>::transformChild(entt::entity child, const Transform2D& transform)
{
    if (m_dryRun) return;
    auto& registry = m_owner.registry();
    const auto* hierarchy = registry.valid(child) ? registry.try_get<components::Hierarchy>(child) : nullptr;
    if (hierarchy == nullptr || hierarchy->parent != m_self) [[unlikely]]
    {
        throw ContractViolation("only direct children can be transformed");
    }
    auto& parentData = registry.get_or_emplace<components::ParentData>(child);
    parentData.offset = transform.translation();
    parentData.transform = transform;
}

template <traits::Constraints C>
const typename LayoutScope<C>::Geometry& LayoutScope<C>::geometry() const
{
    if (!m_geometry) [[unlikely]]
    {
        throw ContractViolation("geometry read before it was set");
    }
    return *m_geometry;
}

template class LayoutScope<BoxConstraints>;
template class LayoutScope<SliverConstraints>;

} // namespace render
