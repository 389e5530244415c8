#include "Hierarchy.hpp"

#include <algorithm>
#include "../common/Tags.hpp"
#include "../singleton/Logger.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render::hierarchy
{
namespace
{
bool AcceptsChild(const entt::registry& registry, entt::entity parent, Protocol protocol, std::size_t childCount)
{
    if (const auto* box = registry.try_get<components::RenderObject<BoxConstraints>>(parent))
    {
        return box->object->acceptsChild(protocol, childCount);
    }
    if (const auto* sliver = registry.try_get<components::RenderObject<SliverConstraints>>(parent))
    {
        return sliver->object->acceptsChild(protocol, childCount);
    }
    return false;
}

bool IsAncestorOrSelf(const entt::registry& registry, entt::entity candidate, entt::entity node)
{
    for (auto current = node; current != entt::null; current = registry.get<components::Hierarchy>(current).parent)
    {
        if (current == candidate) return true;
    }
    return false;
}

void DestroySubtree(PipelineOwner& owner, entt::entity node)
{
    auto& registry = owner.registry();
    const auto children = registry.get<components::Hierarchy>(node).children;
    for (const auto child : children)
    {
        DestroySubtree(owner, child);
    }
    owner.forget(node);
    registry.destroy(node);
}

/**
 * @brief 挂载前的公共检查：句柄有效、子节点无父、不成环、父节点接受
 */
std::expected<void, TreeError> CheckAttachable(PipelineOwner& owner,
                                               entt::entity parent,
                                               entt::entity child,
                                               std::size_t childCount)
{
    const auto& registry = owner.registry();
    if (registry.get<components::Hierarchy>(child).parent != entt::null || child == owner.root())
    {
        return std::unexpected(TreeError::AlreadyAttached);
    }
    if (IsAncestorOrSelf(registry, child, parent))
    {
        return std::unexpected(TreeError::WouldCreateCycle);
    }
    const auto protocol = systems::LayoutSystem::protocolOf(registry, child);
    if (!AcceptsChild(registry, parent, protocol, childCount))
    {
        Logger::warn("Node {} rejected {} child {}",
                     entt::to_integral(parent),
                     traits::ProtocolName(protocol),
                     entt::to_integral(child));
        return std::unexpected(TreeError::ChildRejected);
    }
    return {};
}

void Adopt(PipelineOwner& owner, entt::entity parent, entt::entity child)
{
    auto& registry = owner.registry();
    registry.get<components::Hierarchy>(child).parent = parent;
    const auto depth = registry.get<components::Hierarchy>(parent).depth + 1;
    const bool attached = owner.isAttached(parent);
    RefreshSubtree(owner, child, depth, attached);
    if (attached)
    {
        systems::PaintSystem::scheduleSubtree(owner, child);
    }
}

void MarkParentDirty(PipelineOwner& owner, entt::entity parent)
{
    systems::LayoutSystem::markNeedsLayout(owner, parent);
    systems::PaintSystem::markNeedsPaint(owner, parent);
}

std::expected<void, TreeError> CheckMutable(const PipelineOwner& owner)
{
    if (owner.isPassActive()) [[unlikely]]
    {
        Logger::warn("Tree mutation rejected: a pass is in progress");
        return std::unexpected(TreeError::PassInProgress);
    }
    return {};
}
} // namespace

std::expected<void, TreeError> AttachChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child)
{
    return InsertChild(owner, parent, child, APPEND);
}

std::expected<void, TreeError> InsertChild(PipelineOwner& owner,
                                           ::entt::entity parent,
                                           ::entt::entity child,
                                           std::size_t index)
{
    if (auto check = CheckMutable(owner); !check) return check;
    auto& registry = owner.registry();
    if (!registry.valid(parent) || !registry.valid(child)) return std::unexpected(TreeError::InvalidNode);

    auto& children = registry.get<components::Hierarchy>(parent).children;
    if (auto check = CheckAttachable(owner, parent, child, children.size()); !check) return check;

    const auto position = std::min(index, children.size());
    children.insert(children.begin() + static_cast<std::ptrdiff_t>(position), child);
    Adopt(owner, parent, child);
    MarkParentDirty(owner, parent);
    return {};
}

std::expected<void, TreeError> DropChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child)
{
    if (auto check = CheckMutable(owner); !check) return check;
    auto& registry = owner.registry();
    if (!registry.valid(parent) || !registry.valid(child)) return std::unexpected(TreeError::InvalidNode);
    if (registry.get<components::Hierarchy>(child).parent != parent) return std::unexpected(TreeError::NotAChild);

    std::erase(registry.get<components::Hierarchy>(parent).children, child);
    DestroySubtree(owner, child);
    MarkParentDirty(owner, parent);
    return {};
}

std::expected<void, TreeError> ReplaceChild(PipelineOwner& owner,
                                            ::entt::entity parent,
                                            ::entt::entity child,
                                            ::entt::entity replacement)
{
    if (auto check = CheckMutable(owner); !check) return check;
    auto& registry = owner.registry();
    if (!registry.valid(parent) || !registry.valid(child) || !registry.valid(replacement))
    {
        return std::unexpected(TreeError::InvalidNode);
    }
    if (registry.get<components::Hierarchy>(child).parent != parent) return std::unexpected(TreeError::NotAChild);

    auto& children = registry.get<components::Hierarchy>(parent).children;
    if (auto check = CheckAttachable(owner, parent, replacement, children.size() - 1); !check) return check;

    const auto it = std::ranges::find(children, child);
    *it = replacement;
    DestroySubtree(owner, child);
    Adopt(owner, parent, replacement);
    MarkParentDirty(owner, parent);
    return {};
}

std::expected<void, TreeError> DestroyNode(PipelineOwner& owner, ::entt::entity node)
{
    if (auto check = CheckMutable(owner); !check) return check;
    auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (registry.get<components::Hierarchy>(node).parent != entt::null || node == owner.root())
    {
        return std::unexpected(TreeError::AlreadyAttached);
    }
    DestroySubtree(owner, node);
    return {};
}

std::expected<void, TreeError> ScheduleAttachChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child)
{
    return ScheduleInsertChild(owner, parent, child, APPEND);
}

std::expected<void, TreeError> ScheduleInsertChild(PipelineOwner& owner,
                                                   ::entt::entity parent,
                                                   ::entt::entity child,
                                                   std::size_t index)
{
    if (!owner.isPassActive()) return InsertChild(owner, parent, child, index);
    owner.enqueue(events::AttachChildRequest{parent, child, index});
    return {};
}

std::expected<void, TreeError> ScheduleDropChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child)
{
    if (!owner.isPassActive()) return DropChild(owner, parent, child);
    owner.enqueue(events::DropChildRequest{parent, child});
    return {};
}

std::expected<void, TreeError> ScheduleReplaceChild(PipelineOwner& owner,
                                                    ::entt::entity parent,
                                                    ::entt::entity child,
                                                    ::entt::entity replacement)
{
    if (!owner.isPassActive()) return ReplaceChild(owner, parent, child, replacement);
    owner.enqueue(events::ReplaceChildRequest{parent, child, replacement});
    return {};
}

std::expected<void, TreeError> ScheduleDestroyNode(PipelineOwner& owner, ::entt::entity node)
{
    if (!owner.isPassActive()) return DestroyNode(owner, node);
    owner.enqueue(events::DestroyNodeRequest{node});
    return {};
}

::entt::entity GetParent(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return entt::null;
    return registry.get<components::Hierarchy>(node).parent;
}

std::span<const ::entt::entity> GetChildren(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return {};
    const auto& children = registry.get<components::Hierarchy>(node).children;
    return {children.data(), children.size()};
}

uint32_t GetDepth(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return 0;
    return registry.get<components::Hierarchy>(node).depth;
}

void RefreshSubtree(PipelineOwner& owner, ::entt::entity node, uint32_t depth, bool attached)
{
    auto& registry = owner.registry();
    auto& hierarchy = registry.get<components::Hierarchy>(node);
    hierarchy.depth = depth;
    registry.get<components::LayoutState>(node).relayoutBoundary = entt::null;
    if (attached)
    {
        registry.emplace_or_replace<components::AttachedTag>(node);
    }
    else
    {
        registry.remove<components::AttachedTag>(node);
        owner.forget(node);
    }
    for (const auto child : hierarchy.children)
    {
        RefreshSubtree(owner, child, depth + 1, attached);
    }
}

} // namespace render::hierarchy
