#include "Layout.hpp"

#include "../common/Components.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render::layout
{
namespace
{
template <traits::Constraints C>
std::expected<typename C::Geometry, TreeError> LayoutAttached(PipelineOwner& owner,
                                                              ::entt::entity node,
                                                              const C& constraints)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (!owner.isAttached(node)) return std::unexpected(TreeError::NodeDetached);
    if (!owner.registry().all_of<components::RenderObject<C>>(node)) return std::unexpected(TreeError::WrongProtocol);

    auto guard = owner.beginPass(Phase::LAYOUT);
    if (!guard) return std::unexpected(guard.error());
    return systems::LayoutSystem::layout(owner, node, constraints, false);
}
} // namespace

std::expected<void, TreeError> MarkNeedsLayout(PipelineOwner& owner, ::entt::entity node)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    systems::LayoutSystem::markNeedsLayout(owner, node);
    return {};
}

std::expected<void, TreeError> MarkNeedsLayoutForSizedByParentChange(PipelineOwner& owner, ::entt::entity node)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    systems::LayoutSystem::markNeedsLayoutForSizedByParentChange(owner, node);
    return {};
}

std::expected<void, TreeError> MarkNeedsPaint(PipelineOwner& owner, ::entt::entity node)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    systems::PaintSystem::markNeedsPaint(owner, node);
    return {};
}

std::expected<Vec2, TreeError> LayoutNode(PipelineOwner& owner, ::entt::entity node, const BoxConstraints& constraints)
{
    auto result = LayoutAttached(owner, node, constraints);
    owner.drainDeferred();
    return result;
}

std::expected<SliverGeometry, TreeError> LayoutSliver(PipelineOwner& owner,
                                                      ::entt::entity node,
                                                      const SliverConstraints& constraints)
{
    auto result = LayoutAttached(owner, node, constraints);
    owner.drainDeferred();
    return result;
}

std::expected<Vec2, TreeError> GetDryLayout(PipelineOwner& owner, ::entt::entity node, const BoxConstraints& constraints)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (!owner.registry().all_of<components::RenderObject<BoxConstraints>>(node))
    {
        return std::unexpected(TreeError::WrongProtocol);
    }
    return systems::LayoutSystem::getDryLayout(owner, node, constraints);
}

} // namespace render::layout
