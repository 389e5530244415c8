#include "PaintSystem.hpp"

#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../core/PipelineOwner.hpp"
#include "../singleton/Logger.hpp"

namespace render::systems
{
namespace
{
void CollectNodes(const entt::registry& registry, entt::entity node, PaintRequest& request)
{
    request.nodes.push_back(node);
    for (const auto child : registry.get<components::Hierarchy>(node).children)
    {
        if (registry.all_of<components::RepaintBoundaryTag>(child))
        {
            request.childLayers.push_back(child);
            continue;
        }
        CollectNodes(registry, child, request);
    }
}
} // namespace

bool PaintSystem::isPaintBoundary(const PipelineOwner& owner, entt::entity node)
{
    return node == owner.root() || owner.registry().all_of<components::RepaintBoundaryTag>(node);
}

void PaintSystem::markNeedsPaint(PipelineOwner& owner, entt::entity node)
{
    auto& registry = owner.registry();
    while (node != entt::null && registry.valid(node))
    {
        if (registry.all_of<components::PaintDirtyTag>(node)) return;
        registry.emplace<components::PaintDirtyTag>(node);
        if (isPaintBoundary(owner, node))
        {
            owner.requestPaint(node);
            return;
        }
        node = registry.get<components::Hierarchy>(node).parent;
    }
}

PaintRequest PaintSystem::collect(const PipelineOwner& owner, entt::entity boundary)
{
    const auto& registry = owner.registry();
    PaintRequest request;
    request.boundary = boundary;
    if (const auto* size = registry.try_get<components::Size>(boundary))
    {
        request.size = size->value;
    }
    if (const auto* layer = registry.try_get<components::PaintLayer>(boundary))
    {
        request.previous = layer->handle;
    }
    CollectNodes(registry, boundary, request);
    return request;
}

void PaintSystem::paintBoundary(PipelineOwner& owner, entt::entity boundary)
{
    auto& registry = owner.registry();
    const PaintRequest request = collect(owner, boundary);

    auto& layer = registry.get_or_emplace<components::PaintLayer>(boundary);
    if (owner.painter())
    {
        layer.handle = owner.painter()(request);
    }
    ++layer.generation;

    for (const auto node : request.nodes)
    {
        registry.remove<components::PaintDirtyTag>(node);
    }
    ++owner.stats().paints;
    Logger::debug("Painted boundary {} ({} nodes, {} nested layers)",
                  entt::to_integral(boundary),
                  request.nodes.size(),
                  request.childLayers.size());
}

void PaintSystem::scheduleSubtree(PipelineOwner& owner, entt::entity subtreeRoot)
{
    auto& registry = owner.registry();
    const auto children = registry.get<components::Hierarchy>(subtreeRoot).children;
    for (const auto child : children)
    {
        scheduleSubtree(owner, child);
    }
    if (registry.all_of<components::PaintDirtyTag>(subtreeRoot))
    {
        registry.remove<components::PaintDirtyTag>(subtreeRoot);
        markNeedsPaint(owner, subtreeRoot);
    }
}

} // namespace render::systems
