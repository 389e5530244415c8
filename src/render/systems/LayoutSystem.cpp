#include "LayoutSystem.hpp"

#include "PaintSystem.hpp"
#include "../common/Components.hpp"
#include "../common/Errors.hpp"
#include "../common/Tags.hpp"
#include "../core/LayoutScope.hpp"
#include "../core/PipelineOwner.hpp"
#include "../singleton/Logger.hpp"

namespace render::systems
{

template <traits::Constraints C>
void LayoutSystem::verifyGeometry(const PipelineOwner& owner,
                                  entt::entity node,
                                  const C& constraints,
                                  const typename C::Geometry& geometry)
{
    if (!owner.config().checkGeometry) return;
    if (constraints.isSatisfiedBy(geometry)) return;

    if constexpr (traits::protocol_of_v<C> == Protocol::BOX)
    {
        Logger::error("Node {} resolved size ({}, {}) outside {}",
                      entt::to_integral(node),
                      geometry.x(),
                      geometry.y(),
                      constraints.toString());
    }
    else
    {
        Logger::error("Node {} resolved {} outside {}",
                      entt::to_integral(node),
                      geometry.toString(),
                      constraints.toString());
    }
    throw ContractViolation("resolved geometry does not satisfy the constraints");
}

template <traits::Constraints C>
typename C::Geometry LayoutSystem::layout(PipelineOwner& owner,
                                          entt::entity node,
                                          const C& constraints,
                                          bool parentUsesSize)
{
    auto& registry = owner.registry();
    if (!constraints.isNormalized()) [[unlikely]]
    {
        Logger::error("Node {} received ill-formed {}", entt::to_integral(node), constraints.toString());
        throw ContractViolation("constraints are not normalized");
    }

    auto* renderObject = registry.try_get<components::RenderObject<C>>(node);
    if (renderObject == nullptr) [[unlikely]]
    {
        Logger::error("Node {} has no {} render object", entt::to_integral(node), traits::ProtocolName(traits::protocol_of_v<C>));
        throw ContractViolation("node does not implement the requested layout protocol");
    }

    const auto& hierarchy = registry.get<components::Hierarchy>(node);
    auto& state = registry.get<components::LayoutState>(node);
    auto& stats = owner.stats();

    const bool sizedByParent = renderObject->object->sizedByParent();
    entt::entity boundary = node;
    if (parentUsesSize && !sizedByParent && !constraints.isTight() && hierarchy.parent != entt::null)
    {
        boundary = registry.get<components::LayoutState>(hierarchy.parent).relayoutBoundary;
    }

    // 干净、约束相同、边界未变：直接返回缓存几何
    const auto* applied = registry.try_get<components::AppliedConstraints<C>>(node);
    const auto* cached = registry.try_get<components::Geometry<C>>(node);
    if (!registry.all_of<components::LayoutDirtyTag>(node) && applied != nullptr && cached != nullptr &&
        applied->value == constraints && boundary == state.relayoutBoundary)
    {
        ++stats.memoizedSkips;
        return cached->value;
    }

    if (state.relayoutBoundary != entt::null && state.relayoutBoundary != boundary)
    {
        cleanChildRelayoutBoundaries(registry, node);
    }
    state.relayoutBoundary = boundary;
    state.parentUsesSize = parentUsesSize;
    state.sizedByParent = sizedByParent;
    registry.emplace_or_replace<components::AppliedConstraints<C>>(node, constraints);

    LayoutScope<C> scope(owner, node, constraints, false);
    if (sizedByParent)
    {
        const auto resized = renderObject->object->performResize(constraints);
        ++stats.resizes;
        verifyGeometry(owner, node, constraints, resized);
        scope.setGeometry(resized);
        renderObject->object->performLayout(scope);
        if (!(scope.geometry() == resized)) [[unlikely]]
        {
            Logger::error("Node {} is sized by parent but changed its geometry in performLayout", entt::to_integral(node));
            throw ContractViolation("sized-by-parent node changed its geometry during performLayout");
        }
    }
    else
    {
        renderObject->object->performLayout(scope);
        if (!scope.hasGeometry()) [[unlikely]]
        {
            Logger::error("Node {} finished performLayout without setting its geometry", entt::to_integral(node));
            throw ContractViolation("performLayout must set the node geometry");
        }
        verifyGeometry(owner, node, constraints, scope.geometry());
    }
    ++stats.layouts;

    registry.emplace_or_replace<components::Geometry<C>>(node, scope.geometry());
    registry.remove<components::LayoutDirtyTag>(node);
    PaintSystem::markNeedsPaint(owner, node);
    return scope.geometry();
}

void LayoutSystem::relayout(PipelineOwner& owner, entt::entity node)
{
    auto& registry = owner.registry();
    if (node == owner.root())
    {
        layout(owner, node, owner.rootConstraints(), false);
        return;
    }

    const auto& state = registry.get<components::LayoutState>(node);
    const bool parentUsesSize = state.parentUsesSize;
    if (protocolOf(registry, node) == Protocol::BOX)
    {
        if (const auto* applied = registry.try_get<components::AppliedConstraints<BoxConstraints>>(node))
        {
            const BoxConstraints constraints = applied->value;
            layout(owner, node, constraints, parentUsesSize);
            return;
        }
    }
    else if (const auto* applied = registry.try_get<components::AppliedConstraints<SliverConstraints>>(node))
    {
        const SliverConstraints constraints = applied->value;
        layout(owner, node, constraints, parentUsesSize);
        return;
    }

    // 从未布局过的节点只能由父节点布局
    Logger::debug("Node {} has no constraints yet, deferring to its parent", entt::to_integral(node));
    markParentNeedsLayout(owner, node);
}

void LayoutSystem::markNeedsLayout(PipelineOwner& owner, entt::entity node)
{
    auto& registry = owner.registry();
    if (!registry.valid(node)) return;
    const auto& hierarchy = registry.get<components::Hierarchy>(node);

    // 父节点可能用过试算结果，缓存失效时父节点也要重新布局
    if (auto* cache = registry.try_get<components::DryLayoutCache>(node); cache != nullptr && !cache->sizes.empty())
    {
        cache->sizes.clear();
        if (hierarchy.parent != entt::null)
        {
            markParentNeedsLayout(owner, node);
            return;
        }
    }

    if (registry.all_of<components::LayoutDirtyTag>(node)) return;

    const auto& state = registry.get<components::LayoutState>(node);
    if (state.relayoutBoundary == entt::null)
    {
        registry.emplace<components::LayoutDirtyTag>(node);
        if (hierarchy.parent != entt::null)
        {
            markNeedsLayout(owner, hierarchy.parent);
        }
        else
        {
            owner.requestLayout(node);
        }
        return;
    }

    if (state.relayoutBoundary != node)
    {
        markParentNeedsLayout(owner, node);
        return;
    }

    registry.emplace<components::LayoutDirtyTag>(node);
    owner.requestLayout(node);
}

void LayoutSystem::markParentNeedsLayout(PipelineOwner& owner, entt::entity node)
{
    auto& registry = owner.registry();
    registry.emplace_or_replace<components::LayoutDirtyTag>(node);
    const auto parent = registry.get<components::Hierarchy>(node).parent;
    if (parent != entt::null)
    {
        markNeedsLayout(owner, parent);
    }
}

void LayoutSystem::markNeedsLayoutForSizedByParentChange(PipelineOwner& owner, entt::entity node)
{
    if (!owner.registry().valid(node)) return;
    markNeedsLayout(owner, node);
    markParentNeedsLayout(owner, node);
}

Vec2 LayoutSystem::getDryLayout(PipelineOwner& owner, entt::entity node, const BoxConstraints& constraints)
{
    auto& registry = owner.registry();
    if (!constraints.isNormalized()) [[unlikely]]
    {
        Logger::error("Dry layout of node {} with ill-formed {}", entt::to_integral(node), constraints.toString());
        throw ContractViolation("constraints are not normalized");
    }
    auto* renderObject = registry.try_get<components::RenderObject<BoxConstraints>>(node);
    if (renderObject == nullptr) [[unlikely]]
    {
        throw ContractViolation("dry layout requires a box node");
    }

    if (const auto* cache = registry.try_get<components::DryLayoutCache>(node))
    {
        if (const auto it = cache->sizes.find(constraints); it != cache->sizes.end())
        {
            return it->second;
        }
    }

    Vec2 size;
    if (renderObject->object->sizedByParent())
    {
        size = renderObject->object->performResize(constraints);
    }
    else
    {
        LayoutScope<BoxConstraints> scope(owner, node, constraints, true);
        renderObject->object->performLayout(scope);
        size = scope.geometry();
    }
    verifyGeometry(owner, node, constraints, size);
    ++owner.stats().dryLayouts;

    registry.get_or_emplace<components::DryLayoutCache>(node).sizes.emplace(constraints, size);
    return size;
}

bool LayoutSystem::isRelayoutBoundary(const entt::registry& registry, entt::entity node)
{
    const auto* state = registry.try_get<components::LayoutState>(node);
    return state != nullptr && state->relayoutBoundary == node;
}

Protocol LayoutSystem::protocolOf(const entt::registry& registry, entt::entity node)
{
    if (registry.all_of<components::RenderObject<BoxConstraints>>(node)) return Protocol::BOX;
    if (registry.all_of<components::RenderObject<SliverConstraints>>(node)) return Protocol::SLIVER;
    throw ContractViolation("entity is not a render node");
}

void LayoutSystem::cleanChildRelayoutBoundaries(entt::registry& registry, entt::entity node)
{
    for (const auto child : registry.get<components::Hierarchy>(node).children)
    {
        auto& state = registry.get<components::LayoutState>(child);
        if (state.relayoutBoundary != child && state.relayoutBoundary != entt::null)
        {
            state.relayoutBoundary = entt::null;
            cleanChildRelayoutBoundaries(registry, child);
        }
    }
}

template Vec2 LayoutSystem::layout<BoxConstraints>(PipelineOwner&, entt::entity, const BoxConstraints&, bool);
template SliverGeometry LayoutSystem::layout<SliverConstraints>(PipelineOwner&,
                                                                entt::entity,
                                                                const SliverConstraints&,
                                                                bool);

} // namespace render::systems
