#include "HitTestSystem.hpp"

#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../core/HitTestScope.hpp"
#include "../core/PipelineOwner.hpp"
#include "../singleton/Logger.hpp"

namespace render::systems
{
namespace
{
template <traits::Constraints C>
bool HitTestWith(PipelineOwner& owner,
                 const components::RenderObject<C>& renderObject,
                 entt::entity node,
                 HitTestResult& result,
                 const Vec2& position)
{
    HitTestScope scope(owner, node, result);
    if (renderObject.object->hitTestChildren(scope, position) || renderObject.object->hitTestSelf(position))
    {
        result.add(node, position);
        return true;
    }
    return false;
}
} // namespace

std::expected<HitTestResult, TreeError> HitTestSystem::hitTest(PipelineOwner& owner, const Vec2& globalPosition)
{
    if (owner.isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (owner.root() == entt::null) return std::unexpected(TreeError::NoRoot);
    if (owner.hasPendingLayout()) return std::unexpected(TreeError::LayoutPending);

    HitTestResult result;
    {
        auto guard = owner.beginPass(Phase::HIT_TEST);
        if (!guard) return std::unexpected(guard.error());
        hitTestNode(owner, owner.root(), result, globalPosition);
    }
    ++owner.stats().hitTests;
    owner.drainDeferred();
    return result;
}

bool HitTestSystem::hitTestNode(PipelineOwner& owner, entt::entity node, HitTestResult& result, const Vec2& position)
{
    const auto& registry = owner.registry();
    if (!isWithinBounds(registry, node, position)) return false;

    if (const auto* box = registry.try_get<components::RenderObject<BoxConstraints>>(node))
    {
        return HitTestWith(owner, *box, node, result, position);
    }
    if (const auto* sliver = registry.try_get<components::RenderObject<SliverConstraints>>(node))
    {
        return HitTestWith(owner, *sliver, node, result, position);
    }
    return false;
}

bool HitTestSystem::isWithinBounds(const entt::registry& registry, entt::entity node, const Vec2& position)
{
    if (const auto* size = registry.try_get<components::Size>(node))
    {
        return ContainsPoint(size->value, position);
    }

    const auto* layout = registry.try_get<components::SliverLayout>(node);
    const auto* applied = registry.try_get<components::AppliedConstraints<SliverConstraints>>(node);
    if (layout == nullptr || applied == nullptr) return false;

    const auto& geometry = layout->value;
    const auto& constraints = applied->value;
    const bool vertical = constraints.axis() == Axis::VERTICAL;
    const float main = vertical ? position.y() : position.x();
    const float cross = vertical ? position.x() : position.y();
    if (cross < 0.0F || cross >= constraints.crossAxisExtent) return false;

    // 反向轴上命中范围从绘制区域的远端开始
    const float start = IsReversed(constraints.paintDirection()) ? geometry.paintExtent - geometry.hitTestExtent : 0.0F;
    return main >= start && main < start + geometry.hitTestExtent;
}

} // namespace render::systems
