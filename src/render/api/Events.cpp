#include "Events.hpp"

#include "../common/Components.hpp"
#include "../core/HitTestScope.hpp"
#include "../singleton/Logger.hpp"
#include "../systems/HitTestSystem.hpp"

namespace render::events
{
namespace
{
template <traits::Constraints C>
bool Deliver(PipelineOwner& owner, const HitTestEntry& entry, const PointerEvent& event)
{
    auto* renderObject = owner.registry().try_get<components::RenderObject<C>>(entry.target);
    if (renderObject == nullptr) return false;
    EventScope scope(owner, entry.target);
    renderObject->object->handleEvent(scope, event, entry);
    return scope.isHandled();
}
} // namespace

std::expected<std::size_t, TreeError> DispatchPointerEvent(PipelineOwner& owner,
                                                           const HitTestResult& result,
                                                           const PointerEvent& event)
{
    std::size_t delivered = 0;
    {
        // 分发期间的结构修改通过 Schedule* 排队
        auto guard = owner.beginPass(Phase::HIT_TEST);
        if (!guard) return std::unexpected(guard.error());
        for (const auto& entry : result.path())
        {
            // 结果可能来自更早的帧
            if (!owner.registry().valid(entry.target))
            {
                Logger::debug("Skipping destroyed hit target {}", entt::to_integral(entry.target));
                continue;
            }
            ++delivered;
            if (Deliver<BoxConstraints>(owner, entry, event) || Deliver<SliverConstraints>(owner, entry, event))
            {
                break;
            }
        }
    }
    owner.drainDeferred();
    return delivered;
}

std::expected<std::size_t, TreeError> HitTestAndDispatch(PipelineOwner& owner, const PointerEvent& event)
{
    auto result = systems::HitTestSystem::hitTest(owner, event.position);
    if (!result) return std::unexpected(result.error());
    return DispatchPointerEvent(owner, *result, event);
}

} // namespace render::events
