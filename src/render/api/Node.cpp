#include "Node.hpp"

#include "../common/Tags.hpp"
#include "../core/HitTestResult.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render::node
{

std::expected<void, TreeError> Invalidate(PipelineOwner& owner, ::entt::entity node, Invalidation invalidation)
{
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    switch (invalidation)
    {
        case Invalidation::LAYOUT:
            systems::LayoutSystem::markNeedsLayout(owner, node);
            break;
        case Invalidation::PAINT:
            systems::PaintSystem::markNeedsPaint(owner, node);
            break;
        case Invalidation::SIZED_BY_PARENT:
            systems::LayoutSystem::markNeedsLayoutForSizedByParentChange(owner, node);
            break;
    }
    return {};
}

std::expected<Vec2, TreeError> GetSize(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (!registry.all_of<components::RenderObject<BoxConstraints>>(node)) return std::unexpected(TreeError::WrongProtocol);
    const auto* size = registry.try_get<components::Size>(node);
    if (size == nullptr || registry.all_of<components::LayoutDirtyTag>(node))
    {
        return std::unexpected(TreeError::LayoutPending);
    }
    return size->value;
}

std::expected<SliverGeometry, TreeError> GetSliverGeometry(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (!registry.all_of<components::RenderObject<SliverConstraints>>(node))
    {
        return std::unexpected(TreeError::WrongProtocol);
    }
    const auto* layout = registry.try_get<components::SliverLayout>(node);
    if (layout == nullptr || registry.all_of<components::LayoutDirtyTag>(node))
    {
        return std::unexpected(TreeError::LayoutPending);
    }
    return layout->value;
}

std::expected<Vec2, TreeError> GetOffset(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    const auto parent = registry.get<components::Hierarchy>(node).parent;
    if (parent == entt::null) return Vec2(0.0F, 0.0F);

    // 偏移由父节点布局写入
    if (registry.all_of<components::LayoutDirtyTag>(parent) || registry.all_of<components::LayoutDirtyTag>(node))
    {
        return std::unexpected(TreeError::LayoutPending);
    }
    const auto* parentData = registry.try_get<components::ParentData>(node);
    return parentData != nullptr ? parentData->offset : Vec2(0.0F, 0.0F);
}

std::expected<Transform2D, TreeError> GetPaintTransform(const PipelineOwner& owner, ::entt::entity node)
{
    auto offset = GetOffset(owner, node);
    if (!offset) return std::unexpected(offset.error());
    const auto* parentData = owner.registry().try_get<components::ParentData>(node);
    if (parentData != nullptr && parentData->transform)
    {
        return *parentData->transform;
    }
    return MakeTranslation(*offset);
}

namespace
{
/**
 * @brief 节点局部坐标 -> 全局坐标的累积变换
 */
std::expected<Transform2D, TreeError> LocalToGlobal(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    if (!owner.isAttached(node)) return std::unexpected(TreeError::NodeDetached);

    Transform2D transform = Transform2D::Identity();
    for (auto current = node; current != owner.root(); current = registry.get<components::Hierarchy>(current).parent)
    {
        auto step = GetPaintTransform(owner, current);
        if (!step) return std::unexpected(step.error());
        transform = *step * transform;
    }
    return transform;
}
} // namespace

std::expected<Vec2, TreeError> ToGlobal(const PipelineOwner& owner, ::entt::entity node, const Vec2& local)
{
    auto transform = LocalToGlobal(owner, node);
    if (!transform) return std::unexpected(transform.error());
    return Vec2(*transform * local);
}

std::expected<std::optional<Vec2>, TreeError> ToLocal(const PipelineOwner& owner,
                                                      ::entt::entity node,
                                                      const Vec2& global)
{
    auto transform = LocalToGlobal(owner, node);
    if (!transform) return std::unexpected(transform.error());
    const auto inverse = HitTestResult::InvertPaintTransform(*transform);
    if (!inverse) return std::optional<Vec2>{};
    return std::optional<Vec2>{Vec2(*inverse * global)};
}

bool IsRelayoutBoundary(const PipelineOwner& owner, ::entt::entity node)
{
    return owner.registry().valid(node) && systems::LayoutSystem::isRelayoutBoundary(owner.registry(), node);
}

bool IsRepaintBoundary(const PipelineOwner& owner, ::entt::entity node)
{
    return owner.registry().valid(node) && systems::PaintSystem::isPaintBoundary(owner, node);
}

bool NeedsLayout(const PipelineOwner& owner, ::entt::entity node)
{
    return owner.registry().valid(node) && owner.registry().all_of<components::LayoutDirtyTag>(node);
}

bool NeedsPaint(const PipelineOwner& owner, ::entt::entity node)
{
    return owner.registry().valid(node) && owner.registry().all_of<components::PaintDirtyTag>(node);
}

std::expected<BoxConstraints, TreeError> GetConstraints(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return std::unexpected(TreeError::InvalidNode);
    const auto* applied = registry.try_get<components::AppliedConstraints<BoxConstraints>>(node);
    if (applied == nullptr) return std::unexpected(TreeError::LayoutPending);
    return applied->value;
}

std::string_view KindName(const PipelineOwner& owner, ::entt::entity node)
{
    const auto* info = owner.registry().valid(node) ? owner.registry().try_get<components::BaseInfo>(node) : nullptr;
    return info != nullptr ? info->kind : std::string_view{};
}

} // namespace render::node
