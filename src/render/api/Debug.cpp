#include "Debug.hpp"

#include <string>
#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render::debug
{
namespace
{
nlohmann::json ToJson(const Vec2& value)
{
    return nlohmann::json::array({value.x(), value.y()});
}

nlohmann::json ToJson(const SliverGeometry& geometry)
{
    return {{"scrollExtent", geometry.scrollExtent},
            {"paintOrigin", geometry.paintOrigin},
            {"paintExtent", geometry.paintExtent},
            {"layoutExtent", geometry.layoutExtent},
            {"maxPaintExtent", geometry.maxPaintExtent},
            {"hitTestExtent", geometry.hitTestExtent},
            {"cacheExtent", geometry.cacheExtent},
            {"visible", geometry.visible},
            {"hasVisualOverflow", geometry.hasVisualOverflow}};
}
} // namespace

nlohmann::json DumpNode(const PipelineOwner& owner, ::entt::entity node)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return nullptr;

    nlohmann::json json;
    json["id"] = entt::to_integral(node);
    if (const auto* info = registry.try_get<components::BaseInfo>(node))
    {
        json["kind"] = std::string(info->kind);
        if (!info->alias.empty()) json["alias"] = info->alias;
    }
    json["protocol"] = traits::ProtocolName(systems::LayoutSystem::protocolOf(registry, node));
    json["needsLayout"] = registry.all_of<components::LayoutDirtyTag>(node);
    json["needsPaint"] = registry.all_of<components::PaintDirtyTag>(node);
    json["relayoutBoundary"] = systems::LayoutSystem::isRelayoutBoundary(registry, node);
    json["repaintBoundary"] = systems::PaintSystem::isPaintBoundary(owner, node);

    if (const auto* applied = registry.try_get<components::AppliedConstraints<BoxConstraints>>(node))
    {
        json["constraints"] = applied->value.toString();
    }
    else if (const auto* sliverApplied = registry.try_get<components::AppliedConstraints<SliverConstraints>>(node))
    {
        json["constraints"] = sliverApplied->value.toString();
    }
    if (const auto* size = registry.try_get<components::Size>(node))
    {
        json["size"] = ToJson(size->value);
    }
    if (const auto* layout = registry.try_get<components::SliverLayout>(node))
    {
        json["geometry"] = ToJson(layout->value);
    }
    if (const auto* parentData = registry.try_get<components::ParentData>(node))
    {
        json["offset"] = ToJson(parentData->offset);
        json["transformed"] = parentData->transform.has_value();
    }
    if (const auto* layer = registry.try_get<components::PaintLayer>(node))
    {
        json["paintLayer"] = {{"handle", layer->handle}, {"generation", layer->generation}};
    }

    auto children = nlohmann::json::array();
    for (const auto child : registry.get<components::Hierarchy>(node).children)
    {
        children.push_back(DumpNode(owner, child));
    }
    json["children"] = std::move(children);
    return json;
}

nlohmann::json DumpRenderTree(const PipelineOwner& owner)
{
    if (owner.root() == entt::null) return nullptr;
    return DumpNode(owner, owner.root());
}

} // namespace render::debug
