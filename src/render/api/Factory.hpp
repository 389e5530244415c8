/**
 * API header for render node factory functions
 */
#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <entt/entt.hpp>
#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../core/PipelineOwner.hpp"
#include "../interface/IRenderObject.hpp"
#include "../singleton/Logger.hpp"

namespace render::factory
{

/**
 * @brief 创建未挂载的渲染节点
 *
 * 新节点处于需要布局与重绘的状态，挂载后进入管线的脏集合。
 * 是否为绘制边界在创建时读取一次，此后不变。
 */
template <interface::RenderKind Kind>
entt::entity Create(PipelineOwner& owner, Kind kind = {}, std::string_view alias = "")
{
    using C = typename Kind::constraints_type;
    auto& registry = owner.registry();
    const auto entity = registry.create();

    registry.emplace<components::BaseInfo>(entity, std::string(alias), entt::type_name<Kind>::value());
    registry.emplace<components::Hierarchy>(entity);
    auto& state = registry.emplace<components::LayoutState>(entity);
    state.sizedByParent = kind.sizedByParent();
    const bool repaintBoundary = kind.isRepaintBoundary();

    registry.emplace<components::RenderObject<C>>(
        entity, entt::poly<interface::IRenderObject<C>>{std::in_place_type<Kind>, std::move(kind)});
    registry.emplace<components::LayoutDirtyTag>(entity);
    registry.emplace<components::PaintDirtyTag>(entity);
    if (repaintBoundary)
    {
        registry.emplace<components::RepaintBoundaryTag>(entity);
        registry.emplace<components::PaintLayer>(entity);
    }

    Logger::debug("Created {} node {} ({})",
                  traits::ProtocolName(traits::protocol_of_v<C>),
                  entt::to_integral(entity),
                  entt::type_name<Kind>::value());
    return entity;
}

} // namespace render::factory
