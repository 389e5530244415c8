/**
 * ************************************************************************
 *
 * @file Debug.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染树调试输出
 *
 * 把整棵树导出为 JSON：类型、协议、脏标记、边界、约束、几何、偏移、子节点。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <nlohmann/json.hpp>
#include <entt/entt.hpp>
#include "../core/PipelineOwner.hpp"

namespace render::debug
{

/**
 * @brief 导出以 node 为根的子树
 */
[[nodiscard]] nlohmann::json DumpNode(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 导出管线根节点的整棵树，没有根节点时为 null
 */
[[nodiscard]] nlohmann::json DumpRenderTree(const PipelineOwner& owner);

} // namespace render::debug
