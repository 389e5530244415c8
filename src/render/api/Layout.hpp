/**
 * ************************************************************************
 *
 * @file Layout.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.2
 * @brief 布局API封装
  - 标记节点需要布局 / 重绘
  - 在管线外直接布局已挂载节点
  - 盒节点试算尺寸
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <expected>
#include <entt/entt.hpp>
#include "../common/Constraints.hpp"
#include "../common/Errors.hpp"
#include "../core/PipelineOwner.hpp"

namespace render::layout
{

/**
 * @brief 标记节点需要布局，多次调用与一次等价
 */
std::expected<void, TreeError> MarkNeedsLayout(PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点的 sizedByParent 取值改变后调用
 */
std::expected<void, TreeError> MarkNeedsLayoutForSizedByParentChange(PipelineOwner& owner, ::entt::entity node);

std::expected<void, TreeError> MarkNeedsPaint(PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 以给定约束布局一个已挂载的盒节点
 *
 * 未挂载的节点返回 NodeDetached，非法约束抛出 ContractViolation。
 */
std::expected<Vec2, TreeError> LayoutNode(PipelineOwner& owner, ::entt::entity node, const BoxConstraints& constraints);

/**
 * @brief 以给定约束布局一个已挂载的滚动轴节点
 */
std::expected<SliverGeometry, TreeError> LayoutSliver(PipelineOwner& owner,
                                                      ::entt::entity node,
                                                      const SliverConstraints& constraints);

/**
 * @brief 盒节点在给定约束下的尺寸，不改变节点的布局状态
 */
std::expected<Vec2, TreeError> GetDryLayout(PipelineOwner& owner, ::entt::entity node, const BoxConstraints& constraints);

} // namespace render::layout
