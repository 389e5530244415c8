/**
 * ************************************************************************
 *
 * @file Hierarchy.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.2
 * @brief 层级关系API封装
  - 挂载 / 插入 / 移除 / 替换子节点，移除即销毁整棵子树
  - 活动 pass 中直接修改返回 PassInProgress，Schedule* 版本改为排队执行
  - 挂载后父节点被标记为需要布局与重绘
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <entt/entt.hpp>
#include "../common/Components.hpp"
#include "../common/Errors.hpp"
#include "../core/PipelineOwner.hpp"

namespace render::hierarchy
{

inline constexpr std::size_t APPEND = static_cast<std::size_t>(-1);

std::expected<void, TreeError> AttachChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child);

/**
 * @brief 在 index 处插入子节点，index 越界时追加
 */
std::expected<void, TreeError> InsertChild(PipelineOwner& owner,
                                           ::entt::entity parent,
                                           ::entt::entity child,
                                           std::size_t index);

/**
 * @brief 移除并销毁 child 子树
 */
std::expected<void, TreeError> DropChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child);

/**
 * @brief 在原位置用 replacement 替换 child，旧子树被销毁
 */
std::expected<void, TreeError> ReplaceChild(PipelineOwner& owner,
                                            ::entt::entity parent,
                                            ::entt::entity child,
                                            ::entt::entity replacement);

/**
 * @brief 销毁未挂载到任何父节点的节点子树
 */
std::expected<void, TreeError> DestroyNode(PipelineOwner& owner, ::entt::entity node);

// pass 进行中排队，空闲时立即执行
std::expected<void, TreeError> ScheduleAttachChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child);
std::expected<void, TreeError> ScheduleInsertChild(PipelineOwner& owner,
                                                   ::entt::entity parent,
                                                   ::entt::entity child,
                                                   std::size_t index);
std::expected<void, TreeError> ScheduleDropChild(PipelineOwner& owner, ::entt::entity parent, ::entt::entity child);
std::expected<void, TreeError> ScheduleReplaceChild(PipelineOwner& owner,
                                                    ::entt::entity parent,
                                                    ::entt::entity child,
                                                    ::entt::entity replacement);
std::expected<void, TreeError> ScheduleDestroyNode(PipelineOwner& owner, ::entt::entity node);

[[nodiscard]] ::entt::entity GetParent(const PipelineOwner& owner, ::entt::entity node);
[[nodiscard]] std::span<const ::entt::entity> GetChildren(const PipelineOwner& owner, ::entt::entity node);
[[nodiscard]] uint32_t GetDepth(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 重设子树深度与挂载状态，并清除继承来的重新布局边界
 */
void RefreshSubtree(PipelineOwner& owner, ::entt::entity node, uint32_t depth, bool attached);

/**
 * @brief 先序遍历子树（含 node 自身）
 */
template <typename Func>
void TraverseSubtree(const PipelineOwner& owner, ::entt::entity node, Func&& visitor)
{
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return;
    visitor(node);
    for (const ::entt::entity child : registry.get<components::Hierarchy>(node).children)
    {
        TraverseSubtree(owner, child, visitor);
    }
}

} // namespace render::hierarchy
