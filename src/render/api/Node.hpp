/**
 * ************************************************************************
 *
 * @file Node.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 节点访问API封装
  - 按节点类型读取 / 修改节点属性，修改后自动标记失效
  - 查询布局结果（尺寸、滚动轴几何、偏移），仍为脏时返回 LayoutPending
  - 局部坐标与全局坐标互转
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <expected>
#include <optional>
#include <string_view>
#include <utility>
#include <entt/entt.hpp>
#include "../common/Components.hpp"
#include "../common/Errors.hpp"
#include "../core/PipelineOwner.hpp"
#include "../interface/IRenderObject.hpp"

namespace render::node
{

/**
 * @brief 修改属性后的失效范围
 */
enum class Invalidation : uint8_t
{
    LAYOUT,           // 影响尺寸或子节点位置
    PAINT,            // 只影响绘制
    SIZED_BY_PARENT   // 改变了 sizedByParent 的取值
};

/**
 * @brief 节点类型实例，类型不符或句柄无效时为空
 */
template <interface::RenderKind Kind>
Kind* TryGet(PipelineOwner& owner, ::entt::entity node)
{
    using C = typename Kind::constraints_type;
    auto& registry = owner.registry();
    if (!registry.valid(node)) return nullptr;
    auto* renderObject = registry.try_get<components::RenderObject<C>>(node);
    if (renderObject == nullptr || renderObject->object.type() != entt::type_id<Kind>()) return nullptr;
    return static_cast<Kind*>(renderObject->object.data());
}

template <interface::RenderKind Kind>
const Kind* TryGet(const PipelineOwner& owner, ::entt::entity node)
{
    using C = typename Kind::constraints_type;
    const auto& registry = owner.registry();
    if (!registry.valid(node)) return nullptr;
    const auto* renderObject = registry.try_get<components::RenderObject<C>>(node);
    if (renderObject == nullptr || renderObject->object.type() != entt::type_id<Kind>()) return nullptr;
    return static_cast<const Kind*>(renderObject->object.data());
}

/**
 * @brief 节点类型实例，类型不符时抛出 ContractViolation
 */
template <interface::RenderKind Kind>
Kind& Get(PipelineOwner& owner, ::entt::entity node)
{
    auto* kind = TryGet<Kind>(owner, node);
    if (kind == nullptr) [[unlikely]]
    {
        throw ContractViolation("node is not of the requested kind");
    }
    return *kind;
}

std::expected<void, TreeError> Invalidate(PipelineOwner& owner, ::entt::entity node, Invalidation invalidation);

/**
 * @brief 修改节点属性并标记失效
 *
 * 活动 pass 中返回 PassInProgress，节点类型不符返回 WrongProtocol。
 */
template <interface::RenderKind Kind, typename Func>
std::expected<void, TreeError> Update(PipelineOwner& owner,
                                      ::entt::entity node,
                                      Func&& mutator,
                                      Invalidation invalidation = Invalidation::LAYOUT)
{
    if (owner.isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (!owner.registry().valid(node)) return std::unexpected(TreeError::InvalidNode);
    auto* kind = TryGet<Kind>(owner, node);
    if (kind == nullptr) return std::unexpected(TreeError::WrongProtocol);
    std::forward<Func>(mutator)(*kind);
    return Invalidate(owner, node, invalidation);
}

// ===================== 布局结果 =====================

std::expected<Vec2, TreeError> GetSize(const PipelineOwner& owner, ::entt::entity node);
std::expected<SliverGeometry, TreeError> GetSliverGeometry(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点在父节点坐标系中的绘制偏移
 */
std::expected<Vec2, TreeError> GetOffset(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点局部坐标 -> 父节点坐标的变换
 */
std::expected<Transform2D, TreeError> GetPaintTransform(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点局部坐标 -> 根节点（全局）坐标
 */
std::expected<Vec2, TreeError> ToGlobal(const PipelineOwner& owner, ::entt::entity node, const Vec2& local);

/**
 * @brief 全局坐标 -> 节点局部坐标，路径上存在不可逆变换时返回空
 */
std::expected<std::optional<Vec2>, TreeError> ToLocal(const PipelineOwner& owner,
                                                      ::entt::entity node,
                                                      const Vec2& global);

// ===================== 状态 =====================

[[nodiscard]] bool IsRelayoutBoundary(const PipelineOwner& owner, ::entt::entity node);
[[nodiscard]] bool IsRepaintBoundary(const PipelineOwner& owner, ::entt::entity node);
[[nodiscard]] bool NeedsLayout(const PipelineOwner& owner, ::entt::entity node);
[[nodiscard]] bool NeedsPaint(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点最近一次布局的盒约束
 */
std::expected<BoxConstraints, TreeError> GetConstraints(const PipelineOwner& owner, ::entt::entity node);

/**
 * @brief 节点类型名
 */
[[nodiscard]] std::string_view KindName(const PipelineOwner& owner, ::entt::entity node);

} // namespace render::node
