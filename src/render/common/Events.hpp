/**
 * ************************************************************************
 *
 * @file Events.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染树事件定义
 *
 * 两类事件：
    - 指针事件：命中测试后按路径分发给节点
    - 延迟变更请求：活动 pass 中提交，pass 结束后由 PipelineOwner 的 dispatcher 统一执行
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <entt/entt.hpp>
#include "Types.hpp"

namespace render::events
{

// ===================== 指针事件 =====================

enum class PointerPhase : uint8_t
{
    DOWN,
    MOVE,
    UP,
    HOVER,
    SCROLL,
    CANCEL
};

/**
 * @brief 指针事件，坐标为全局坐标
 */
struct PointerEvent
{
    using is_event_tag = void;
    PointerPhase phase = PointerPhase::DOWN;
    Vec2 position{0.0F, 0.0F};
    Vec2 delta{0.0F, 0.0F};       // MOVE / SCROLL 时有效
    uint32_t pointerId = 0;
    uint32_t buttons = 0;
};

// ===================== 延迟变更请求 =====================

/**
 * @brief 将 child 插入 parent 的子列表（index 越界时追加）
 */
struct AttachChildRequest
{
    using is_event_tag = void;
    entt::entity parent{entt::null};
    entt::entity child{entt::null};
    std::size_t index = static_cast<std::size_t>(-1);
};

/**
 * @brief 从 parent 移除并销毁 child 子树
 */
struct DropChildRequest
{
    using is_event_tag = void;
    entt::entity parent{entt::null};
    entt::entity child{entt::null};
};

/**
 * @brief 用 replacement 替换 parent 下的 child（旧子树被销毁）
 */
struct ReplaceChildRequest
{
    using is_event_tag = void;
    entt::entity parent{entt::null};
    entt::entity child{entt::null};
    entt::entity replacement{entt::null};
};

/**
 * @brief 销毁未挂载的节点子树
 */
struct DestroyNodeRequest
{
    using is_event_tag = void;
    entt::entity node{entt::null};
};

} // namespace render::events
