/**
 * ************************************************************************
 *
 * @file Events.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 指针事件分发API
  - 按命中路径（最内层优先）把事件交给各节点的 handleEvent
  - 节点调用 EventScope::setHandled 后停止向外层传递
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <cstddef>
#include <expected>
#include "../common/Errors.hpp"
#include "../common/Events.hpp"
#include "../core/HitTestResult.hpp"
#include "../core/PipelineOwner.hpp"

namespace render::events
{

/**
 * @brief 分发指针事件
 * @return 收到事件的节点数
 */
std::expected<std::size_t, TreeError> DispatchPointerEvent(PipelineOwner& owner,
                                                           const HitTestResult& result,
                                                           const PointerEvent& event);

/**
 * @brief 命中测试后立即分发
 */
std::expected<std::size_t, TreeError> HitTestAndDispatch(PipelineOwner& owner, const PointerEvent& event);

} // namespace render::events
