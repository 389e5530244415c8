#pragma once

#include <type_traits>
#include "../common/Events.hpp"

namespace render::traits
{

template <typename... Ts>
struct RequestList
{
};

template <typename T, typename List>
inline constexpr bool in_request_list_v = false;

template <typename T, typename... Ts>
inline constexpr bool in_request_list_v<T, RequestList<Ts...>> = (std::is_same_v<T, Ts> || ...);

// 进入 PipelineOwner 延迟队列的结构修改请求
using deferred_requests = RequestList<events::AttachChildRequest,
                                      events::DropChildRequest,
                                      events::ReplaceChildRequest,
                                      events::DestroyNodeRequest>;

template <typename T>
concept DeferredRequest = in_request_list_v<std::remove_cvref_t<T>, deferred_requests>;

} // namespace render::traits
