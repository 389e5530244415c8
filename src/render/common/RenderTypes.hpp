/**
 * ************************************************************************
 *
 * @file RenderTypes.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 绘制协作方接口类型
 *
 * 渲染树只负责决定"哪些节点需要重绘、按什么顺序"，
 * 实际绘制由外部 Painter 完成并返回不透明句柄。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include <entt/entt.hpp>
#include "Types.hpp"

namespace render
{

/**
 * @brief 绘制层句柄，由绘制后端分配
 */
using PaintHandle = std::uint64_t;

inline constexpr PaintHandle INVALID_PAINT_HANDLE = 0;

/**
 * @brief 一次绘制边界重绘的输入
 */
struct PaintRequest
{
    entt::entity boundary = entt::null;
    Vec2 size{0.0F, 0.0F};
    std::vector<entt::entity> nodes;       // 先序（绘制顺序），不进入嵌套边界
    std::vector<entt::entity> childLayers; // 直接嵌套的绘制边界，按引用合成
    PaintHandle previous = INVALID_PAINT_HANDLE;
};

/**
 * @brief 绘制回调，返回新的绘制层句柄
 */
using Painter = std::function<PaintHandle(const PaintRequest&)>;

} // namespace render
