/**
 * ************************************************************************
 *
 * @file GlobalContext.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 管线上下文组件定义
 *
 * 存放在每个 PipelineOwner 自己的注册表 ctx 中，不是进程全局状态。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <spdlog/common.h>

namespace render::globalcontext
{
/**
 * @brief 管线配置
 */
struct PipelineConfig
{
    using is_component_tag = void;
    uint32_t maxLayoutIterations = 16; // flushLayout 最多处理的脏批次数

    /**
     * @brief 日志级别
     *
     * Logger 是进程级单例，级别对所有 PipelineOwner 生效。
     * 构造时只在与默认值 (info) 不同时应用，默认配置的 owner 不会改动已有级别。
     */
    spdlog::level::level_enum logLevel = spdlog::level::info;

    bool checkGeometry = true; // 校验布局结果满足约束
};

/**
 * @brief 帧统计计数器
 */
struct FrameStats
{
    using is_component_tag = void;
    uint64_t layouts = 0;        // 执行 performLayout 的次数
    uint64_t resizes = 0;        // 执行 performResize 的次数
    uint64_t memoizedSkips = 0;  // 命中布局缓存而跳过的次数
    uint64_t dryLayouts = 0;     // 未命中缓存的试算次数
    uint64_t paints = 0;         // 绘制边界重绘次数
    uint64_t hitTests = 0;       // 命中测试次数
    uint64_t staleEntries = 0;   // 刷新时丢弃的失效脏节点
    uint64_t layoutFlushes = 0;  // 完成的 flushLayout 次数

    void reset() { *this = FrameStats{}; }
};

} // namespace render::globalcontext
