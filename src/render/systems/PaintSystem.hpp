/**
 * ************************************************************************
 *
 * @file PaintSystem.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 绘制失效与重绘调度
 *
 * 绘制脏标记向上传播到最近的绘制边界（RepaintBoundaryTag 或根节点），
 * 只有绘制边界会登记到 PipelineOwner。重绘时为每个边界生成 PaintRequest，
 * 交给外部 Painter，嵌套边界只按引用合成。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once
#include <entt/entt.hpp>
#include "../common/RenderTypes.hpp"

namespace render
{
class PipelineOwner;
}

namespace render::systems
{

class PaintSystem
{
public:
    static void markNeedsPaint(PipelineOwner& owner, entt::entity node);

    /**
     * @brief 节点是否拥有独立绘制层
     */
    [[nodiscard]] static bool isPaintBoundary(const PipelineOwner& owner, entt::entity node);

    /**
     * @brief 收集绘制边界的绘制内容（先序，不进入嵌套边界）
     */
    [[nodiscard]] static PaintRequest collect(const PipelineOwner& owner, entt::entity boundary);

    /**
     * @brief 重绘一个绘制边界并清除其内容的绘制脏标记
     */
    static void paintBoundary(PipelineOwner& owner, entt::entity boundary);

    /**
     * @brief 子树挂载后重新登记其中的绘制脏节点
     */
    static void scheduleSubtree(PipelineOwner& owner, entt::entity subtreeRoot);
};

} // namespace render::systems
