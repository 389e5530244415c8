/**
 * ************************************************************************
 *
 * @file Tags.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @brief 渲染树 ECS 标记组件定义 (纯空结构体 Tag)
 *
    -RootTag: 管线根节点
    -AttachedTag: 节点可从管线根到达
    -LayoutDirtyTag: 需要重新布局
    -PaintDirtyTag: 需要重新绘制
    -RepaintBoundaryTag: 拥有独立绘制层（创建时由节点类型决定）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once
#include <entt/entt.hpp>

namespace render::components
{

struct RootTag
{
    using is_tags_tag = void;
};

struct AttachedTag
{
    using is_tags_tag = void;
};

/**
 * @brief 布局脏标记，布局成功后清除
 */
struct LayoutDirtyTag
{
    using is_tags_tag = void;
};

/**
 * @brief 绘制脏标记，所属绘制边界重绘后清除
 */
struct PaintDirtyTag
{
    using is_tags_tag = void;
};

struct RepaintBoundaryTag
{
    using is_tags_tag = void;
};

} // namespace render::components
