/**
 * ************************************************************************
 *
 * @file Components.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染树 ECS 组件定义
 *
 * 节点是 PipelineOwner 注册表中的实体：
    - Hierarchy: 父子关系与深度，子列表是唯一的所有权边
    - LayoutState: 重新布局边界等布局簿记
    - RenderObject<C>: 节点类型行为，C 决定布局协议
    - AppliedConstraints<C> / Geometry<C>: 最近一次布局的输入与结果
    - ParentData: 父节点布局时写入的绘制偏移 / 变换
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>
#include "Types.hpp"
#include "RenderTypes.hpp"
#include "../interface/IRenderObject.hpp"

namespace render::components
{

/**
 * @brief 节点基础信息
 */
struct BaseInfo
{
    using is_component_tag = void;
    std::string alias;       // 调试用别名
    std::string_view kind;   // 节点类型名
};

/**
 * @brief 层级关系组件
 */
struct Hierarchy
{
    using is_component_tag = void;
    entt::entity parent = entt::null;
    std::vector<entt::entity> children; // 绘制顺序
    uint32_t depth = 0;                 // 根为 0
};

/**
 * @brief 布局簿记
 */
struct LayoutState
{
    using is_component_tag = void;
    entt::entity relayoutBoundary = entt::null; // 未布局过时为空
    bool parentUsesSize = false;                // 最近一次布局时父节点的声明
    bool sizedByParent = false;                 // 最近一次布局时的缓存值
};

/**
 * @brief 节点类型行为
 */
template <traits::Constraints C>
struct RenderObject
{
    using is_component_tag = void;
    entt::poly<interface::IRenderObject<C>> object;
};

/**
 * @brief 最近一次布局使用的约束
 */
template <traits::Constraints C>
struct AppliedConstraints
{
    using is_component_tag = void;
    C value;
};

/**
 * @brief 最近一次布局得到的几何
 */
template <traits::Constraints C>
struct Geometry
{
    using is_component_tag = void;
    typename C::Geometry value;
};

using Size = Geometry<BoxConstraints>;
using SliverLayout = Geometry<SliverConstraints>;

/**
 * @brief 父节点写入的定位信息（父节点坐标系）
 */
struct ParentData
{
    using is_component_tag = void;
    Vec2 offset{0.0F, 0.0F};
    std::optional<Transform2D> transform; // 存在时取代 offset
};

/**
 * @brief 盒节点的试算尺寸缓存
 */
struct DryLayoutCache
{
    using is_component_tag = void;
    std::unordered_map<BoxConstraints, Vec2> sizes;
};

/**
 * @brief 绘制边界的绘制产物句柄
 */
struct PaintLayer
{
    using is_component_tag = void;
    PaintHandle handle = INVALID_PAINT_HANDLE;
    uint32_t generation = 0; // 每次重绘递增
};

} // namespace render::components
