/**
 * ************************************************************************
 *
 * @file Constraints.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.2
 * @brief 布局约束模型
 *
 * 父节点传递给子节点的尺寸约束：
    - BoxConstraints: 二维盒约束，宽高各自的 [min, max] 区间
    - SliverConstraints: 滚动轴约束，主轴滚动状态 + 交叉轴范围
    - SliverGeometry: 滚动轴节点的布局结果
 *
 * 约束是不可变值类型，按结构比较、可哈希（用作布局缓存的键）。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include "Types.hpp"

namespace render
{

/**
 * @brief 布局协议：由节点使用的约束类型决定
 */
enum class Protocol : uint8_t
{
    BOX,
    SLIVER
};

/**
 * @brief 二维盒约束
 */
struct BoxConstraints
{
    using Geometry = Vec2;

    float minWidth = 0.0F;
    float maxWidth = INFINITE_EXTENT;
    float minHeight = 0.0F;
    float maxHeight = INFINITE_EXTENT;

    /**
     * @brief 只允许给定尺寸
     */
    static BoxConstraints Tight(const Vec2& size);

    /**
     * @brief 允许 [0, size] 之间的任意尺寸
     */
    static BoxConstraints Loose(const Vec2& size);

    /**
     * @brief 指定的轴收紧，未指定的轴不受限
     */
    static BoxConstraints TightFor(std::optional<float> width = std::nullopt,
                                   std::optional<float> height = std::nullopt);

    /**
     * @brief 指定的轴收紧，未指定的轴撑满（无限）
     */
    static BoxConstraints Expand(std::optional<float> width = std::nullopt,
                                 std::optional<float> height = std::nullopt);

    /**
     * @brief 约束是否合法：0 <= min <= max，min 有限
     */
    [[nodiscard]] bool isNormalized() const;

    [[nodiscard]] bool hasTightWidth() const { return minWidth >= maxWidth; }
    [[nodiscard]] bool hasTightHeight() const { return minHeight >= maxHeight; }
    [[nodiscard]] bool isTight() const { return hasTightWidth() && hasTightHeight(); }
    [[nodiscard]] bool hasBoundedWidth() const { return maxWidth < INFINITE_EXTENT; }
    [[nodiscard]] bool hasBoundedHeight() const { return maxHeight < INFINITE_EXTENT; }

    [[nodiscard]] float constrainWidth(float width = INFINITE_EXTENT) const;
    [[nodiscard]] float constrainHeight(float height = INFINITE_EXTENT) const;

    /**
     * @brief 返回满足约束且最接近 size 的尺寸
     */
    [[nodiscard]] Vec2 constrain(const Vec2& size) const;

    /**
     * @brief 满足约束的最大尺寸（无界轴保持无限）
     */
    [[nodiscard]] Vec2 biggest() const { return {constrainWidth(), constrainHeight()}; }

    /**
     * @brief 满足约束的最小尺寸
     */
    [[nodiscard]] Vec2 smallest() const { return {constrainWidth(0.0F), constrainHeight(0.0F)}; }

    /**
     * @brief 去掉最小值限制
     */
    [[nodiscard]] BoxConstraints loosen() const;

    /**
     * @brief 在保持本约束语义的前提下满足 other
     */
    [[nodiscard]] BoxConstraints enforce(const BoxConstraints& other) const;

    /**
     * @brief 在允许范围内收紧指定的轴
     */
    [[nodiscard]] BoxConstraints tighten(std::optional<float> width = std::nullopt,
                                         std::optional<float> height = std::nullopt) const;

    /**
     * @brief 扣除内边距后的约束
     */
    [[nodiscard]] BoxConstraints deflate(const EdgeInsets& edges) const;

    /**
     * @brief 尺寸是否满足约束（含浮点容差）
     */
    [[nodiscard]] bool isSatisfiedBy(const Vec2& size) const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const BoxConstraints&) const = default;
};

/**
 * @brief 滚动轴节点的布局结果
 */
struct SliverGeometry
{
    float scrollExtent = 0.0F;   // 可滚动内容长度
    float paintOrigin = 0.0F;    // 绘制起点相对布局位置的偏移
    float paintExtent = 0.0F;    // 可见绘制长度
    float layoutExtent = 0.0F;   // 下一个 sliver 的布局起点偏移
    float maxPaintExtent = 0.0F; // 无限空间时的绘制长度
    float hitTestExtent = 0.0F;  // 命中测试范围
    float cacheExtent = 0.0F;    // 缓存区域占用长度
    bool visible = false;
    bool hasVisualOverflow = false;

    /**
     * @brief 构造参数，未指定的派生字段取默认规则
     */
    struct Params
    {
        float scrollExtent = 0.0F;
        float paintOrigin = 0.0F;
        float paintExtent = 0.0F;
        std::optional<float> layoutExtent;  // 缺省 = paintExtent
        float maxPaintExtent = 0.0F;
        std::optional<float> hitTestExtent; // 缺省 = paintExtent
        std::optional<float> cacheExtent;   // 缺省 = layoutExtent
        std::optional<bool> visible;        // 缺省 = paintExtent > 0
        bool hasVisualOverflow = false;
    };

    static SliverGeometry From(const Params& params);

    /**
     * @brief 几何是否自洽
     */
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const SliverGeometry&) const = default;
};

/**
 * @brief 滚动轴约束
 */
struct SliverConstraints
{
    using Geometry = SliverGeometry;

    AxisDirection axisDirection = AxisDirection::DOWN;
    GrowthDirection growthDirection = GrowthDirection::FORWARD;
    ScrollDirection userScrollDirection = ScrollDirection::IDLE;
    float scrollOffset = 0.0F;
    float precedingScrollExtent = 0.0F;
    float overlap = 0.0F;
    float remainingPaintExtent = 0.0F;
    float crossAxisExtent = 0.0F;
    AxisDirection crossAxisDirection = AxisDirection::RIGHT;
    float viewportMainAxisExtent = 0.0F;
    float remainingCacheExtent = 0.0F;
    float cacheOrigin = 0.0F;

    [[nodiscard]] Axis axis() const { return AxisOf(axisDirection); }

    /**
     * @brief 结合增长方向后的实际绘制方向
     */
    [[nodiscard]] AxisDirection paintDirection() const
    {
        return ApplyGrowthDirection(axisDirection, growthDirection);
    }

    [[nodiscard]] bool isNormalized() const;

    /**
     * @brief 滚动约束从不收紧
     */
    [[nodiscard]] bool isTight() const { return false; }

    /**
     * @brief 投影为盒约束：交叉轴收紧为 crossAxisExtent，主轴取 [minExtent, maxExtent]
     *
     * 只依赖轴与交叉轴尺寸，滚动状态字段不影响结果。
     */
    [[nodiscard]] BoxConstraints asBoxConstraints(float minExtent = 0.0F,
                                                  float maxExtent = INFINITE_EXTENT,
                                                  std::optional<float> crossAxisExtent = std::nullopt) const;

    [[nodiscard]] bool isSatisfiedBy(const SliverGeometry& geometry) const;

    [[nodiscard]] std::string toString() const;

    bool operator==(const SliverConstraints&) const = default;
};

/**
 * @brief 主轴区间 [from, to] 在当前可见区域内的绘制长度
 */
float CalculatePaintOffset(const SliverConstraints& constraints, float from, float to);

/**
 * @brief 主轴区间 [from, to] 在缓存区域内的长度
 */
float CalculateCacheOffset(const SliverConstraints& constraints, float from, float to);

} // namespace render

template <>
struct std::hash<render::BoxConstraints>
{
    std::size_t operator()(const render::BoxConstraints& constraints) const noexcept;
};

template <>
struct std::hash<render::SliverConstraints>
{
    std::size_t operator()(const render::SliverConstraints& constraints) const noexcept;
};
