/**
 * ************************************************************************
 *
 * @file Types.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染树核心类型定义
 *
 * 使用 Eigen 向量类型表示尺寸、偏移与仿射变换。
 * 包含轴方向、边距等布局协议共享的基础类型。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <cstdint>
#include <limits>
#include <algorithm>

namespace render
{

// ===================== 基础向量类型 =====================

/**
 * @brief 2D向量类型（尺寸 / 偏移 / 坐标）
 */
using Vec2 = Eigen::Vector2f;

/**
 * @brief 3x3矩阵类型（用于2D齐次变换）
 */
using Mat3 = Eigen::Matrix3f;

/**
 * @brief 仿射变换类型（2D）
 */
using Transform2D = Eigen::Affine2f;

/**
 * @brief 无界尺寸
 */
inline constexpr float INFINITE_EXTENT = std::numeric_limits<float>::infinity();

/**
 * @brief 浮点比较容差（布局累加误差）
 */
inline constexpr float PRECISION_TOLERANCE = 1e-3F;

// ===================== 轴与方向 =====================

/**
 * @brief 二维轴
 */
enum class Axis : uint8_t
{
    HORIZONTAL,
    VERTICAL
};

/**
 * @brief 轴方向（滚动轴的增长方向）
 */
enum class AxisDirection : uint8_t
{
    UP,
    RIGHT,
    DOWN,
    LEFT
};

/**
 * @brief 内容相对于轴方向的增长方向
 */
enum class GrowthDirection : uint8_t
{
    FORWARD,
    REVERSE
};

/**
 * @brief 用户滚动方向
 */
enum class ScrollDirection : uint8_t
{
    IDLE,
    FORWARD,
    REVERSE
};

inline Axis AxisOf(AxisDirection direction)
{
    return (direction == AxisDirection::UP || direction == AxisDirection::DOWN) ? Axis::VERTICAL : Axis::HORIZONTAL;
}

inline AxisDirection FlipAxisDirection(AxisDirection direction)
{
    switch (direction)
    {
        case AxisDirection::UP:
            return AxisDirection::DOWN;
        case AxisDirection::RIGHT:
            return AxisDirection::LEFT;
        case AxisDirection::DOWN:
            return AxisDirection::UP;
        case AxisDirection::LEFT:
            return AxisDirection::RIGHT;
    }
    return direction;
}

/**
 * @brief 结合增长方向得到实际的轴方向
 */
inline AxisDirection ApplyGrowthDirection(AxisDirection direction, GrowthDirection growth)
{
    return growth == GrowthDirection::FORWARD ? direction : FlipAxisDirection(direction);
}

/**
 * @brief 轴方向是否与坐标系正方向相反（向上 / 向左）
 */
inline bool IsReversed(AxisDirection direction)
{
    return direction == AxisDirection::UP || direction == AxisDirection::LEFT;
}

// ===================== 边距类型 =====================

/**
 * @brief 边距结构体（Top, Right, Bottom, Left顺序）
 */
struct EdgeInsets
{
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;

    constexpr EdgeInsets() = default;
    constexpr EdgeInsets(float all) : top(all), right(all), bottom(all), left(all) {}
    constexpr EdgeInsets(float vertical, float horizontal)
        : top(vertical), right(horizontal), bottom(vertical), left(horizontal)
    {
    }
    constexpr EdgeInsets(float t, float r, float b, float l) : top(t), right(r), bottom(b), left(l) {}

    [[nodiscard]] float horizontal() const { return left + right; }
    [[nodiscard]] float vertical() const { return top + bottom; }

    /**
     * @brief 内容区域左上角偏移
     */
    [[nodiscard]] Vec2 topLeft() const { return {left, top}; }

    bool operator==(const EdgeInsets&) const = default;
};

// ===================== 对齐 =====================

/**
 * @brief 对齐方式，-1 表示起始边，0 居中，1 末尾边
 */
struct Alignment
{
    float x = 0.0F;
    float y = 0.0F;

    /**
     * @brief 计算 child 在 parent 中的对齐偏移
     */
    [[nodiscard]] Vec2 alongOffset(const Vec2& free) const
    {
        return {free.x() * (x + 1.0F) * 0.5F, free.y() * (y + 1.0F) * 0.5F};
    }

    static constexpr Alignment TopLeft() { return {-1.0F, -1.0F}; }
    static constexpr Alignment Center() { return {0.0F, 0.0F}; }
    static constexpr Alignment BottomRight() { return {1.0F, 1.0F}; }

    bool operator==(const Alignment&) const = default;
};

// ===================== 工具函数 =====================

/**
 * @brief 创建Vec2
 */
inline Vec2 MakeVec2(float x, float y)
{
    return {x, y};
}

/**
 * @brief 纯平移变换
 */
inline Transform2D MakeTranslation(const Vec2& translation)
{
    Transform2D transform = Transform2D::Identity();
    transform.translate(translation);
    return transform;
}

/**
 * @brief 创建2D仿射变换
 */
inline Transform2D MakeTransform2D(const Vec2& translation, float rotation = 0.0f, const Vec2& scale = Vec2(1, 1))
{
    Transform2D transform = Transform2D::Identity();
    transform.translate(translation);
    transform.rotate(rotation);
    transform.scale(scale);
    return transform;
}

/**
 * @brief 点是否落在 [0, size) 范围内
 */
inline bool ContainsPoint(const Vec2& size, const Vec2& point)
{
    return point.x() >= 0.0F && point.x() < size.x() && point.y() >= 0.0F && point.y() < size.y();
}

} // namespace render
