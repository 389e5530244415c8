/**
 * ************************************************************************
 *
 * @file ConstraintsTraits.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 约束类型萃取
 *
 * 布局协议按约束类型泛化：
    - Constraints 概念约束可被布局协议使用的约束类型
    - protocol_of_v 把约束类型映射到协议枚举
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include "../common/Constraints.hpp"

namespace render::traits
{

/**
 * @brief 约束类型概念：可比较、可哈希、能校验自身及对应的几何
 */
template <typename T>
concept Constraints = (std::same_as<T, BoxConstraints> || std::same_as<T, SliverConstraints>) && std::copyable<T> && std::equality_comparable<T> &&
                      requires(const T& constraints, const typename T::Geometry& geometry) {
                          { std::hash<T>{}(constraints) } -> std::convertible_to<std::size_t>;
                          { constraints.isNormalized() } -> std::same_as<bool>;
                          { constraints.isTight() } -> std::same_as<bool>;
                          { constraints.isSatisfiedBy(geometry) } -> std::same_as<bool>;
                          { constraints.toString() } -> std::convertible_to<std::string>;
                      };

template <typename T>
inline constexpr Protocol protocol_of_v = std::is_same_v<T, BoxConstraints> ? Protocol::BOX : Protocol::SLIVER;

constexpr const char* ProtocolName(Protocol protocol)
{
    return protocol == Protocol::BOX ? "box" : "sliver";
}

} // namespace render::traits
