/**
 * ************************************************************************
 *
 * @file SingleChild.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 单子节点类型共用的辅助函数
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include "../common/Constraints.hpp"
#include "../core/HitTestScope.hpp"

namespace render::nodes::detail
{

inline bool AcceptsSingle(Protocol expected, Protocol protocol, std::size_t childCount)
{
    return protocol == expected && childCount == 0;
}

inline bool HitTestOnlyChild(HitTestScope& scope, const Vec2& position)
{
    const auto children = scope.children();
    return !children.empty() && scope.hitTestChild(children.front(), position);
}

} // namespace render::nodes::detail
