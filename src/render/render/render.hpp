/**
 * ************************************************************************
 *
 * @file render.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 汇总所有渲染树模块头文件
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

// NOLINTBEGIN(unused-included)
#include "../common/Components.hpp"
#include "../common/Constraints.hpp"
#include "../common/Errors.hpp"
#include "../common/Events.hpp"
#include "../common/GlobalContext.hpp"
#include "../common/RenderTypes.hpp"
#include "../common/Tags.hpp"
#include "../common/Types.hpp"

#include "../core/HitTestResult.hpp"
#include "../core/HitTestScope.hpp"
#include "../core/LayoutScope.hpp"
#include "../core/PipelineOwner.hpp"

#include "../systems/HitTestSystem.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

#include "../api/Config.hpp"
#include "../api/Debug.hpp"
#include "../api/Events.hpp"
#include "../api/Factory.hpp"
#include "../api/Hierarchy.hpp"
#include "../api/Layout.hpp"
#include "../api/Node.hpp"

#include "../nodes/BoxNodes.hpp"
#include "../nodes/ContainerNodes.hpp"
#include "../nodes/SliverNodes.hpp"

// NOLINTEND(unused-included)
