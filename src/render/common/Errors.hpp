/**
 * ************************************************************************
 *
 * @file Errors.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染树错误定义
 *
 * 错误分两类：
 * 1. 契约违背 (ContractViolation) - 非法约束、尺寸越界、布局中访问非子节点等
 *    属于编程错误，立即抛出，不可恢复
 * 2. 使用顺序错误 (TreeError) - 在活动 pass 中修改树、查询仍脏的几何、节点未挂载等
 *    通过 std::expected 同步返回，调用方可以区分"尚未就绪"与"格式错误"
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace render
{

enum class TreeError : std::uint8_t
{
    InvalidNode,        // 句柄无效（节点已销毁）
    NodeDetached,       // 节点未挂载到管线
    PassInProgress,     // 活动 pass 中修改树或重入 pass
    LayoutPending,      // 几何仍为脏
    AlreadyAttached,    // 子节点已有父节点或已是根
    NotAChild,          // 节点不是给定父节点的子节点
    WouldCreateCycle,   // 挂载后会形成环
    ChildRejected,      // 父节点类型不接受该子节点
    NoRoot,             // 管线未挂载根节点
    WrongProtocol,      // 节点协议与请求不符（盒 / 滚动轴）
    LayoutNotConverged  // 布局刷新迭代次数超限
};

/**
 * @brief 错误描述
 */
constexpr std::string_view ToString(TreeError error)
{
    switch (error)
    {
        case TreeError::InvalidNode:
            return "invalid node";
        case TreeError::NodeDetached:
            return "node is not attached to a pipeline";
        case TreeError::PassInProgress:
            return "a layout, paint or hit-test pass is in progress";
        case TreeError::LayoutPending:
            return "layout is pending";
        case TreeError::AlreadyAttached:
            return "node already has a parent";
        case TreeError::NotAChild:
            return "node is not a child of the given parent";
        case TreeError::WouldCreateCycle:
            return "attaching would create a cycle";
        case TreeError::ChildRejected:
            return "parent does not accept this child";
        case TreeError::NoRoot:
            return "pipeline has no root";
        case TreeError::WrongProtocol:
            return "node uses a different layout protocol";
        case TreeError::LayoutNotConverged:
            return "layout did not converge";
    }
    return "unknown";
}

/**
 * @brief 布局契约违背：非法约束、几何越界等编程错误
 */
class ContractViolation : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace render
