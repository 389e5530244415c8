/**
 * ************************************************************************
 *
 * @file HitTestScope.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 命中测试作用域
 *
 * hitTestChildren 期间节点类型访问子节点的入口。hitTestChild 按子节点的
 * ParentData 把坐标转换到子节点局部坐标，并维护结果中的变换栈。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <span>
#include <entt/entt.hpp>
#include "HitTestResult.hpp"

namespace render
{
class PipelineOwner;

class HitTestScope
{
public:
    HitTestScope(PipelineOwner& owner, entt::entity self, HitTestResult& result)
        : m_owner(owner), m_self(self), m_result(result)
    {
    }

    [[nodiscard]] entt::entity self() const { return m_self; }
    [[nodiscard]] std::span<const entt::entity> children() const;
    [[nodiscard]] HitTestResult& result() const { return m_result; }

    /**
     * @brief 以本节点局部坐标测试一个子节点
     */
    bool hitTestChild(entt::entity child, const Vec2& position) const;

    /**
     * @brief 按绘制逆序测试子节点，第一个命中即停止
     */
    bool hitTestChildrenInReverse(const Vec2& position) const;

private:
    PipelineOwner& m_owner;
    entt::entity m_self;
    HitTestResult& m_result;
};

/**
 * @brief 事件处理作用域，允许节点类型在处理事件时标记自身为脏
 */
class EventScope
{
public:
    EventScope(PipelineOwner& owner, entt::entity self) : m_owner(owner), m_self(self) {}

    [[nodiscard]] entt::entity self() const { return m_self; }
    [[nodiscard]] PipelineOwner& owner() const { return m_owner; }

    void markNeedsLayout() const;
    void markNeedsPaint() const;

    /**
     * @brief 事件是否已被内层节点处理
     */
    [[nodiscard]] bool isHandled() const { return m_handled; }
    void setHandled() { m_handled = true; }

private:
    PipelineOwner& m_owner;
    entt::entity m_self;
    bool m_handled = false;
};

} // namespace render
