/**
 * ************************************************************************
 *
 * @file TestKinds.h
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 测试用节点类型
 *
 * 计数、故意违反契约、在布局中修改树等行为只在测试里出现，
 * 统一放在这里供各测试文件复用。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>
#include "src/render/render/render.hpp"

namespace render::tests
{

/**
 * @brief 记录 performLayout 调用次数的叶子节点
 */
struct RenderCountingBox : interface::EnableRenderBox
{
    Vec2 preferredSize{10.0F, 10.0F};
    std::shared_ptr<int> layouts = std::make_shared<int>(0);

    RenderCountingBox() = default;
    explicit RenderCountingBox(const Vec2& size) : preferredSize(size) {}

    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        ++*layouts;
        scope.setGeometry(scope.constraints().constrain(preferredSize));
    }

    [[nodiscard]] bool hitTestSelf(const Vec2& /*position*/) const { return true; }
};

/**
 * @brief 不理会约束，直接报告固定尺寸
 */
struct RenderStubbornBox : interface::EnableRenderBox
{
    Vec2 size{500.0F, 500.0F};

    void performLayout(LayoutScope<BoxConstraints>& scope) { scope.setGeometry(size); }
};

/**
 * @brief performLayout 结束时没有设置尺寸
 */
struct RenderForgetfulBox : interface::EnableRenderBox
{
    void performLayout(LayoutScope<BoxConstraints>& /*scope*/) {}
};

/**
 * @brief 声明由父约束决定尺寸，却在 performLayout 中改写尺寸
 */
struct RenderFickleBox : interface::EnableRenderBox
{
    [[nodiscard]] bool sizedByParent() const { return true; }
    [[nodiscard]] Vec2 performResize(const BoxConstraints& constraints) const { return constraints.biggest(); }
    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        scope.setGeometry(scope.constraints().smallest());
    }
};

/**
 * @brief 每次布局时把备用节点挂为自己的子节点（通过延迟队列）
 */
struct RenderGreedyBox : interface::EnableRenderBox
{
    std::shared_ptr<std::vector<entt::entity>> spares = std::make_shared<std::vector<entt::entity>>();

    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        Vec2 extent(0.0F, 0.0F);
        for (const auto child : scope.children())
        {
            extent = extent.cwiseMax(scope.layoutBoxChild(child, scope.constraints().loosen(), true));
        }
        scope.setGeometry(scope.constraints().constrain(extent));

        if (spares->empty()) return;
        const auto spare = spares->back();
        spares->pop_back();
        if (auto scheduled = hierarchy::ScheduleAttachChild(scope.owner(), scope.self(), spare); !scheduled)
        {
            throw std::runtime_error("scheduling an attach during layout failed");
        }
    }

    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t /*childCount*/) const
    {
        return protocol == Protocol::BOX;
    }
};

/**
 * @brief 由父约束决定尺寸，每次布局都把伙伴节点标记为需要布局
 */
struct RenderRestlessBox : interface::EnableRenderBox
{
    std::shared_ptr<entt::entity> partner = std::make_shared<entt::entity>(entt::null);

    [[nodiscard]] bool sizedByParent() const { return true; }
    [[nodiscard]] Vec2 performResize(const BoxConstraints& constraints) const { return constraints.smallest(); }

    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        if (*partner == entt::null) return;
        if (auto marked = layout::MarkNeedsLayout(scope.owner(), *partner); !marked)
        {
            throw std::runtime_error("marking the partner during layout failed");
        }
    }
};

/**
 * @brief 在布局中尝试直接修改树与重入刷新，记录返回的错误
 */
struct RenderProbeBox : interface::EnableRenderBox
{
    entt::entity spare = entt::null;
    std::shared_ptr<std::optional<TreeError>> attachError = std::make_shared<std::optional<TreeError>>();
    std::shared_ptr<std::optional<TreeError>> flushError = std::make_shared<std::optional<TreeError>>();

    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        if (auto attached = hierarchy::AttachChild(scope.owner(), scope.self(), spare); !attached)
        {
            *attachError = attached.error();
        }
        if (auto flushed = scope.owner().flushLayout(); !flushed)
        {
            *flushError = flushed.error();
        }
        scope.setGeometry(scope.constraints().smallest());
    }

    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t /*childCount*/) const
    {
        return protocol == Protocol::BOX;
    }
};

/**
 * @brief 自身可命中，收到事件后记录并阻止继续分发
 */
struct RenderAbsorbingBox : interface::EnableRenderBox
{
    std::shared_ptr<std::vector<Vec2>> received = std::make_shared<std::vector<Vec2>>();

    void performLayout(LayoutScope<BoxConstraints>& scope)
    {
        const auto child = scope.firstChild();
        if (child == entt::null)
        {
            scope.setGeometry(scope.constraints().biggest());
            return;
        }
        scope.setGeometry(scope.layoutBoxChild(child, scope.constraints(), true));
        scope.positionChild(child, Vec2(0.0F, 0.0F));
    }

    [[nodiscard]] bool hitTestSelf(const Vec2& /*position*/) const { return true; }

    [[nodiscard]] bool hitTestChildren(HitTestScope& scope, const Vec2& position) const
    {
        return scope.hitTestChildrenInReverse(position);
    }

    void handleEvent(EventScope& scope, const events::PointerEvent& /*event*/, const HitTestEntry& entry)
    {
        received->push_back(entry.localPosition);
        scope.setHandled();
    }

    [[nodiscard]] bool acceptsChild(Protocol protocol, std::size_t childCount) const
    {
        return protocol == Protocol::BOX && childCount == 0;
    }
};

} // namespace render::tests
