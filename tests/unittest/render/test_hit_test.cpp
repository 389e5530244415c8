/**
 * ************************************************************************
 *
 * @file test_hit_test.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 命中测试与指针事件分发单元测试
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>
#include "TestKinds.h"

using namespace render;
using namespace render::nodes;

class HitTestTest : public ::testing::Test
{
protected:
    PipelineOwner m_owner;

    template <typename Kind>
    entt::entity make(Kind kind = {})
    {
        return factory::Create(m_owner, std::move(kind));
    }

    void attach(entt::entity parent, entt::entity child)
    {
        ASSERT_TRUE(hierarchy::AttachChild(m_owner, parent, child).has_value());
    }

    void attachRoot(entt::entity root, const BoxConstraints& constraints)
    {
        ASSERT_TRUE(m_owner.attachRoot(root, constraints).has_value());
        ASSERT_TRUE(m_owner.flushLayout().has_value());
    }

    HitTestResult hitTest(float x, float y)
    {
        auto result = systems::HitTestSystem::hitTest(m_owner, Vec2(x, y));
        EXPECT_TRUE(result.has_value());
        return result.value_or(HitTestResult{});
    }
};

// 测试 1: 重叠时后面的子节点优先命中，且只命中一个
TEST_F(HitTestTest, LaterSiblingWinsOverlap)
{
    const auto root = make(RenderStack());
    const auto a = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    const auto b = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    attach(root, a);
    attach(root, b);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));

    const auto result = hitTest(50.0F, 50.0F);
    EXPECT_EQ(result.targets(), (std::vector<entt::entity>{b, root}));
    EXPECT_FALSE(result.contains(a));
    EXPECT_EQ(m_owner.stats().hitTests, 1U);
}

// 测试 2: 不透明性决定自身是否命中
TEST_F(HitTestTest, TransparentLeafLetsPointerThrough)
{
    const auto root = make(RenderStack());
    const auto a = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    const auto b = make(RenderSolidBox(Vec2(100.0F, 100.0F), false));
    attach(root, a);
    attach(root, b);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));

    EXPECT_EQ(hitTest(50.0F, 50.0F).targets(), (std::vector<entt::entity>{a, root}));
}

// 测试 3: 范围为左闭右开
TEST_F(HitTestTest, BoundsAreHalfOpen)
{
    const auto root = make(RenderSolidBox());
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));

    EXPECT_FALSE(hitTest(0.0F, 0.0F).empty());
    EXPECT_FALSE(hitTest(99.9F, 99.9F).empty());
    EXPECT_TRUE(hitTest(100.0F, 50.0F).empty());
    EXPECT_TRUE(hitTest(-0.1F, 50.0F).empty());
}

// 测试 4: 绘制偏移换算到局部坐标，条目变换把全局坐标映射到局部坐标
TEST_F(HitTestTest, PaintOffsetMapsToLocalCoordinates)
{
    const auto root = make(RenderPadding(EdgeInsets(10.0F)));
    const auto leaf = make(RenderSolidBox(Vec2(500.0F, 500.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));

    const auto result = hitTest(15.0F, 15.0F);
    ASSERT_EQ(result.size(), 2U);
    const auto& entry = result.front();
    EXPECT_EQ(entry.target, leaf);
    EXPECT_EQ(entry.localPosition, Vec2(5.0F, 5.0F));
    EXPECT_TRUE((entry.transform * Vec2(15.0F, 15.0F)).isApprox(Vec2(5.0F, 5.0F)));
    EXPECT_EQ(result.path()[1].target, root);
    EXPECT_TRUE(result.path()[1].transform.isApprox(Transform2D::Identity()));

    // 内边距本身不可命中
    EXPECT_TRUE(hitTest(5.0F, 5.0F).empty());
}

// 测试 5: 绘制变换在命中时取逆
TEST_F(HitTestTest, PaintTransformIsInverted)
{
    const auto root = make(RenderTransformBox(MakeTransform2D(Vec2(0.0F, 0.0F), 0.0F, Vec2(2.0F, 2.0F))));
    const auto leaf = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));

    const auto result = hitTest(60.0F, 60.0F);
    ASSERT_EQ(result.targets(), (std::vector<entt::entity>{leaf, root}));
    EXPECT_TRUE(result.front().localPosition.isApprox(Vec2(30.0F, 30.0F)));
    EXPECT_TRUE((result.front().transform * Vec2(60.0F, 60.0F)).isApprox(Vec2(30.0F, 30.0F)));
}

// 测试 6: 不可逆的变换不会命中子节点
TEST_F(HitTestTest, DegenerateTransformHitsNothing)
{
    const auto root = make(RenderTransformBox(MakeTransform2D(Vec2(0.0F, 0.0F), 0.0F, Vec2(0.0F, 0.0F))));
    const auto leaf = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));

    EXPECT_TRUE(hitTest(10.0F, 10.0F).empty());
    EXPECT_FALSE(HitTestResult::InvertPaintTransform(MakeTransform2D(Vec2(1.0F, 1.0F), 0.0F, Vec2(0.0F, 3.0F))));
}

// 测试 7: 命中测试的前置条件
TEST_F(HitTestTest, RequiresCleanLayout)
{
    EXPECT_EQ(systems::HitTestSystem::hitTest(m_owner, Vec2(0.0F, 0.0F)).error(), TreeError::NoRoot);

    const auto root = make(RenderSolidBox());
    ASSERT_TRUE(m_owner.attachRoot(root, BoxConstraints::Tight(Vec2(10.0F, 10.0F))).has_value());
    EXPECT_EQ(systems::HitTestSystem::hitTest(m_owner, Vec2(0.0F, 0.0F)).error(), TreeError::LayoutPending);
}

// 测试 8: 事件由内向外分发，处理后停止
TEST_F(HitTestTest, DispatchInnermostFirstUntilHandled)
{
    auto innerHits = std::make_shared<int>(0);
    RenderSolidBox innerKind(Vec2(50.0F, 50.0F));
    innerKind.onPointer = [innerHits](EventScope&, const events::PointerEvent&, const HitTestEntry&) { ++*innerHits; };

    tests::RenderAbsorbingBox absorberKind;
    const auto received = absorberKind.received;

    const auto root = make(RenderStack());
    const auto absorber = make(absorberKind);
    const auto inner = make(innerKind);
    attach(root, absorber);
    attach(absorber, inner);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));

    events::PointerEvent event;
    event.position = Vec2(10.0F, 20.0F);
    auto delivered = events::HitTestAndDispatch(m_owner, event);
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(*delivered, 2U);
    EXPECT_EQ(*innerHits, 1);
    ASSERT_EQ(received->size(), 1U);
    EXPECT_EQ(received->front(), Vec2(10.0F, 20.0F));
}

// 测试 9: 事件处理中的结构修改被延迟到分发结束
TEST_F(HitTestTest, MutationsDuringDispatchAreDeferred)
{
    const auto root = make(RenderStack());
    const auto victim = make(RenderSolidBox(Vec2(10.0F, 10.0F)));
    auto directError = std::make_shared<std::optional<TreeError>>();

    RenderSolidBox trigger(Vec2(100.0F, 100.0F));
    trigger.onPointer = [root, victim, directError](EventScope& scope, const events::PointerEvent&, const HitTestEntry&)
    {
        if (auto dropped = hierarchy::DropChild(scope.owner(), root, victim); !dropped)
        {
            *directError = dropped.error();
        }
        if (auto scheduled = hierarchy::ScheduleDropChild(scope.owner(), root, victim); !scheduled)
        {
            *directError = scheduled.error();
        }
        scope.setHandled();
    };
    attach(root, victim);
    attach(root, make(trigger));
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));

    events::PointerEvent event;
    event.position = Vec2(50.0F, 50.0F);
    ASSERT_TRUE(events::HitTestAndDispatch(m_owner, event).has_value());
    ASSERT_TRUE(directError->has_value());
    EXPECT_EQ(**directError, TreeError::PassInProgress);
    EXPECT_FALSE(m_owner.registry().valid(victim));
    EXPECT_EQ(m_owner.phase(), Phase::IDLE);
    EXPECT_TRUE(m_owner.hasPendingLayout());
}

// 测试 10: 过期结果中已销毁的目标被跳过
TEST_F(HitTestTest, DispatchSkipsDestroyedTargets)
{
    const auto root = make(RenderStack());
    const auto wrapper = make(RenderPadding(EdgeInsets(0.0F)));
    const auto leaf = make(RenderSolidBox(Vec2(20.0F, 20.0F)));
    attach(root, wrapper);
    attach(wrapper, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));

    const auto result = hitTest(5.0F, 5.0F);
    ASSERT_EQ(result.size(), 3U);
    ASSERT_TRUE(hierarchy::DropChild(m_owner, root, wrapper).has_value());

    auto delivered = events::DispatchPointerEvent(m_owner, result, events::PointerEvent{});
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(*delivered, 1U);
}

// 测试 11: 事件处理中标记的布局与重绘在下一帧生效
TEST_F(HitTestTest, HandlerInvalidationRelayoutsNextFrame)
{
    const auto root = make(RenderStack());
    auto handled = std::make_shared<int>(0);
    RenderSolidBox leafKind(Vec2(40.0F, 40.0F));
    leafKind.onPointer = [handled](EventScope& scope, const events::PointerEvent&, const HitTestEntry&)
    {
        ++*handled;
        scope.markNeedsLayout();
        scope.markNeedsPaint();
    };
    const auto leaf = make(leafKind);
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    ASSERT_TRUE(m_owner.flushPaint().has_value());
    ASSERT_FALSE(node::NeedsPaint(m_owner, leaf));
    ASSERT_FALSE(m_owner.hasPendingLayout());

    events::PointerEvent event;
    event.position = Vec2(10.0F, 10.0F);
    ASSERT_TRUE(events::HitTestAndDispatch(m_owner, event).has_value());
    EXPECT_EQ(*handled, 1);
    EXPECT_TRUE(node::NeedsLayout(m_owner, leaf));
    EXPECT_TRUE(node::NeedsPaint(m_owner, leaf));
    EXPECT_TRUE(node::NeedsPaint(m_owner, root));
    EXPECT_TRUE(m_owner.hasPendingLayout());

    const auto layouts = m_owner.stats().layouts;
    ASSERT_TRUE(m_owner.flushLayout().has_value());
    EXPECT_FALSE(node::NeedsLayout(m_owner, leaf));
    EXPECT_EQ(m_owner.stats().layouts, layouts + 2);
    ASSERT_TRUE(m_owner.flushPaint().has_value());
    EXPECT_FALSE(node::NeedsPaint(m_owner, leaf));
}
