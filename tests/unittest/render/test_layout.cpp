/**
 * ************************************************************************
 *
 * @file test_layout.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-05
 * @version 0.1
 * @brief 布局协议单元测试
 *
 * 覆盖重新布局边界、布局缓存、百分比尺寸、试算布局以及布局契约检查。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include <gtest/gtest.h>
#include "TestKinds.h"

using namespace render;
using namespace render::nodes;

class LayoutTest : public ::testing::Test
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
    }

    void flush() { ASSERT_TRUE(m_owner.flushLayout().has_value()); }

    Vec2 sizeOf(entt::entity node)
    {
        auto size = node::GetSize(m_owner, node);
        EXPECT_TRUE(size.has_value());
        return size.value_or(Vec2(-1.0F, -1.0F));
    }

    Vec2 offsetOf(entt::entity node)
    {
        auto offset = node::GetOffset(m_owner, node);
        EXPECT_TRUE(offset.has_value());
        return offset.value_or(Vec2(-1.0F, -1.0F));
    }
};

// 测试 1: 百分比宽度按父约束最大值解析，未指定的高度取约束最小值
TEST_F(LayoutTest, PercentWidthResolvesAgainstParentMax)
{
    const auto root = make(RenderAlignBox(Alignment::Center()));
    const auto child = make(RenderFractionalBox(0.5F, std::nullopt));
    attach(root, child);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));
    flush();

    EXPECT_EQ(sizeOf(root), Vec2(100.0F, 100.0F));
    EXPECT_EQ(sizeOf(child), Vec2(50.0F, 0.0F));
    EXPECT_EQ(offsetOf(child), Vec2(25.0F, 50.0F));
}

// 测试 2: 无界轴上的百分比按自动尺寸处理
TEST_F(LayoutTest, PercentOnUnboundedAxisFallsBackToAuto)
{
    const auto root = make(RenderFlex(Axis::HORIZONTAL));
    const auto child = make(RenderFractionalBox(0.5F, 0.5F));
    attach(root, child);
    attachRoot(root, BoxConstraints::Tight(Vec2(200.0F, 100.0F)));
    flush();

    EXPECT_EQ(sizeOf(child), Vec2(0.0F, 50.0F));
    EXPECT_EQ(sizeOf(root), Vec2(200.0F, 100.0F));
}

// 测试 3: 百分比容器的自动轴跟随子节点
TEST_F(LayoutTest, PercentBoxWrapsChildOnAutoAxis)
{
    const auto root = make(RenderAlignBox(Alignment::TopLeft()));
    const auto percent = make(RenderFractionalBox(std::nullopt, 0.25F));
    const auto leaf = make(RenderSolidBox(Vec2(30.0F, 500.0F)));
    attach(root, percent);
    attach(percent, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(200.0F, 200.0F)));
    flush();

    EXPECT_EQ(sizeOf(leaf), Vec2(30.0F, 50.0F));
    EXPECT_EQ(sizeOf(percent), Vec2(30.0F, 50.0F));
}

// 测试 4: 收缩对齐容器的尺寸跟随子节点
TEST_F(LayoutTest, ShrinkWrappedAlignFollowsChild)
{
    const auto root = make(RenderAlignBox(Alignment::Center(), true));
    const auto leaf = make(RenderSolidBox(Vec2(40.0F, 30.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(300.0F, 300.0F)));
    flush();

    EXPECT_EQ(sizeOf(root), Vec2(40.0F, 30.0F));
    EXPECT_EQ(offsetOf(leaf), Vec2(0.0F, 0.0F));
}

// 测试 5: 重新布局边界的判定
TEST_F(LayoutTest, RelayoutBoundaries)
{
    const auto root = make(RenderStack());
    const auto align = make(RenderAlignBox(Alignment::TopLeft()));
    const auto alignedLeaf = make(RenderSolidBox(Vec2(10.0F, 10.0F)));
    const auto fixed = make(RenderConstrainedBox(BoxConstraints::Tight(Vec2(20.0F, 20.0F))));
    const auto fixedLeaf = make(RenderSolidBox(Vec2(5.0F, 5.0F)));
    const auto stackedLeaf = make(RenderSolidBox(Vec2(15.0F, 15.0F)));
    attach(root, align);
    attach(align, alignedLeaf);
    attach(root, fixed);
    attach(fixed, fixedLeaf);
    attach(root, stackedLeaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    flush();

    EXPECT_TRUE(node::IsRelayoutBoundary(m_owner, root));
    // 由父约束决定尺寸
    EXPECT_TRUE(node::IsRelayoutBoundary(m_owner, align));
    // 父节点不使用尺寸
    EXPECT_TRUE(node::IsRelayoutBoundary(m_owner, alignedLeaf));
    // 收紧约束
    EXPECT_TRUE(node::IsRelayoutBoundary(m_owner, fixedLeaf));
    EXPECT_FALSE(node::IsRelayoutBoundary(m_owner, fixed));
    EXPECT_FALSE(node::IsRelayoutBoundary(m_owner, stackedLeaf));
}

// 测试 6: 失效只传播到重新布局边界，兄弟节点命中缓存
TEST_F(LayoutTest, InvalidationStopsAtBoundaryAndSiblingsAreMemoized)
{
    const auto root = make(RenderAlignBox(Alignment::Center()));
    const auto stack = make(RenderStack());
    tests::RenderCountingBox first(Vec2(10.0F, 10.0F));
    tests::RenderCountingBox second(Vec2(20.0F, 20.0F));
    const auto firstCount = first.layouts;
    const auto secondCount = second.layouts;
    const auto a = make(first);
    const auto b = make(second);
    attach(root, stack);
    attach(stack, a);
    attach(stack, b);
    attachRoot(root, BoxConstraints::Tight(Vec2(200.0F, 200.0F)));
    flush();
    ASSERT_EQ(*firstCount, 1);
    ASSERT_EQ(*secondCount, 1);
    ASSERT_TRUE(node::IsRelayoutBoundary(m_owner, stack));

    ASSERT_TRUE(layout::MarkNeedsLayout(m_owner, a).has_value());
    EXPECT_TRUE(node::NeedsLayout(m_owner, a));
    EXPECT_TRUE(node::NeedsLayout(m_owner, stack));
    EXPECT_FALSE(node::NeedsLayout(m_owner, root));
    EXPECT_EQ(m_owner.nodesNeedingLayout().count(stack), 1U);

    const auto skipsBefore = m_owner.stats().memoizedSkips;
    flush();
    EXPECT_EQ(*firstCount, 2);
    EXPECT_EQ(*secondCount, 1);
    EXPECT_EQ(m_owner.stats().memoizedSkips, skipsBefore + 1);
    EXPECT_FALSE(node::NeedsLayout(m_owner, root));
}

// 测试 7: 没有脏节点时刷新不做任何布局
TEST_F(LayoutTest, FlushIsIdempotent)
{
    const auto root = make(RenderStack());
    attach(root, make(RenderSolidBox(Vec2(10.0F, 10.0F))));
    attachRoot(root, BoxConstraints::Loose(Vec2(50.0F, 50.0F)));
    flush();

    const auto layouts = m_owner.stats().layouts;
    flush();
    flush();
    EXPECT_EQ(m_owner.stats().layouts, layouts);
    EXPECT_FALSE(m_owner.hasPendingLayout());
}

// 测试 8: 修改节点属性后重新布局
TEST_F(LayoutTest, UpdateTriggersRelayout)
{
    const auto root = make(RenderStack());
    const auto leaf = make(RenderSolidBox(Vec2(10.0F, 10.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    flush();
    ASSERT_EQ(sizeOf(root), Vec2(10.0F, 10.0F));

    auto updated = node::Update<RenderSolidBox>(
        m_owner, leaf, [](RenderSolidBox& box) { box.preferredSize = Vec2(60.0F, 70.0F); });
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(node::GetSize(m_owner, leaf).error(), TreeError::LayoutPending);

    flush();
    EXPECT_EQ(sizeOf(leaf), Vec2(60.0F, 70.0F));
    EXPECT_EQ(sizeOf(root), Vec2(60.0F, 70.0F));

    // 类型不符
    auto mismatched = node::Update<RenderPadding>(m_owner, leaf, [](RenderPadding&) {});
    EXPECT_EQ(mismatched.error(), TreeError::WrongProtocol);
}

// 测试 9: 内边距
TEST_F(LayoutTest, PaddingDeflatesAndOffsetsChild)
{
    const auto root = make(RenderPadding(EdgeInsets(10.0F)));
    const auto leaf = make(RenderSolidBox(Vec2(500.0F, 500.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));
    flush();

    EXPECT_EQ(sizeOf(leaf), Vec2(80.0F, 80.0F));
    EXPECT_EQ(offsetOf(leaf), Vec2(10.0F, 10.0F));
    EXPECT_EQ(sizeOf(root), Vec2(100.0F, 100.0F));
}

// 测试 10: 线性容器依次排列子节点
TEST_F(LayoutTest, FlexPlacesChildrenInSequence)
{
    const auto root = make(RenderFlex(Axis::HORIZONTAL, 5.0F));
    const auto a = make(RenderSolidBox(Vec2(10.0F, 20.0F)));
    const auto b = make(RenderSolidBox(Vec2(30.0F, 10.0F)));
    attach(root, a);
    attach(root, b);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));
    flush();

    EXPECT_EQ(sizeOf(root), Vec2(45.0F, 20.0F));
    EXPECT_EQ(offsetOf(a), Vec2(0.0F, 0.0F));
    EXPECT_EQ(offsetOf(b), Vec2(15.0F, 0.0F));
}

// 测试 11: 纵向线性容器
TEST_F(LayoutTest, ColumnStacksVertically)
{
    const auto root = make(RenderFlex(Axis::VERTICAL));
    const auto a = make(RenderSolidBox(Vec2(10.0F, 20.0F)));
    const auto b = make(RenderSolidBox(Vec2(30.0F, 10.0F)));
    attach(root, a);
    attach(root, b);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));
    flush();

    EXPECT_EQ(sizeOf(root), Vec2(30.0F, 30.0F));
    EXPECT_EQ(offsetOf(b), Vec2(0.0F, 20.0F));
}

// 测试 12: 重叠容器按对齐方式定位
TEST_F(LayoutTest, StackAlignsChildren)
{
    const auto root = make(RenderStack(Alignment::Center()));
    const auto big = make(RenderSolidBox(Vec2(100.0F, 100.0F)));
    const auto small = make(RenderSolidBox(Vec2(20.0F, 20.0F)));
    attach(root, big);
    attach(root, small);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));
    flush();

    EXPECT_EQ(sizeOf(root), Vec2(100.0F, 100.0F));
    EXPECT_EQ(offsetOf(small), Vec2(40.0F, 40.0F));
}

// 测试 13: 试算布局不修改节点状态并缓存结果
TEST_F(LayoutTest, DryLayoutIsPureAndCached)
{
    const auto padding = make(RenderPadding(EdgeInsets(10.0F)));
    const auto leaf = make(RenderSolidBox(Vec2(30.0F, 20.0F)));
    attach(padding, leaf);

    auto dry = layout::GetDryLayout(m_owner, padding, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    ASSERT_TRUE(dry.has_value());
    EXPECT_EQ(*dry, Vec2(50.0F, 40.0F));
    EXPECT_EQ(m_owner.stats().layouts, 0U);
    EXPECT_EQ(node::GetSize(m_owner, padding).error(), TreeError::LayoutPending);
    EXPECT_TRUE(node::NeedsLayout(m_owner, padding));

    const auto dryLayouts = m_owner.stats().dryLayouts;
    auto again = layout::GetDryLayout(m_owner, padding, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *dry);
    EXPECT_EQ(m_owner.stats().dryLayouts, dryLayouts);
}

// 测试 14: 试算缓存失效时父节点也需要重新布局
TEST_F(LayoutTest, DryLayoutCacheInvalidationMarksParent)
{
    const auto root = make(RenderAlignBox(Alignment::TopLeft()));
    const auto leaf = make(RenderSolidBox(Vec2(30.0F, 20.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Tight(Vec2(100.0F, 100.0F)));
    flush();
    ASSERT_TRUE(node::IsRelayoutBoundary(m_owner, leaf));

    ASSERT_TRUE(layout::GetDryLayout(m_owner, leaf, BoxConstraints::Loose(Vec2(10.0F, 10.0F))).has_value());
    ASSERT_TRUE(layout::MarkNeedsLayout(m_owner, leaf).has_value());
    EXPECT_TRUE(node::NeedsLayout(m_owner, leaf));
    EXPECT_TRUE(node::NeedsLayout(m_owner, root));
}

// 测试 15: 由父约束决定尺寸的节点在 performLayout 中不得改变尺寸
TEST_F(LayoutTest, SizedByParentMustKeepResizedGeometry)
{
    const auto root = make(tests::RenderFickleBox());
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    EXPECT_THROW((void)m_owner.flushLayout(), ContractViolation);
    EXPECT_EQ(m_owner.phase(), Phase::IDLE);
}

// 测试 16: performLayout 必须设置尺寸
TEST_F(LayoutTest, LayoutMustSetGeometry)
{
    const auto root = make(tests::RenderForgetfulBox());
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    EXPECT_THROW((void)m_owner.flushLayout(), ContractViolation);
}

// 测试 17: 尺寸越界是契约违背，可通过配置关闭检查
TEST_F(LayoutTest, GeometryOutsideConstraintsIsRejected)
{
    const auto root = make(tests::RenderStubbornBox());
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    EXPECT_THROW((void)m_owner.flushLayout(), ContractViolation);

    globalcontext::PipelineConfig config;
    config.checkGeometry = false;
    PipelineOwner lenient(config);
    const auto lenientRoot = factory::Create(lenient, tests::RenderStubbornBox());
    ASSERT_TRUE(lenient.attachRoot(lenientRoot, BoxConstraints::Loose(Vec2(100.0F, 100.0F))).has_value());
    EXPECT_TRUE(lenient.flushLayout().has_value());
}

// 测试 18: 非法约束立即报错
TEST_F(LayoutTest, IllFormedConstraintsThrow)
{
    const auto root = make(RenderStack());
    EXPECT_THROW((void)m_owner.attachRoot(root, BoxConstraints{50.0F, 10.0F, 0.0F, 10.0F}), ContractViolation);

    const auto leaf = make(RenderSolidBox());
    EXPECT_THROW((void)layout::GetDryLayout(m_owner, leaf, BoxConstraints{-5.0F, 10.0F, 0.0F, 10.0F}),
                 ContractViolation);
}

// 测试 19: 视口需要有界约束
TEST_F(LayoutTest, ViewportRejectsUnboundedConstraints)
{
    const auto root = make(RenderFlex(Axis::VERTICAL));
    const auto viewport = make(RenderViewport(AxisDirection::DOWN));
    attach(root, viewport);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    EXPECT_THROW((void)m_owner.flushLayout(), ContractViolation);
}

// 测试 20: 直接布局要求节点已挂载且协议匹配
TEST_F(LayoutTest, DirectLayoutChecksNodeState)
{
    const auto detached = make(RenderSolidBox(Vec2(10.0F, 10.0F)));
    EXPECT_EQ(layout::LayoutNode(m_owner, detached, BoxConstraints{}).error(), TreeError::NodeDetached);

    const auto root = make(RenderSolidBox(Vec2(10.0F, 10.0F)));
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    EXPECT_EQ(layout::LayoutSliver(m_owner, root, SliverConstraints{}).error(), TreeError::WrongProtocol);

    auto size = layout::LayoutNode(m_owner, root, BoxConstraints::Loose(Vec2(5.0F, 50.0F)));
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, Vec2(5.0F, 10.0F));
}

// 测试 21: 切换收缩方式后按新方式确定尺寸
TEST_F(LayoutTest, SizedByParentChangeRelayoutsFromParent)
{
    const auto root = make(RenderAlignBox(Alignment::TopLeft()));
    const auto leaf = make(RenderSolidBox(Vec2(40.0F, 30.0F)));
    attach(root, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(200.0F, 200.0F)));
    flush();
    ASSERT_EQ(sizeOf(root), Vec2(200.0F, 200.0F));

    auto updated = node::Update<RenderAlignBox>(
        m_owner, root, [](RenderAlignBox& align) { align.shrinkWrap = true; }, node::Invalidation::SIZED_BY_PARENT);
    ASSERT_TRUE(updated.has_value());
    flush();
    EXPECT_EQ(sizeOf(root), Vec2(40.0F, 30.0F));
    EXPECT_FALSE(node::IsRelayoutBoundary(m_owner, leaf));
}

// 测试 22: 变换容器不改变尺寸
TEST_F(LayoutTest, TransformBoxPassesConstraintsThrough)
{
    const auto root = make(RenderStack());
    const auto transform = make(RenderTransformBox(MakeTransform2D(Vec2(5.0F, 5.0F), 0.0F, Vec2(2.0F, 2.0F))));
    const auto leaf = make(RenderSolidBox(Vec2(30.0F, 20.0F)));
    attach(root, transform);
    attach(transform, leaf);
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));
    flush();

    EXPECT_EQ(sizeOf(transform), Vec2(30.0F, 20.0F));
    EXPECT_EQ(offsetOf(leaf), Vec2(5.0F, 5.0F));
    auto global = node::ToGlobal(m_owner, leaf, Vec2(10.0F, 10.0F));
    ASSERT_TRUE(global.has_value());
    EXPECT_TRUE(global->isApprox(Vec2(25.0F, 25.0F)));
}

// 测试 23: 由父约束决定尺寸的节点只依赖约束，与子节点无关
TEST_F(LayoutTest, SizedByParentDependsOnlyOnConstraints)
{
    const auto root = make(RenderStack());
    const auto small = make(RenderAlignBox(Alignment::Center()));
    const auto large = make(RenderAlignBox(Alignment::Center()));
    attach(root, small);
    attach(root, large);
    attach(small, make(RenderSolidBox(Vec2(10.0F, 10.0F))));
    attach(large, make(RenderSolidBox(Vec2(90.0F, 60.0F))));
    attachRoot(root, BoxConstraints::Loose(Vec2(100.0F, 100.0F)));

    const auto resizes = m_owner.stats().resizes;
    flush();
    EXPECT_EQ(m_owner.stats().resizes, resizes + 2);
    EXPECT_EQ(sizeOf(small), Vec2(100.0F, 100.0F));
    EXPECT_EQ(sizeOf(large), sizeOf(small));
    EXPECT_TRUE(node::IsRelayoutBoundary(m_owner, small));

    // 再次以相同约束布局，尺寸不变
    ASSERT_TRUE(node::Invalidate(m_owner, small, node::Invalidation::LAYOUT).has_value());
    flush();
    EXPECT_EQ(m_owner.stats().resizes, resizes + 3);
    EXPECT_EQ(sizeOf(small), Vec2(100.0F, 100.0F));

    const auto loose = BoxConstraints::Loose(Vec2(100.0F, 100.0F));
    EXPECT_EQ(layout::GetDryLayout(m_owner, small, loose).value(), sizeOf(small));
    EXPECT_EQ(layout::GetDryLayout(m_owner, large, loose).value(), sizeOf(small));
}
