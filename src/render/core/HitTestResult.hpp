/**
 * ************************************************************************
 *
 * @file HitTestResult.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 命中测试结果
 *
 * 命中路径按"最内层 / 最上层优先"的顺序累积，事件分发依赖这个顺序。
 * 每个条目记录全局坐标到该节点局部坐标的变换：transform * global == localPosition。
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include <entt/entt.hpp>
#include "../common/Types.hpp"

namespace render
{

struct HitTestEntry
{
    entt::entity target = entt::null;
    Vec2 localPosition{0.0F, 0.0F};
    Transform2D transform = Transform2D::Identity(); // 全局 -> 局部
};

class HitTestResult
{
public:
    HitTestResult() = default;

    [[nodiscard]] const std::vector<HitTestEntry>& path() const { return m_path; }
    [[nodiscard]] bool empty() const { return m_path.empty(); }
    [[nodiscard]] std::size_t size() const { return m_path.size(); }
    [[nodiscard]] const HitTestEntry& front() const { return m_path.front(); }

    /**
     * @brief 路径中的节点，顺序同 path()
     */
    [[nodiscard]] std::vector<entt::entity> targets() const;

    [[nodiscard]] bool contains(entt::entity target) const;

    /**
     * @brief 追加条目，变换取当前栈顶
     */
    void add(entt::entity target, const Vec2& localPosition);

    /**
     * @brief 当前累积的 全局 -> 局部 变换
     */
    [[nodiscard]] Transform2D currentTransform() const;

    /**
     * @brief 进入子坐标系：step 把父局部坐标映射到子局部坐标
     */
    void pushTransform(const Transform2D& step);
    void popTransform();

    /**
     * @brief 以绘制偏移进入子节点，child = parent - offset
     */
    template <typename HitTest>
    bool addWithPaintOffset(const Vec2& offset, const Vec2& position, HitTest&& hitTest)
    {
        pushTransform(MakeTranslation(-offset));
        const bool isHit = std::forward<HitTest>(hitTest)(*this, Vec2(position - offset));
        popTransform();
        return isHit;
    }

    /**
     * @brief 以绘制变换进入子节点，transform 把子坐标映射到父坐标
     *
     * 变换不可逆（例如缩放为 0）时子节点不可能被命中，直接返回 false。
     */
    template <typename HitTest>
    bool addWithPaintTransform(const Transform2D& transform, const Vec2& position, HitTest&& hitTest)
    {
        const auto inverse = InvertPaintTransform(transform);
        if (!inverse) return false;
        pushTransform(*inverse);
        const bool isHit = std::forward<HitTest>(hitTest)(*this, Vec2(*inverse * position));
        popTransform();
        return isHit;
    }

    /**
     * @brief 绘制变换的逆，不可逆时为空
     */
    static std::optional<Transform2D> InvertPaintTransform(const Transform2D& transform);

private:
    std::vector<HitTestEntry> m_path;
    std::vector<Transform2D> m_transforms; // 累积变换栈
};

} // namespace render
