/**
 * ************************************************************************
 *
 * @file PipelineOwner.hpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-02-03
 * @version 0.1
 * @brief 渲染管线所有者
 *
 * 一棵渲染树一个 PipelineOwner，没有全局状态：
    - 持有 entt::registry（节点存储）与 entt::dispatcher（延迟变更队列）
    - 维护需要布局 / 需要绘制的脏节点集合
    - flushLayout 按深度由浅到深处理重新布局边界
    - flushPaint 按深度由深到浅处理绘制边界
    - 同一时刻只允许一个 pass（布局 / 绘制 / 命中测试）
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */

#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <unordered_set>
#include <utility>
#include <entt/entt.hpp>
#include "../common/Constraints.hpp"
#include "../common/Errors.hpp"
#include "../common/Events.hpp"
#include "../common/GlobalContext.hpp"
#include "../common/RenderTypes.hpp"
#include "../traits/EventTraits.hpp"

namespace render
{

enum class Phase : uint8_t
{
    IDLE,
    LAYOUT,
    PAINT,
    HIT_TEST
};

class PipelineOwner
{
public:
    /**
     * @brief 活动 pass 的守卫，析构时回到 IDLE
     */
    class PassGuard
    {
    public:
        PassGuard(PassGuard&& other) noexcept : m_owner(std::exchange(other.m_owner, nullptr)) {}
        PassGuard& operator=(PassGuard&&) = delete;
        PassGuard(const PassGuard&) = delete;
        PassGuard& operator=(const PassGuard&) = delete;
        ~PassGuard();

    private:
        friend class PipelineOwner;
        explicit PassGuard(PipelineOwner* owner) : m_owner(owner) {}
        PipelineOwner* m_owner;
    };

    explicit PipelineOwner(globalcontext::PipelineConfig config = {});
    ~PipelineOwner();

    PipelineOwner(const PipelineOwner&) = delete;
    PipelineOwner& operator=(const PipelineOwner&) = delete;
    PipelineOwner(PipelineOwner&&) = delete;
    PipelineOwner& operator=(PipelineOwner&&) = delete;

    [[nodiscard]] entt::registry& registry() { return m_registry; }
    [[nodiscard]] const entt::registry& registry() const { return m_registry; }

    // ===================== 根节点 =====================

    /**
     * @brief 把无父节点的盒节点安装为根，并安排首次布局
     */
    std::expected<void, TreeError> attachRoot(entt::entity root, const BoxConstraints& constraints);

    /**
     * @brief 卸下根节点，子树保留但不再挂载
     */
    std::expected<void, TreeError> detachRoot();

    std::expected<void, TreeError> setRootConstraints(const BoxConstraints& constraints);

    [[nodiscard]] entt::entity root() const { return m_root; }
    [[nodiscard]] const BoxConstraints& rootConstraints() const { return m_rootConstraints; }
    [[nodiscard]] bool isAttached(entt::entity node) const;

    // ===================== 脏节点集合 =====================

    /**
     * @brief 登记需要布局的重新布局边界（去重）
     */
    void requestLayout(entt::entity node);

    /**
     * @brief 登记需要重绘的绘制边界（去重）
     */
    void requestPaint(entt::entity node);

    /**
     * @brief 节点销毁时移除其脏集合条目
     */
    void forget(entt::entity node);

    /**
     * @brief 是否还有有效的待布局节点
     */
    [[nodiscard]] bool hasPendingLayout() const;

    [[nodiscard]] const std::unordered_set<entt::entity>& nodesNeedingLayout() const { return m_nodesNeedingLayout; }
    [[nodiscard]] const std::unordered_set<entt::entity>& nodesNeedingPaint() const { return m_nodesNeedingPaint; }

    // ===================== 帧 =====================

    std::expected<void, TreeError> flushLayout();
    std::expected<void, TreeError> flushPaint();

    void setPainter(Painter painter) { m_painter = std::move(painter); }
    [[nodiscard]] const Painter& painter() const { return m_painter; }

    /**
     * @brief 一帧中首个脏节点登记时回调，用于安排下一帧
     */
    void setOnNeedVisualUpdate(std::function<void()> callback) { m_onNeedVisualUpdate = std::move(callback); }

    // ===================== pass =====================

    [[nodiscard]] Phase phase() const { return m_phase; }
    [[nodiscard]] bool isPassActive() const { return m_phase != Phase::IDLE; }

    /**
     * @brief 进入 pass，已有活动 pass 时返回 PassInProgress
     */
    [[nodiscard]] std::expected<PassGuard, TreeError> beginPass(Phase phase);

    // ===================== 延迟变更 =====================

    template <traits::DeferredRequest Request>
    void enqueue(Request&& request)
    {
        m_dispatcher.enqueue(std::forward<Request>(request));
        ++m_pendingRequests;
    }

    /**
     * @brief 执行排队的变更请求（pass 结束后调用）
     */
    void drainDeferred();

    [[nodiscard]] std::size_t pendingRequests() const { return m_pendingRequests; }

    // ===================== 配置与统计 =====================

    [[nodiscard]] const globalcontext::PipelineConfig& config() const;
    [[nodiscard]] globalcontext::FrameStats& stats();
    [[nodiscard]] const globalcontext::FrameStats& stats() const;

private:
    void onAttachChildRequest(const events::AttachChildRequest& request);
    void onDropChildRequest(const events::DropChildRequest& request);
    void onReplaceChildRequest(const events::ReplaceChildRequest& request);
    void onDestroyNodeRequest(const events::DestroyNodeRequest& request);

    void notifyNeedVisualUpdate();
    bool isLive(entt::entity node) const;

    entt::registry m_registry;
    entt::dispatcher m_dispatcher;
    std::unordered_set<entt::entity> m_nodesNeedingLayout;
    std::unordered_set<entt::entity> m_nodesNeedingPaint;
    entt::entity m_root = entt::null;
    BoxConstraints m_rootConstraints;
    Phase m_phase = Phase::IDLE;
    Painter m_painter;
    std::function<void()> m_onNeedVisualUpdate;
    std::size_t m_pendingRequests = 0;
};

} // namespace render
