#include "PipelineOwner.hpp"

#include <algorithm>
#include <vector>
#include "../api/Hierarchy.hpp"
#include "../common/Components.hpp"
#include "../common/Tags.hpp"
#include "../singleton/Logger.hpp"
#include "../systems/LayoutSystem.hpp"
#include "../systems/PaintSystem.hpp"

namespace render
{
namespace
{
std::vector<entt::entity> SortedByDepth(const entt::registry& registry,
                                        std::unordered_set<entt::entity>& nodes,
                                        bool shallowFirst)
{
    std::vector<entt::entity> batch(nodes.begin(), nodes.end());
    nodes.clear();
    auto depthOf = [&registry](entt::entity node)
    {
        const auto* hierarchy = registry.valid(node) ? registry.try_get<components::Hierarchy>(node) : nullptr;
        return hierarchy != nullptr ? hierarchy->depth : 0U;
    };
    std::ranges::sort(batch,
                      [&](entt::entity lhs, entt::entity rhs)
                      { return shallowFirst ? depthOf(lhs) < depthOf(rhs) : depthOf(lhs) > depthOf(rhs); });
    return batch;
}
} // namespace

PipelineOwner::PassGuard::~PassGuard()
{
    if (m_owner != nullptr)
    {
        m_owner->m_phase = Phase::IDLE;
    }
}

PipelineOwner::PipelineOwner(globalcontext::PipelineConfig config)
{
    if (config.logLevel != globalcontext::PipelineConfig{}.logLevel)
    {
        Logger::setLevel(config.logLevel);
    }
    m_registry.ctx().emplace<globalcontext::PipelineConfig>(config);
    m_registry.ctx().emplace<globalcontext::FrameStats>();

    m_dispatcher.sink<events::AttachChildRequest>().connect<&PipelineOwner::onAttachChildRequest>(*this);
    m_dispatcher.sink<events::DropChildRequest>().connect<&PipelineOwner::onDropChildRequest>(*this);
    m_dispatcher.sink<events::ReplaceChildRequest>().connect<&PipelineOwner::onReplaceChildRequest>(*this);
    m_dispatcher.sink<events::DestroyNodeRequest>().connect<&PipelineOwner::onDestroyNodeRequest>(*this);
}

PipelineOwner::~PipelineOwner()
{
    m_dispatcher.disconnect(*this);
    m_dispatcher.clear();
}

const globalcontext::PipelineConfig& PipelineOwner::config() const
{
    return m_registry.ctx().get<globalcontext::PipelineConfig>();
}

globalcontext::FrameStats& PipelineOwner::stats()
{
    return m_registry.ctx().get<globalcontext::FrameStats>();
}

const globalcontext::FrameStats& PipelineOwner::stats() const
{
    return m_registry.ctx().get<globalcontext::FrameStats>();
}

// ===================== 根节点 =====================

std::expected<void, TreeError> PipelineOwner::attachRoot(entt::entity root, const BoxConstraints& constraints)
{
    if (isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (!m_registry.valid(root)) return std::unexpected(TreeError::InvalidNode);
    if (!m_registry.all_of<components::RenderObject<BoxConstraints>>(root))
    {
        return std::unexpected(TreeError::WrongProtocol);
    }
    if (m_root != entt::null || m_registry.get<components::Hierarchy>(root).parent != entt::null)
    {
        return std::unexpected(TreeError::AlreadyAttached);
    }
    if (!constraints.isNormalized()) [[unlikely]]
    {
        Logger::error("Root constraints {} are ill-formed", constraints.toString());
        throw ContractViolation("root constraints are not normalized");
    }

    m_root = root;
    m_rootConstraints = constraints;
    m_registry.emplace_or_replace<components::RootTag>(root);
    hierarchy::RefreshSubtree(*this, root, 0, true);

    // 首次布局：根是自己的重新布局边界
    m_registry.emplace_or_replace<components::LayoutDirtyTag>(root);
    requestLayout(root);
    systems::PaintSystem::scheduleSubtree(*this, root);
    if (!m_registry.all_of<components::PaintDirtyTag>(root))
    {
        systems::PaintSystem::markNeedsPaint(*this, root);
    }
    Logger::info("Attached root node {} with {}", entt::to_integral(root), constraints.toString());
    return {};
}

std::expected<void, TreeError> PipelineOwner::detachRoot()
{
    if (isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (m_root == entt::null) return std::unexpected(TreeError::NoRoot);

    hierarchy::RefreshSubtree(*this, m_root, 0, false);
    m_registry.remove<components::RootTag>(m_root);
    m_nodesNeedingLayout.clear();
    m_nodesNeedingPaint.clear();
    Logger::info("Detached root node {}", entt::to_integral(m_root));
    m_root = entt::null;
    return {};
}

std::expected<void, TreeError> PipelineOwner::setRootConstraints(const BoxConstraints& constraints)
{
    if (isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (m_root == entt::null) return std::unexpected(TreeError::NoRoot);
    if (!constraints.isNormalized()) [[unlikely]]
    {
        Logger::error("Root constraints {} are ill-formed", constraints.toString());
        throw ContractViolation("root constraints are not normalized");
    }
    if (constraints == m_rootConstraints) return {};

    m_rootConstraints = constraints;
    systems::LayoutSystem::markNeedsLayout(*this, m_root);
    return {};
}

bool PipelineOwner::isAttached(entt::entity node) const
{
    return m_registry.valid(node) && m_registry.all_of<components::AttachedTag>(node);
}

// ===================== 脏节点集合 =====================

void PipelineOwner::requestLayout(entt::entity node)
{
    if (!isAttached(node)) return;
    if (m_nodesNeedingLayout.empty() && m_nodesNeedingPaint.empty())
    {
        notifyNeedVisualUpdate();
    }
    m_nodesNeedingLayout.insert(node);
}

void PipelineOwner::requestPaint(entt::entity node)
{
    if (!isAttached(node)) return;
    if (m_nodesNeedingLayout.empty() && m_nodesNeedingPaint.empty())
    {
        notifyNeedVisualUpdate();
    }
    m_nodesNeedingPaint.insert(node);
}

void PipelineOwner::forget(entt::entity node)
{
    m_nodesNeedingLayout.erase(node);
    m_nodesNeedingPaint.erase(node);
}

bool PipelineOwner::isLive(entt::entity node) const
{
    return isAttached(node);
}

bool PipelineOwner::hasPendingLayout() const
{
    return std::ranges::any_of(m_nodesNeedingLayout,
                               [this](entt::entity node)
                               { return isLive(node) && m_registry.all_of<components::LayoutDirtyTag>(node); });
}

void PipelineOwner::notifyNeedVisualUpdate()
{
    if (m_onNeedVisualUpdate)
    {
        m_onNeedVisualUpdate();
    }
}

// ===================== pass =====================

std::expected<PipelineOwner::PassGuard, TreeError> PipelineOwner::beginPass(Phase phase)
{
    if (isPassActive())
    {
        Logger::warn("Cannot start a new pass while another pass is active");
        return std::unexpected(TreeError::PassInProgress);
    }
    m_phase = phase;
    return PassGuard(this);
}

// ===================== 帧 =====================

std::expected<void, TreeError> PipelineOwner::flushLayout()
{
    if (isPassActive()) return std::unexpected(TreeError::PassInProgress);

    auto& frameStats = stats();
    const uint32_t maxIterations = config().maxLayoutIterations;
    // 每个脏批次都计入迭代次数，包括布局中互相标脏产生的批次
    uint32_t iterations = 0;
    auto notConverged = [&]()
    {
        Logger::warn("Layout did not converge after {} iterations, {} nodes still dirty",
                     maxIterations,
                     m_nodesNeedingLayout.size());
        return std::unexpected(TreeError::LayoutNotConverged);
    };

    while (!m_nodesNeedingLayout.empty() || m_pendingRequests > 0)
    {
        {
            auto guard = beginPass(Phase::LAYOUT);
            if (!guard) return std::unexpected(guard.error());

            while (!m_nodesNeedingLayout.empty())
            {
                if (++iterations > maxIterations) return notConverged();

                const auto batch = SortedByDepth(m_registry, m_nodesNeedingLayout, true);
                Logger::debug("Layout pass over {} dirty boundaries", batch.size());
                for (const auto node : batch)
                {
                    if (!isLive(node))
                    {
                        ++frameStats.staleEntries;
                        Logger::debug("Skipping stale layout entry {}", entt::to_integral(node));
                        continue;
                    }
                    if (!m_registry.all_of<components::LayoutDirtyTag>(node)) continue;
                    systems::LayoutSystem::relayout(*this, node);
                }
            }
        }
        if (m_pendingRequests > 0 && iterations >= maxIterations) return notConverged();
        drainDeferred();
    }
    ++frameStats.layoutFlushes;
    return {};
}

std::expected<void, TreeError> PipelineOwner::flushPaint()
{
    if (isPassActive()) return std::unexpected(TreeError::PassInProgress);
    if (hasPendingLayout()) return std::unexpected(TreeError::LayoutPending);

    auto& frameStats = stats();
    {
        auto guard = beginPass(Phase::PAINT);
        if (!guard) return std::unexpected(guard.error());

        const auto batch = SortedByDepth(m_registry, m_nodesNeedingPaint, false);
        for (const auto node : batch)
        {
            if (!isLive(node))
            {
                ++frameStats.staleEntries;
                continue;
            }
            if (!m_registry.all_of<components::PaintDirtyTag>(node)) continue;
            systems::PaintSystem::paintBoundary(*this, node);
        }
    }
    drainDeferred();
    return {};
}

// ===================== 延迟变更 =====================

void PipelineOwner::drainDeferred()
{
    if (m_pendingRequests == 0 || isPassActive()) return;
    Logger::debug("Applying {} deferred tree mutations", m_pendingRequests);
    m_pendingRequests = 0;
    m_dispatcher.update();
}

void PipelineOwner::onAttachChildRequest(const events::AttachChildRequest& request)
{
    if (auto result = hierarchy::InsertChild(*this, request.parent, request.child, request.index); !result)
    {
        Logger::error("Deferred attach of {} under {} failed: {}",
                      entt::to_integral(request.child),
                      entt::to_integral(request.parent),
                      ToString(result.error()));
    }
}

void PipelineOwner::onDropChildRequest(const events::DropChildRequest& request)
{
    if (auto result = hierarchy::DropChild(*this, request.parent, request.child); !result)
    {
        Logger::error("Deferred drop of {} from {} failed: {}",
                      entt::to_integral(request.child),
                      entt::to_integral(request.parent),
                      ToString(result.error()));
    }
}

void PipelineOwner::onReplaceChildRequest(const events::ReplaceChildRequest& request)
{
    if (auto result = hierarchy::ReplaceChild(*this, request.parent, request.child, request.replacement); !result)
    {
        Logger::error("Deferred replacement of {} under {} failed: {}",
                      entt::to_integral(request.child),
                      entt::to_integral(request.parent),
                      ToString(result.error()));
    }
}

void PipelineOwner::onDestroyNodeRequest(const events::DestroyNodeRequest& request)
{
    if (auto result = hierarchy::DestroyNode(*this, request.node); !result)
    {
        Logger::error("Deferred destruction of {} failed: {}", entt::to_integral(request.node), ToString(result.error()));
    }
}

} // namespace render
