#include "HitTestResult.hpp"

#include <algorithm>
#include <cmath>

namespace render
{

std::vector<entt::entity> HitTestResult::targets() const
{
    std::vector<entt::entity> result;
    result.reserve(m_path.size());
    for (const auto& entry : m_path)
    {
        result.push_back(entry.target);
    }
    return result;
}

bool HitTestResult::contains(entt::entity target) const
{
    return std::ranges::any_of(m_path, [target](const HitTestEntry& entry) { return entry.target == target; });
}

void HitTestResult::add(entt::entity target, const Vec2& localPosition)
{
    m_path.push_back(HitTestEntry{target, localPosition, currentTransform()});
}

Transform2D HitTestResult::currentTransform() const
{
    return m_transforms.empty() ? Transform2D::Identity() : m_transforms.back();
}

void HitTestResult::pushTransform(const Transform2D& step)
{
    m_transforms.push_back(step * currentTransform());
}

void HitTestResult::popTransform()
{
    if (!m_transforms.empty())
    {
        m_transforms.pop_back();
    }
}

std::optional<Transform2D> HitTestResult::InvertPaintTransform(const Transform2D& transform)
{
    const float determinant = transform.linear().determinant();
    if (!std::isfinite(determinant) || std::abs(determinant) < 1e-9F)
    {
        return std::nullopt;
    }
    return transform.inverse(Eigen::Affine);
}

} // namespace render
