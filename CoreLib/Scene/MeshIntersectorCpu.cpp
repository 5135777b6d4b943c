#include "MeshIntersectorCpu.hpp"

#include <limits>

#include "CoreUtilities.hpp"

void MeshIntersectorCpu::build(const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices)
{
    m_positions = positions;
    m_indices   = indices;

    m_boundsMin = glm::vec3(std::numeric_limits<float>::max());
    m_boundsMax = glm::vec3(std::numeric_limits<float>::lowest());
    for (const glm::vec3& p : m_positions)
    {
        m_boundsMin = glm::min(m_boundsMin, p);
        m_boundsMax = glm::max(m_boundsMax, p);
    }

    m_built = true;
}

bool MeshIntersectorCpu::built() const noexcept
{
    return m_built;
}

std::optional<float> MeshIntersectorCpu::intersect(const un::ray& ray) const
{
    if (!m_built)
        throw un::core_exception("MeshIntersectorCpu::intersect called before build");

    if (m_indices.empty())
        return std::nullopt;

    float boxT = 0.0f;
    if (!un::ray_box_intersect(ray, m_boundsMin, m_boundsMax, boxT))
        return std::nullopt;

    float best  = std::numeric_limits<float>::max();
    bool  found = false;

    for (std::size_t i = 0; i + 2 < m_indices.size(); i += 3)
    {
        float t = 0.0f;
        if (un::ray_triangle_intersect(ray,
                                       m_positions[m_indices[i]],
                                       m_positions[m_indices[i + 1]],
                                       m_positions[m_indices[i + 2]],
                                       t) &&
            t < best)
        {
            best  = t;
            found = true;
        }
    }

    if (!found)
        return std::nullopt;

    return best;
}
