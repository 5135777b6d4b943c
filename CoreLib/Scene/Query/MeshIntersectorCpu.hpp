#pragma once

#include <vector>

#include "MeshIntersector.hpp"

/**
 * @brief CPU-based implementation of MeshIntersector.
 *
 * Tests every triangle after a bounding box early-out. Good enough for the
 * small meshes typically used as pointer targets.
 */
class MeshIntersectorCpu final : public MeshIntersector
{
public:
    MeshIntersectorCpu()           = default;
    ~MeshIntersectorCpu() override = default;

    [[nodiscard]] std::string_view name() const noexcept override { return "Cpu"; }

    void build(const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices) override;

    [[nodiscard]] bool built() const noexcept override;

    [[nodiscard]] std::optional<float> intersect(const un::ray& ray) const override;

private:
    std::vector<glm::vec3> m_positions;
    std::vector<uint32_t>  m_indices;
    glm::vec3              m_boundsMin{0.0f};
    glm::vec3              m_boundsMax{0.0f};
    bool                   m_built = false;
};
