#pragma once

#include <cstdint>
#include <glm/glm.hpp>

#include "CoreTypes.hpp"
#include "CoreUtilities.hpp"

/**
 * @brief World-space bounding sphere used for cheap ray pre-filtering.
 */
struct BoundingSphere
{
    glm::vec3 center{0.0f};
    float     radius = 0.0f;

    [[nodiscard]] bool valid() const noexcept
    {
        return radius >= 0.0f && std::isfinite(radius) && un::is_finite(center);
    }

    /**
     * @brief Tests the sphere against the forward half of @p ray.
     * @param out_t Entry distance along the ray, 0 when the origin is inside.
     */
    [[nodiscard]] bool intersects(const un::ray& ray, float& out_t) const noexcept
    {
        return un::ray_sphere_intersect(ray, center, radius, out_t);
    }

    bool operator==(const BoundingSphere& other) const noexcept = default;
};
