#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace un
{
    struct ray;
} // namespace un

/**
 * @brief Abstract base class for exact ray/triangle-mesh intersection.
 *
 * Implementations can use plain CPU traversal, Embree, etc. SceneMesh only
 * talks to this interface and always hands it rays in mesh-local space.
 */
class MeshIntersector
{
public:
    virtual ~MeshIntersector() = default;

    /// Backend name as registered in the intersector factory.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Rebuilds acceleration data for a triangle list.
     *
     * @p indices holds three entries per triangle, each a valid index into
     * @p positions. Callers validate the buffers first.
     */
    virtual void build(const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices) = 0;

    /// True once build() has been called.
    [[nodiscard]] virtual bool built() const noexcept = 0;

    /**
     * @brief Closest hit parameter t along @p ray (point = org + dir * t).
     *
     * The ray direction need not be normalized. Throws if the intersector
     * was never built.
     */
    [[nodiscard]] virtual std::optional<float> intersect(const un::ray& ray) const = 0;

protected:
    MeshIntersector() = default;
};
