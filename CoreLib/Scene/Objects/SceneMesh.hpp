#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "MeshIntersector.hpp"
#include "SceneObject.hpp"

/**
 * @brief Scene object with a triangle mesh as its pick geometry.
 *
 * SceneMesh keeps the CPU triangle list, its local bounding sphere and a
 * MeshIntersector backend that resolves exact hits. Rays are transformed
 * into mesh-local space before they reach the intersector.
 */
class SceneMesh final : public SceneObject
{
public:
    /**
     * @brief Constructs an empty mesh.
     * @param intersector Exact-hit backend; must not be null.
     */
    SceneMesh(ObjectId id, std::unique_ptr<MeshIntersector> intersector);

    /** @brief Destroys the SceneMesh and owned resources. */
    ~SceneMesh() override;

    /** @copydoc SceneObject::type */
    [[nodiscard]] SceneObjectType type() const noexcept override { return SceneObjectType::Mesh; }

    /**
     * @brief Replaces the triangle list and rebuilds the intersector.
     *
     * Throws if @p indices is not a multiple of three or references a
     * position out of range.
     */
    void geometry(std::vector<glm::vec3> positions, std::vector<uint32_t> indices);

    [[nodiscard]] const std::vector<glm::vec3>& positions() const noexcept;
    [[nodiscard]] const std::vector<uint32_t>&  indices() const noexcept;
    [[nodiscard]] std::size_t                   triangleCount() const noexcept;

    [[nodiscard]] const MeshIntersector* intersector() const noexcept;

    /** @copydoc SceneObject::boundingSphere */
    [[nodiscard]] std::optional<BoundingSphere> boundingSphere() const override;

    /** @copydoc SceneObject::raycast */
    [[nodiscard]] std::optional<un::ray_hit> raycast(const un::ray& ray) const override;

private:
    std::vector<glm::vec3>           m_positions;
    std::vector<uint32_t>            m_indices;
    std::unique_ptr<MeshIntersector> m_intersector;

    glm::vec3 m_localCenter{0.0f};
    float     m_localRadius = 0.0f;
};
