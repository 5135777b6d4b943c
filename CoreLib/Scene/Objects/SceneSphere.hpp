#pragma once

#include "SceneObject.hpp"

/**
 * @brief Analytic sphere centered on the object origin.
 *
 * The world radius is the local radius scaled by the largest axis scale of
 * the model matrix, so non-uniform scale yields a conservative sphere.
 */
class SceneSphere final : public SceneObject
{
public:
    SceneSphere(ObjectId id, float radius) noexcept;

    [[nodiscard]] SceneObjectType type() const noexcept override { return SceneObjectType::Sphere; }

    [[nodiscard]] float radius() const noexcept;
    void                radius(float value) noexcept;

    [[nodiscard]] std::optional<BoundingSphere> boundingSphere() const override;

    /**
     * @brief Front-surface hit; from inside the sphere the exit point is reported.
     */
    [[nodiscard]] std::optional<un::ray_hit> raycast(const un::ray& ray) const override;

private:
    float m_radius;
};
