#include "SceneSphere.hpp"

#include <algorithm>
#include <cmath>

namespace
{
    float maxAxisScale(const glm::mat4& m) noexcept
    {
        return std::max({glm::length(glm::vec3(m[0])),
                         glm::length(glm::vec3(m[1])),
                         glm::length(glm::vec3(m[2]))});
    }
} // namespace

SceneSphere::SceneSphere(ObjectId id, float radius) noexcept : SceneObject{id}, m_radius{radius}
{
}

float SceneSphere::radius() const noexcept
{
    return m_radius;
}

void SceneSphere::radius(float value) noexcept
{
    m_radius = value;
}

std::optional<BoundingSphere> SceneSphere::boundingSphere() const
{
    BoundingSphere sphere;
    sphere.center = worldPosition();
    sphere.radius = m_radius * maxAxisScale(model());

    if (!sphere.valid())
        return std::nullopt;

    return sphere;
}

std::optional<un::ray_hit> SceneSphere::raycast(const un::ray& ray) const
{
    const auto sphere = boundingSphere();
    if (!sphere)
        return std::nullopt;

    const glm::vec3 oc = ray.org - sphere->center;
    const float     a  = glm::dot(ray.dir, ray.dir);
    const float     b  = glm::dot(oc, ray.dir);
    const float     c  = glm::dot(oc, oc) - sphere->radius * sphere->radius;

    if (a <= 0.0f)
        return std::nullopt;

    const float disc = b * b - a * c;
    if (disc < 0.0f)
        return std::nullopt;

    const float sq = std::sqrt(disc);
    float       t  = (-b - sq) / a;
    if (t < 0.0f)
        t = (-b + sq) / a;
    if (t < 0.0f)
        return std::nullopt;

    un::ray_hit hit;
    hit.dist  = t * std::sqrt(a);
    hit.point = un::ray_point(ray, t);
    return hit;
}
