#include "SceneMesh.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

SceneMesh::SceneMesh(ObjectId id, std::unique_ptr<MeshIntersector> intersector) :
    SceneObject{id},
    m_intersector{std::move(intersector)}
{
    if (!m_intersector)
        throw un::core_exception("SceneMesh requires a mesh intersector");
}

SceneMesh::~SceneMesh()
{
}

void SceneMesh::geometry(std::vector<glm::vec3> positions, std::vector<uint32_t> indices)
{
    if (indices.size() % 3 != 0)
        throw un::core_exception("SceneMesh: index count " + std::to_string(indices.size()) +
                                 " is not a multiple of 3");

    for (uint32_t index : indices)
    {
        if (index >= positions.size())
            throw un::core_exception("SceneMesh: index " + std::to_string(index) +
                                     " out of range for " + std::to_string(positions.size()) + " positions");
    }

    m_positions = std::move(positions);
    m_indices   = std::move(indices);

    // Local sphere: box center, radius to the farthest vertex.
    if (m_positions.empty())
    {
        m_localCenter = glm::vec3(0.0f);
        m_localRadius = 0.0f;
    }
    else
    {
        glm::vec3 bmin(std::numeric_limits<float>::max());
        glm::vec3 bmax(std::numeric_limits<float>::lowest());
        for (const glm::vec3& p : m_positions)
        {
            bmin = glm::min(bmin, p);
            bmax = glm::max(bmax, p);
        }

        m_localCenter = (bmin + bmax) * 0.5f;

        float r2 = 0.0f;
        for (const glm::vec3& p : m_positions)
            r2 = std::max(r2, glm::length2(p - m_localCenter));
        m_localRadius = std::sqrt(r2);
    }

    m_intersector->build(m_positions, m_indices);
}

const std::vector<glm::vec3>& SceneMesh::positions() const noexcept
{
    return m_positions;
}

const std::vector<uint32_t>& SceneMesh::indices() const noexcept
{
    return m_indices;
}

std::size_t SceneMesh::triangleCount() const noexcept
{
    return m_indices.size() / 3;
}

const MeshIntersector* SceneMesh::intersector() const noexcept
{
    return m_intersector.get();
}

std::optional<BoundingSphere> SceneMesh::boundingSphere() const
{
    if (m_indices.empty())
        return std::nullopt;

    const glm::mat4& mtx   = model();
    const float      scale = std::max({glm::length(glm::vec3(mtx[0])),
                                       glm::length(glm::vec3(mtx[1])),
                                       glm::length(glm::vec3(mtx[2]))});

    BoundingSphere sphere;
    sphere.center = glm::vec3(mtx * glm::vec4(m_localCenter, 1.0f));
    sphere.radius = m_localRadius * scale;

    if (!sphere.valid())
        return std::nullopt;

    return sphere;
}

std::optional<un::ray_hit> SceneMesh::raycast(const un::ray& ray) const
{
    if (m_indices.empty())
        return std::nullopt;

    // Affine transforms keep the ray parameter, so t found in local space
    // addresses the same point on the world ray.
    const glm::mat4 invModel = glm::inverse(model());

    un::ray local = {};
    local.org     = glm::vec3(invModel * glm::vec4(ray.org, 1.0f));
    local.dir     = glm::vec3(invModel * glm::vec4(ray.dir, 0.0f));
    local.inv     = 1.0f / local.dir;
    local.eye     = ray.eye;

    if (!un::is_finite(local.org) || !un::is_finite(local.dir) || un::is_zero(local.dir))
        return std::nullopt;

    const std::optional<float> t = m_intersector->intersect(local);
    if (!t)
        return std::nullopt;

    un::ray_hit hit;
    hit.point = un::ray_point(ray, *t);
    hit.dist  = *t * glm::length(ray.dir);
    return hit;
}
