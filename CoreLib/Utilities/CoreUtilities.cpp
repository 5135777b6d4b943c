#include "CoreUtilities.hpp"

#include <limits>

namespace un
{
    bool ray_sphere_intersect(const ray&       r,
                              const glm::vec3& center,
                              float            radius,
                              float&           out_t) noexcept
    {
        // Solve |org + t*dir - center|^2 = radius^2 for the forward half-line.
        const glm::vec3 oc = r.org - center;

        const float a = glm::dot(r.dir, r.dir);
        const float b = glm::dot(oc, r.dir);
        const float c = glm::dot(oc, oc) - radius * radius;

        if (a <= 0.0f || !std::isfinite(a))
            return false;

        const float disc = b * b - a * c;
        if (disc < 0.0f)
            return false;

        const float sq   = std::sqrt(disc);
        const float tFar = (-b + sq) / a;
        if (tFar < 0.0f)
            return false; // sphere is behind the origin

        const float tNear = (-b - sq) / a;
        out_t             = std::max(tNear, 0.0f);
        return true;
    }

    bool ray_box_intersect(const ray&       r,
                           const glm::vec3& bmin,
                           const glm::vec3& bmax,
                           float&           out_t) noexcept
    {
        constexpr float EPS = 1e-12f;

        float tMin = 0.0f;
        float tMax = std::numeric_limits<float>::max();

        for (int axis = 0; axis < 3; ++axis)
        {
            const float o = r.org[axis];
            const float d = r.dir[axis];

            if (std::fabs(d) < EPS)
            {
                // Parallel to the slab: must start inside it.
                if (o < bmin[axis] || o > bmax[axis])
                    return false;
                continue;
            }

            const float inv = 1.0f / d;
            float       t0  = (bmin[axis] - o) * inv;
            float       t1  = (bmax[axis] - o) * inv;
            if (t0 > t1)
                std::swap(t0, t1);

            tMin = std::max(tMin, t0);
            tMax = std::min(tMax, t1);
            if (tMin > tMax)
                return false;
        }

        out_t = tMin;
        return true;
    }

    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept
    {
        constexpr float EPS = 1e-7f;

        const glm::vec3 e1  = b - a;
        const glm::vec3 e2  = c - a;
        const glm::vec3 p   = glm::cross(r.dir, e2);
        const float     det = glm::dot(e1, p);

        if (std::fabs(det) < EPS)
            return false;

        const float     invDet = 1.0f / det;
        const glm::vec3 tvec   = r.org - a;
        const float     u      = glm::dot(tvec, p) * invDet;
        if (u < 0.0f || u > 1.0f)
            return false;

        const glm::vec3 q = glm::cross(tvec, e1);
        const float     v = glm::dot(r.dir, q) * invDet;
        if (v < 0.0f || u + v > 1.0f)
            return false;

        const float t = glm::dot(e2, q) * invDet;
        if (t < 0.0f)
            return false;

        out_t = t;
        return true;
    }

} // namespace un
