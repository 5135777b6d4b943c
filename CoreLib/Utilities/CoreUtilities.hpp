#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <glm/ext/scalar_constants.hpp>
#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Small utilities for vector checks, rays, and intersections.
 *
 * Helpers here are lightweight wrappers around GLM or simple algorithms used
 * by the spatial index, the hit tester and the scene objects.
 */
namespace un
{

    /**
     * @brief Which eye a ray was generated for.
     * @ingroup MathUtils
     *
     * Stereo VR cameras produce one picking ray per eye; desktop cameras
     * and controllers produce mono rays.
     */
    enum class ray_eye : uint8_t
    {
        Mono,
        Left,
        Right
    };

    /**
     * @brief Simple ray type used for picking and intersections.
     * @ingroup MathUtils
     *
     * @note `dir` should be normalized. `inv` is the component-wise inverse of `dir`
     * (i.e., `1.0f / dir`) and is cached for faster AABB tests. Use make_ray()
     * to fill both consistently.
     */
    struct ray
    {
        glm::vec3 org{0.0f};            ///< Origin of the ray in 3D space.
        glm::vec3 dir{0.0f, 0.0f, -1.0f}; ///< Direction vector (should be normalized).
        glm::vec3 inv{0.0f};            ///< 1.0f / dir (component-wise); used for fast AABB tests.
        ray_eye   eye = ray_eye::Mono;  ///< Eye the ray belongs to.
    };

    /**
     * @brief Result of an exact ray intersection.
     * @ingroup MathUtils
     */
    struct ray_hit
    {
        float     dist = 0.0f; ///< Signed distance along the ray.
        glm::vec3 point{0.0f}; ///< World-space intersection point.
    };

    /**
     * @brief Zero check for vec3 using squared length and epsilon.
     * @ingroup MathUtils
     */
    inline bool is_zero(const glm::vec3& v)
    {
        return glm::length2(v) <= (10 * glm::epsilon<float>());
    }

    /**
     * @brief True if every component of @p v is finite.
     * @ingroup MathUtils
     */
    inline bool is_finite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Behaves like `glm::normalize()` but returns (0,0,0) if the vector length
     * is near zero or non-finite.
     *
     * @param v   Input vector.
     * @param eps Threshold under which the vector is treated as zero.
     * @return Normalized vector, or zero on degenerate input.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v, float eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return glm::vec3(0.0f);
    }

    /**
     * @brief Build a ray with a normalized direction and cached inverse.
     *
     * @param org Ray origin.
     * @param dir Ray direction (any length).
     * @param eye Eye tag for stereo rays.
     * @return Ray with `dir` normalized and `inv` = 1/dir (INF for 0 components).
     * @ingroup MathUtils
     */
    inline ray make_ray(const glm::vec3& org, const glm::vec3& dir, ray_eye eye = ray_eye::Mono)
    {
        ray r = {};
        r.org = org;
        r.dir = safe_normalize(dir);
        r.inv = 1.0f / r.dir;
        r.eye = eye;
        return r;
    }

    /**
     * @brief Point at parameter @p t along a ray.
     * @ingroup MathUtils
     */
    inline glm::vec3 ray_point(const ray& r, float t) noexcept
    {
        return r.org + r.dir * t;
    }

    /**
     * @brief Intersect a ray with a sphere.
     *
     * Only the forward half-line is considered. When the origin lies inside
     * the sphere the entry distance is clamped to 0.
     *
     * @param r      Input ray (direction does not need to be normalized).
     * @param center Sphere center.
     * @param radius Sphere radius.
     * @param out_t  Entry parameter along the ray (if any).
     * @return True if the ray touches the sphere at t >= 0.
     * @ingroup MathUtils
     */
    bool ray_sphere_intersect(const ray&       r,
                              const glm::vec3& center,
                              float            radius,
                              float&           out_t) noexcept;

    /**
     * @brief Intersect a ray with an axis-aligned box (slab test).
     *
     * Axis-parallel rays are handled without relying on INF arithmetic.
     *
     * @param r      Input ray.
     * @param bmin   Box minimum corner.
     * @param bmax   Box maximum corner.
     * @param out_t  Entry parameter along the ray, clamped to 0.
     * @return True if the forward ray overlaps the box.
     * @ingroup MathUtils
     */
    bool ray_box_intersect(const ray&       r,
                           const glm::vec3& bmin,
                           const glm::vec3& bmax,
                           float&           out_t) noexcept;

    /**
     * @brief Intersect a ray with a triangle (Moller-Trumbore).
     *
     * @param r     Input ray (org/dir).
     * @param a     Triangle vertex A.
     * @param b     Triangle vertex B.
     * @param c     Triangle vertex C.
     * @param out_t Distance along the ray to the hit point (if any).
     * @return True if the ray intersects the triangle at t >= 0.
     * @ingroup MathUtils
     */
    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept;

    /**
     * @brief Create a runtime_error enriched with source location info.
     *
     * Example output:
     *   Unknown mesh intersector "Optix" [at PointerWorld.cpp:88 in PointerWorld::createMeshIntersector(...)]
     */
    inline std::runtime_error core_exception(
        const std::string&   msg,
        std::source_location loc = std::source_location::current())
    {
        // --- Shorten file name ---
        std::string file = loc.file_name();
        if (auto pos = file.find_last_of("/\\"); pos != std::string::npos)
            file = file.substr(pos + 1);

        // --- Simplify the function signature ---
        std::string func = loc.function_name();

        // Remove MSVC calling conventions (e.g., "__cdecl")
        const char* calling_convs[] = {"__cdecl", "__stdcall", "__fastcall"};
        for (auto cc : calling_convs)
        {
            if (auto pos = func.find(cc); pos != std::string::npos)
            {
                func.erase(pos, std::string(cc).size());
            }
        }

        // Replace parameter list with "..."
        if (auto open = func.find('('); open != std::string::npos)
        {
            if (auto close = func.rfind(')'); close != std::string::npos && close > open)
            {
                func.replace(open + 1, close - open - 1, "...");
            }
        }

        // Trim leftover double spaces if any
        while (func.find("  ") != std::string::npos)
            func.erase(func.find("  "), 1);

        // --- Build final error message ---
        return std::runtime_error(
            msg + " [at " + file + ":" + std::to_string(loc.line()) +
            " in " + func + "]");
    }

} // namespace un

#define TICK(NAME) \
    const auto __tick_##NAME = std::chrono::high_resolution_clock::now();

#define TOCK(NAME)                                                            \
    do                                                                        \
    {                                                                         \
        const auto __tock_##NAME = std::chrono::high_resolution_clock::now(); \
        const auto __dt_##NAME =                                              \
            std::chrono::duration_cast<std::chrono::microseconds>(            \
                __tock_##NAME - __tick_##NAME)                                \
                .count();                                                     \
        std::cerr << #NAME << " took: " << __dt_##NAME / 1000.0 << " ms\n";   \
    }                                                                         \
    while (0)
