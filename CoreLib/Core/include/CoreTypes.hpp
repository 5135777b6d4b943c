// Public enums and types that
// are visible to both the core library and the UI application

#pragma once

#include <cstddef>
#include <cstdint>

/// Stable identifier of an interactive object, assigned by the scene layer.
using ObjectId = uint64_t;

enum class ViewMode
{
    PERSPECTIVE,
    ORTHOGRAPHIC,
};

/**
 * @brief Client-space rectangle of an input surface.
 *
 * A zero width or height means the surface has no visible rect (for example
 * an offscreen widget); picking then falls back to the viewport's own size.
 */
struct ViewportRect
{
    float left   = 0.0f;
    float top    = 0.0f;
    float width  = 0.0f;
    float height = 0.0f;
};

/**
 * @brief Instrumentation for one pick.
 */
struct PointerStats
{
    double      pickTimeMs = 0.0; ///< Time spent in the index query and exact tests.
    std::size_t candidates = 0;   ///< Spheres visited by the index query.
    std::size_t hits       = 0;   ///< Exact hits kept.
};

/**
 * @brief World position projected into surface pixels.
 */
struct ProjectedPosition
{
    float x              = 0.0f;
    float y              = 0.0f;
    float signedDistance = 0.0f; ///< Distance from the camera, negative behind it.
};

/**
 * @brief Screen placement of an overlay object in front of the camera.
 */
struct OverlayItem
{
    ObjectId id = 0;
    float    x  = 0.0f;
    float    y  = 0.0f;
    float    z  = 0.0f; ///< Signed camera distance, always >= 0 here.
};
