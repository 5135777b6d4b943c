// ============================================================================
// Viewport.hpp  (Vulkan conventions: RH + ZO + projection Y-flip)
// ============================================================================

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

#include "CoreTypes.hpp"
#include "CoreUtilities.hpp"

/**
 * @brief Camera state and matrix utilities for picking (Vulkan conventions).
 *
 * Conventions:
 *  - Right-handed view/projection.
 *  - Clip/NDC Z range is [0, 1] (ZO).
 *  - Projection matrix is Y-flipped so screen space is top-left origin, Y down.
 *
 * Screen space for project/unproject/ray:
 *  - x/y are pixels, origin top-left, y down.
 *  - z is depth in [0,1] (Vulkan depth semantics).
 *
 * Every setter recomputes the cached matrices, so project/unproject/ray are
 * always consistent with the last state.
 */
class Viewport
{
public:
    Viewport();

    /**
     * @brief Resizes the viewport in pixels.
     * @param width  New width in pixels (clamped to >= 0).
     * @param height New height in pixels (clamped to >= 0).
     */
    void resize(int32_t width, int32_t height) noexcept;

    /**
     * @brief Places the camera.
     * @param eye    Camera position in world space.
     * @param target Point the camera looks at.
     * @param up     Approximate up vector.
     */
    void lookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up = glm::vec3(0.f, 1.f, 0.f)) noexcept;

    /**
     * @brief Switches to a perspective projection.
     * @param fovDeg Vertical field of view in degrees.
     */
    void perspective(float fovDeg, float nearPlane, float farPlane) noexcept;

    /**
     * @brief Switches to an orthographic projection.
     * @param halfHeight Half of the visible world height; width follows the aspect ratio.
     */
    void orthographic(float halfHeight, float nearPlane, float farPlane) noexcept;

    /**
     * @brief Returns the current view mode.
     */
    [[nodiscard]] ViewMode viewMode() const noexcept;

    /**
     * @brief Projects a world-space point to screen space.
     * @return (x,y) in pixels (top-left origin, y down), z in [0,1].
     */
    [[nodiscard]] glm::vec3 project(const glm::vec3& world) const noexcept;

    /**
     * @brief Unprojects a screen-space point to world space.
     * @param screen (x,y) in pixels (top-left origin), z in [0,1].
     * @return World-space point. Returns (0,0,0) if viewport is invalid.
     */
    [[nodiscard]] glm::vec3 unproject(const glm::vec3& screen) const noexcept;

    /**
     * @brief Computes linear view-space depth (distance along forward direction).
     *
     * Forward is -Z in view space; this returns -viewZ.
     */
    [[nodiscard]] float linearDepth(const glm::vec3& point) const noexcept;

    /**
     * @brief Constructs a world-space ray from screen coordinates.
     * @param x Pixel x coordinate (top-left origin).
     * @param y Pixel y coordinate (top-left origin).
     */
    [[nodiscard]] un::ray ray(float x, float y) const;

    /**
     * @brief Returns the camera position in world space.
     */
    [[nodiscard]] glm::vec3 cameraPosition() const;

    /**
     * @brief Returns the camera forward direction in world space.
     */
    [[nodiscard]] glm::vec3 viewDirection() const;

    /**
     * @brief Returns the viewport width in pixels.
     */
    [[nodiscard]] int32_t width() const noexcept;

    /**
     * @brief Returns the viewport height in pixels.
     */
    [[nodiscard]] int32_t height() const noexcept;

    /**
     * @brief Returns width/height, or 1 if height is 0.
     */
    [[nodiscard]] float aspect() const noexcept;

    [[nodiscard]] const glm::mat4& projection() const noexcept;
    [[nodiscard]] const glm::mat4& view() const noexcept;

    /**
     * @brief Recomputes view/projection and cached derived matrices.
     */
    void apply() noexcept;

private:
    ViewMode m_viewMode = ViewMode::PERSPECTIVE;
    int32_t  m_width    = 0;
    int32_t  m_height   = 0;

    glm::vec3 m_eye{0.f, 0.f, 10.f};
    glm::vec3 m_target{0.f};
    glm::vec3 m_up{0.f, 1.f, 0.f};

    float m_fovDeg     = 45.0f;
    float m_orthoHalfH = 5.0f;
    float m_nearPlane  = 0.1f;
    float m_farPlane   = 5000.0f;

    glm::mat4 m_matProj = glm::mat4(1.0f);
    glm::mat4 m_matView = glm::mat4(1.0f);

    glm::mat4 m_matViewProj    = glm::mat4(1.0f);
    glm::mat4 m_matInvViewProj = glm::mat4(1.0f);
    glm::mat4 m_matInvView     = glm::mat4(1.0f);
};
