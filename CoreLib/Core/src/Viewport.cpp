#include "Viewport.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

Viewport::Viewport()
{
    apply();
}

void Viewport::resize(int32_t width, int32_t height) noexcept
{
    // Clamp to non-negative. A 0-sized viewport is treated as invalid for projection.
    width  = std::max<int32_t>(0, width);
    height = std::max<int32_t>(0, height);

    if (m_width == width && m_height == height)
        return;

    m_width  = width;
    m_height = height;
    apply();
}

void Viewport::lookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up) noexcept
{
    m_eye    = eye;
    m_target = target;
    m_up     = up;
    apply();
}

void Viewport::perspective(float fovDeg, float nearPlane, float farPlane) noexcept
{
    m_viewMode  = ViewMode::PERSPECTIVE;
    m_fovDeg    = fovDeg;
    m_nearPlane = nearPlane;
    m_farPlane  = farPlane;
    apply();
}

void Viewport::orthographic(float halfHeight, float nearPlane, float farPlane) noexcept
{
    m_viewMode   = ViewMode::ORTHOGRAPHIC;
    m_orthoHalfH = std::max(1e-6f, halfHeight);
    m_nearPlane  = nearPlane;
    m_farPlane   = farPlane;
    apply();
}

ViewMode Viewport::viewMode() const noexcept
{
    return m_viewMode;
}

glm::vec3 Viewport::project(const glm::vec3& world) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const glm::vec4 clip = m_matViewProj * glm::vec4(world, 1.0f);

    // clip.w == 0 indicates an invalid perspective divide.
    if (clip.w == 0.0f)
        return glm::vec3(0.0f);

    // NDC is derived by perspective divide. With RH_ZO, ndc.z is [0,1] for visible points.
    const glm::vec3 ndc = glm::vec3(clip) / clip.w;

    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    // Projection includes a Y flip, so ndc.y already matches screen y-down coordinates.
    const float x = (ndc.x * 0.5f + 0.5f) * w;
    const float y = (ndc.y * 0.5f + 0.5f) * h;

    return glm::vec3(x, y, ndc.z);
}

glm::vec3 Viewport::unproject(const glm::vec3& screen) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    // Convert from pixel coordinates to NDC.
    const float ndcX = (screen.x / w) * 2.0f - 1.0f;
    const float ndcY = (screen.y / h) * 2.0f - 1.0f;

    // Vulkan depth is already [0,1].
    const float ndcZ = screen.z;

    const glm::vec4 clip(ndcX, ndcY, ndcZ, 1.0f);
    const glm::vec4 worldH = m_matInvViewProj * clip;

    // worldH.w == 0 indicates an invalid homogeneous coordinate.
    if (worldH.w == 0.0f)
        return glm::vec3(0.0f);

    return glm::vec3(worldH) / worldH.w;
}

float Viewport::linearDepth(const glm::vec3& point) const noexcept
{
    // View-space depth where forward is -Z; returns positive distance in front of camera.
    const glm::vec4 v = m_matView * glm::vec4(point, 1.0f);
    return -v.z;
}

un::ray Viewport::ray(float x, float y) const
{
    // Constructs a ray by unprojecting near and far depths in Vulkan [0,1].
    const glm::vec3 nearPt = unproject(glm::vec3(x, y, 0.0f));
    const glm::vec3 farPt  = unproject(glm::vec3(x, y, 1.0f));

    // Uses a safe normalization so a degenerate viewport yields a zero direction, not NaNs.
    return un::make_ray(nearPt, farPt - nearPt);
}

glm::vec3 Viewport::cameraPosition() const
{
    return glm::vec3(m_matInvView[3]);
}

glm::vec3 Viewport::viewDirection() const
{
    // Forward is -Z in view space.
    const glm::vec4 forwardWorld = m_matInvView * glm::vec4(0.f, 0.f, -1.f, 0.f);
    return un::safe_normalize(glm::vec3(forwardWorld));
}

int32_t Viewport::width() const noexcept
{
    return m_width;
}

int32_t Viewport::height() const noexcept
{
    return m_height;
}

float Viewport::aspect() const noexcept
{
    const float h = static_cast<float>(m_height);
    return (h > 0.0f) ? (static_cast<float>(m_width) / h) : 1.0f;
}

const glm::mat4& Viewport::projection() const noexcept
{
    return m_matProj;
}

const glm::mat4& Viewport::view() const noexcept
{
    return m_matView;
}

// -----------------------------------------------------------------------------
// apply()
// -----------------------------------------------------------------------------

void Viewport::apply() noexcept
{
    const float aspectRatio = aspect();

    // A degenerate look direction keeps the previous view matrix.
    if (!un::is_zero(m_target - m_eye))
        m_matView = glm::lookAtRH(m_eye, m_target, m_up);

    // Projection is Vulkan-friendly (RH + ZO + Y flip).
    if (m_viewMode == ViewMode::PERSPECTIVE)
    {
        m_matProj = glm::perspectiveRH_ZO(glm::radians(m_fovDeg), aspectRatio, m_nearPlane, m_farPlane);
    }
    else
    {
        const float orthoHalfW = m_orthoHalfH * aspectRatio;
        m_matProj = glm::orthoRH_ZO(-orthoHalfW, orthoHalfW, -m_orthoHalfH, m_orthoHalfH, m_nearPlane, m_farPlane);
    }

    // Flips Y so NDC maps to screen y-down coordinates in project/unproject.
    m_matProj[1][1] *= -1.0f;

    // Caches derived matrices for project/unproject.
    m_matViewProj    = m_matProj * m_matView;
    m_matInvViewProj = glm::inverse(m_matViewProj);
    m_matInvView     = glm::inverse(m_matView);
}
