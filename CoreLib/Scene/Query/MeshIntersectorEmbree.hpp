#pragma once

#include <memory>

#include "MeshIntersector.hpp"
#include "embree4/rtcore.h" // RTCDevice, RTCScene, etc.

/**
 * @brief Owns one Embree device shared by every Embree mesh intersector of a world.
 *
 * Device errors are reported on std::cerr through the device error callback.
 */
class EmbreeDevice
{
public:
    EmbreeDevice();
    ~EmbreeDevice();

    EmbreeDevice(const EmbreeDevice&)            = delete;
    EmbreeDevice& operator=(const EmbreeDevice&) = delete;

    /// Raw device handle, nullptr if Embree failed to initialize.
    [[nodiscard]] RTCDevice handle() const noexcept;

private:
    RTCDevice m_device = nullptr;
};

/**
 * @brief Embree-backed MeshIntersector.
 *
 * Each intersector holds one committed Embree scene with a single triangle
 * geometry. Rebuilding replaces the scene.
 */
class MeshIntersectorEmbree final : public MeshIntersector
{
public:
    /// Uses a private device.
    MeshIntersectorEmbree();

    explicit MeshIntersectorEmbree(std::shared_ptr<EmbreeDevice> device);
    ~MeshIntersectorEmbree() override;

    MeshIntersectorEmbree(const MeshIntersectorEmbree&)            = delete;
    MeshIntersectorEmbree& operator=(const MeshIntersectorEmbree&) = delete;

    [[nodiscard]] std::string_view name() const noexcept override { return "Embree"; }

    void build(const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices) override;

    [[nodiscard]] bool built() const noexcept override;

    [[nodiscard]] std::optional<float> intersect(const un::ray& ray) const override;

private:
    void releaseScene() noexcept;

    std::shared_ptr<EmbreeDevice> m_device;
    RTCScene                      m_rtcScene = nullptr;
    bool                          m_built    = false;
};
