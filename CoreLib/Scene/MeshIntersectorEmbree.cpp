#include "MeshIntersectorEmbree.hpp"

#include <embree4/rtcore.h>
#include <embree4/rtcore_ray.h>
#include <iostream>
#include <limits>

#include "CoreUtilities.hpp"

namespace
{
    void onDeviceError(void* /*userPtr*/, RTCError code, const char* str)
    {
        std::cerr << "MeshIntersectorEmbree: device error " << static_cast<int>(code);
        if (str)
            std::cerr << ": " << str;
        std::cerr << "\n";
    }

    struct RTCFloat3
    {
        float x, y, z;
    };

    struct RTCTri
    {
        unsigned int v0, v1, v2;
    };
} // namespace

EmbreeDevice::EmbreeDevice()
{
    m_device = rtcNewDevice(nullptr); // nullptr = default config

    if (!m_device)
    {
        std::cerr << "MeshIntersectorEmbree: failed to create Embree device (error "
                  << static_cast<int>(rtcGetDeviceError(nullptr)) << ")\n";
        return;
    }

    rtcSetDeviceErrorFunction(m_device, onDeviceError, nullptr);
}

EmbreeDevice::~EmbreeDevice()
{
    if (m_device)
        rtcReleaseDevice(m_device);
}

RTCDevice EmbreeDevice::handle() const noexcept
{
    return m_device;
}

MeshIntersectorEmbree::MeshIntersectorEmbree() : m_device{std::make_shared<EmbreeDevice>()}
{
}

MeshIntersectorEmbree::MeshIntersectorEmbree(std::shared_ptr<EmbreeDevice> device) : m_device{std::move(device)}
{
    if (!m_device)
        m_device = std::make_shared<EmbreeDevice>();
}

MeshIntersectorEmbree::~MeshIntersectorEmbree()
{
    releaseScene();
}

void MeshIntersectorEmbree::releaseScene() noexcept
{
    if (m_rtcScene)
    {
        rtcReleaseScene(m_rtcScene);
        m_rtcScene = nullptr;
    }
}

void MeshIntersectorEmbree::build(const std::vector<glm::vec3>& positions, const std::vector<uint32_t>& indices)
{
    releaseScene();
    m_built = false;

    RTCDevice device = m_device->handle();
    if (!device)
        throw un::core_exception("MeshIntersectorEmbree: no Embree device available");

    m_rtcScene = rtcNewScene(device);
    rtcSetSceneBuildQuality(m_rtcScene, RTC_BUILD_QUALITY_MEDIUM);

    const std::size_t triCount = indices.size() / 3;

    if (!positions.empty() && triCount > 0)
    {
        RTCGeometry geom = rtcNewGeometry(device, RTC_GEOMETRY_TYPE_TRIANGLE);
        rtcSetGeometryBuildQuality(geom, RTC_BUILD_QUALITY_MEDIUM);

        auto* vbuf = reinterpret_cast<RTCFloat3*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_VERTEX,
                                    0,
                                    RTC_FORMAT_FLOAT3,
                                    sizeof(RTCFloat3),
                                    positions.size()));

        auto* ibuf = reinterpret_cast<RTCTri*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_INDEX,
                                    0,
                                    RTC_FORMAT_UINT3,
                                    sizeof(RTCTri),
                                    triCount));

        if (!vbuf || !ibuf)
        {
            rtcReleaseGeometry(geom);
            releaseScene();
            throw un::core_exception("MeshIntersectorEmbree: failed to allocate geometry buffers");
        }

        for (std::size_t vi = 0; vi < positions.size(); ++vi)
        {
            vbuf[vi].x = positions[vi].x;
            vbuf[vi].y = positions[vi].y;
            vbuf[vi].z = positions[vi].z;
        }

        for (std::size_t ti = 0; ti < triCount; ++ti)
        {
            ibuf[ti].v0 = indices[ti * 3];
            ibuf[ti].v1 = indices[ti * 3 + 1];
            ibuf[ti].v2 = indices[ti * 3 + 2];
        }

        rtcCommitGeometry(geom);
        rtcAttachGeometry(m_rtcScene, geom);
        rtcReleaseGeometry(geom);
    }

    rtcCommitScene(m_rtcScene);
    m_built = true;
}

bool MeshIntersectorEmbree::built() const noexcept
{
    return m_built;
}

std::optional<float> MeshIntersectorEmbree::intersect(const un::ray& ray) const
{
    if (!m_built || !m_rtcScene)
        throw un::core_exception("MeshIntersectorEmbree::intersect called before build");

    RTCRayHit rh{};
    rh.ray.org_x = ray.org.x;
    rh.ray.org_y = ray.org.y;
    rh.ray.org_z = ray.org.z;

    rh.ray.dir_x = ray.dir.x;
    rh.ray.dir_y = ray.dir.y;
    rh.ray.dir_z = ray.dir.z;

    rh.ray.tnear = 0.0f;
    rh.ray.tfar  = std::numeric_limits<float>::infinity();
    rh.ray.mask  = 0xFFFFFFFFu;
    rh.ray.flags = 0;

    rh.hit.geomID = RTC_INVALID_GEOMETRY_ID;
    rh.hit.primID = RTC_INVALID_GEOMETRY_ID;

    RTCIntersectArguments args;
    rtcInitIntersectArguments(&args);

    rtcIntersect1(m_rtcScene, &rh, &args);

    if (rh.hit.geomID == RTC_INVALID_GEOMETRY_ID)
        return std::nullopt;

    return rh.ray.tfar;
}
