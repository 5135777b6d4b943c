#include "HitTester.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_map>

#include "EventRegistry.hpp"
#include "SceneObject.hpp"
#include "SceneObjectTable.hpp"
#include "Viewport.hpp"

HitTester::HitTester(BoundingVolumeIndex& index, const SceneObjectTable& objects) : m_index{index}, m_objects{objects}
{
}

std::vector<Hit> HitTester::pickAtRay(const un::ray& ray)
{
    const auto start = std::chrono::steady_clock::now();
    m_stats          = {};
    ++m_pickCount;

    std::vector<Hit> hits;
    if (!un::is_finite(ray.org) || !un::is_finite(ray.dir) || un::is_zero(ray.dir))
        return hits;

    // Closest exact hit per object, whatever order the index visits in.
    std::unordered_map<ObjectId, std::size_t> slot;

    m_index.queryRay(ray, [&](const BoundingSphere& /*sphere*/, ObjectId id) {
        ++m_stats.candidates;

        SceneObject* object = m_objects.find(id);
        if (!object || object->destroying())
            return;

        const std::optional<un::ray_hit> exact = object->raycast(ray);
        if (!exact)
            return;

        Hit hit;
        hit.id           = id;
        hit.object       = object;
        hit.distance     = exact->dist;
        hit.distanceBias = object->distanceBias();
        hit.point        = exact->point;

        if (auto it = slot.find(id); it != slot.end())
        {
            if (hit.distance < hits[it->second].distance)
                hits[it->second] = hit;
            return;
        }

        slot.emplace(id, hits.size());
        hits.push_back(hit);
    });

    sortHits(hits);

    m_stats.hits       = hits.size();
    m_stats.pickTimeMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return hits;
}

std::vector<Hit> HitTester::pickAtScreenPoint(float               x,
                                              float               y,
                                              const ViewportRect& rect,
                                              const Viewport&     viewport)
{
    if (!std::isfinite(x) || !std::isfinite(y))
        return {};

    const float vpWidth  = static_cast<float>(viewport.width());
    const float vpHeight = static_cast<float>(viewport.height());
    if (vpWidth <= 0.0f || vpHeight <= 0.0f)
        return {};

    // Use the logical size if the surface has no visible rect.
    const float width  = rect.width > 0.0f ? rect.width : vpWidth;
    const float height = rect.height > 0.0f ? rect.height : vpHeight;

    const float px = (x - rect.left) / width * vpWidth;
    const float py = (y - rect.top) / height * vpHeight;

    return pickAtRay(viewport.ray(px, py));
}

std::optional<Hit> HitTester::findTarget(const std::vector<Hit>& hits, const EventRegistry& registry)
{
    for (const Hit& hit : hits)
    {
        if (hit.object && isPointerTarget(*hit.object, registry))
            return hit;
    }
    return std::nullopt;
}

bool HitTester::isPointerTarget(const SceneObject& object, const EventRegistry& registry)
{
    switch (object.pointerEvents())
    {
        case PointerEvents::Enabled:
            return true;
        case PointerEvents::Disabled:
            return false;
        case PointerEvents::Auto:
            break;
    }
    return registry.hasPointerListeners(object.id());
}

void HitTester::sortHits(std::vector<Hit>& hits)
{
    std::sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        if (a.distanceBias != b.distanceBias)
            return a.distanceBias < b.distanceBias;
        return a.id < b.id;
    });
}

const PointerStats& HitTester::lastStats() const noexcept
{
    return m_stats;
}

std::uint64_t HitTester::pickCount() const noexcept
{
    return m_pickCount;
}
