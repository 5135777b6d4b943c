#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "BoundingVolumeIndex.hpp"
#include "CoreTypes.hpp"
#include "Hit.hpp"

class EventRegistry;
class SceneObject;
class SceneObjectTable;
class Viewport;

/**
 * @brief Resolves pointer rays to exact hits on indexed objects.
 *
 * The bounding volume index narrows the candidates; each live candidate
 * then runs its own exact raycast. Results are sorted by distance, then by
 * distance bias, then by id so equal inputs always give the same order.
 */
class HitTester
{
public:
    HitTester(BoundingVolumeIndex& index, const SceneObjectTable& objects);

    /**
     * @brief All exact hits along @p ray, nearest first.
     *
     * A ray with a non-finite origin or a zero direction yields no hits.
     */
    [[nodiscard]] std::vector<Hit> pickAtRay(const un::ray& ray);

    /**
     * @brief Picks through a client-space point of a surface.
     *
     * @p x / @p y are client coordinates; @p rect maps them onto the
     * viewport's pixels. A rect without a size falls back to the viewport's
     * logical size.
     */
    [[nodiscard]] std::vector<Hit> pickAtScreenPoint(float               x,
                                                     float               y,
                                                     const ViewportRect& rect,
                                                     const Viewport&     viewport);

    /**
     * @brief First hit whose object may become a pointer target.
     */
    [[nodiscard]] static std::optional<Hit> findTarget(const std::vector<Hit>& hits, const EventRegistry& registry);

    /**
     * @brief Pointer eligibility of one object.
     *
     * Enabled objects always qualify. Auto objects qualify while they have a
     * pointer listener. Disabled objects never qualify.
     */
    [[nodiscard]] static bool isPointerTarget(const SceneObject& object, const EventRegistry& registry);

    /// Sorts by (distance, distanceBias, id) ascending.
    static void sortHits(std::vector<Hit>& hits);

    /// Instrumentation of the last pick.
    [[nodiscard]] const PointerStats& lastStats() const noexcept;

    /// Number of pickAtRay() calls so far.
    [[nodiscard]] std::uint64_t pickCount() const noexcept;

private:
    BoundingVolumeIndex&    m_index;
    const SceneObjectTable& m_objects;
    PointerStats            m_stats;
    std::uint64_t           m_pickCount = 0;
};
