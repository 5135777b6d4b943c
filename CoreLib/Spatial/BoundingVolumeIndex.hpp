#pragma once

#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "BoundingSphereOctree.hpp"

/**
 * @brief Pending, not-yet-applied spatial index mutations.
 *
 * A put with a sphere carries an explicit value. A put without one is
 * resolved through the index's SphereSource when the batch is applied.
 */
struct OctreeChangeset
{
    std::unordered_map<ObjectId, std::optional<BoundingSphere>> put;
    std::unordered_set<ObjectId>                                remove;

    [[nodiscard]] bool empty() const noexcept
    {
        return put.empty() && remove.empty();
    }
};

/**
 * @brief Bounding volume index with lazy, batched mutation.
 *
 * Mutations only record intent in an OctreeChangeset. The batch is applied
 * exactly once, right before the next queryRay() (or an explicit flush()),
 * so the octree is never restructured more than once per frame.
 *
 * Rules applied at flush time:
 *  - an id that is both put and removed in one batch is removed;
 *  - a put without an explicit sphere asks the SphereSource; no answer
 *    (object destroyed, unknown, or without bounds) turns it into a remove.
 *
 * Removing an unknown id is a no-op.
 */
class BoundingVolumeIndex
{
public:
    /// Current sphere of a live object, or nullopt if it is gone or has no bounds.
    using SphereSource = std::function<std::optional<BoundingSphere>(ObjectId)>;

    explicit BoundingVolumeIndex(SphereSource source = {}, OctreeSettings settings = {});

    void setSphereSource(SphereSource source);

    /// Records the sphere for @p id; nullopt is equivalent to remove(id).
    void upsert(ObjectId id, std::optional<BoundingSphere> sphere);

    /// Queues removal of @p id. Idempotent.
    void remove(ObjectId id);

    /// Queues a put whose sphere is read from the SphereSource at flush time.
    void markChanged(ObjectId id);

    /**
     * @brief Queues a put for an id that has just been (re)registered.
     *
     * Unlike markChanged(), this cancels a removal queued earlier in the
     * same batch, so an id removed and registered again in one frame stays
     * indexed.
     */
    void markAdded(ObjectId id);

    /**
     * @brief Flushes pending changes, then visits every sphere on the ray once.
     *
     * Changes queued by @p visit are kept for the next flush.
     */
    void queryRay(const un::ray& ray, const BoundingSphereOctree::SphereVisitor& visit);

    /// Applies the pending changeset now.
    void flush();

    [[nodiscard]] bool hasPendingChanges() const noexcept;

    /// Number of indexed spheres as of the last flush.
    [[nodiscard]] std::size_t size() const noexcept;

    /// True if @p id is indexed as of the last flush.
    [[nodiscard]] bool contains(ObjectId id) const noexcept;

    [[nodiscard]] const BoundingSphereOctree& octree() const noexcept;

    /// Drops every entry and any pending changes.
    void clear() noexcept;

private:
    SphereSource         m_source;
    BoundingSphereOctree m_octree;
    OctreeChangeset      m_pending;
};
