#include "BoundingVolumeIndex.hpp"

#include <utility>

BoundingVolumeIndex::BoundingVolumeIndex(SphereSource source, OctreeSettings settings) :
    m_source{std::move(source)},
    m_octree{settings}
{
}

void BoundingVolumeIndex::setSphereSource(SphereSource source)
{
    m_source = std::move(source);
}

void BoundingVolumeIndex::upsert(ObjectId id, std::optional<BoundingSphere> sphere)
{
    if (!sphere)
    {
        remove(id);
        return;
    }

    m_pending.put[id] = sphere;
}

void BoundingVolumeIndex::remove(ObjectId id)
{
    m_pending.remove.insert(id);
}

void BoundingVolumeIndex::markChanged(ObjectId id)
{
    // An explicit sphere queued earlier in this batch is superseded by the source.
    m_pending.put[id] = std::nullopt;
}

void BoundingVolumeIndex::markAdded(ObjectId id)
{
    m_pending.remove.erase(id);
    m_pending.put[id] = std::nullopt;
}

void BoundingVolumeIndex::queryRay(const un::ray& ray, const BoundingSphereOctree::SphereVisitor& visit)
{
    flush();
    m_octree.forEachSphereOnRay(ray, visit);
}

void BoundingVolumeIndex::flush()
{
    if (m_pending.empty())
        return;

    // Detach first so resolution callbacks that queue new changes land in the next batch.
    OctreeChangeset changes = std::move(m_pending);
    m_pending               = {};

    for (ObjectId id : changes.remove)
        m_octree.removeSphere(id);

    for (const auto& [id, explicitSphere] : changes.put)
    {
        if (changes.remove.contains(id))
            continue;

        std::optional<BoundingSphere> sphere = explicitSphere;
        if (!sphere && m_source)
            sphere = m_source(id);

        if (sphere && sphere->valid())
            m_octree.putSphere(id, *sphere);
        else
            m_octree.removeSphere(id);
    }
}

bool BoundingVolumeIndex::hasPendingChanges() const noexcept
{
    return !m_pending.empty();
}

std::size_t BoundingVolumeIndex::size() const noexcept
{
    return m_octree.size();
}

bool BoundingVolumeIndex::contains(ObjectId id) const noexcept
{
    return m_octree.sphere(id) != nullptr;
}

const BoundingSphereOctree& BoundingVolumeIndex::octree() const noexcept
{
    return m_octree;
}

void BoundingVolumeIndex::clear() noexcept
{
    m_pending = {};
    m_octree.clear();
}
