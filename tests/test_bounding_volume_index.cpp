#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <vector>

#include "BoundingVolumeIndex.hpp"

namespace
{
    const un::ray kDownZ = un::make_ray(glm::vec3(0.f, 0.f, 10.f), glm::vec3(0.f, 0.f, -1.f));

    std::vector<ObjectId> query(BoundingVolumeIndex& index, const un::ray& ray = kDownZ)
    {
        std::vector<ObjectId> ids;
        index.queryRay(ray, [&](const BoundingSphere&, ObjectId id) {
            ids.push_back(id);
        });
        return ids;
    }
} // namespace

TEST(BoundingVolumeIndex, MutationsAreDeferredUntilQuery)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});

    EXPECT_TRUE(index.hasPendingChanges());
    EXPECT_EQ(index.size(), 0u);

    EXPECT_EQ(query(index), std::vector<ObjectId>{1});
    EXPECT_FALSE(index.hasPendingChanges());
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.contains(1));
}

TEST(BoundingVolumeIndex, PutThenRemoveInOneBatchIsARemove)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});
    index.remove(1);

    EXPECT_TRUE(query(index).empty());
    EXPECT_FALSE(index.contains(1));
}

TEST(BoundingVolumeIndex, RemoveThenPutInOneBatchIsStillARemove)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});
    index.flush();

    index.remove(1);
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 2.f});

    EXPECT_TRUE(query(index).empty());
}

TEST(BoundingVolumeIndex, RemovingUnknownIdIsANoOp)
{
    BoundingVolumeIndex index;
    index.remove(42);
    index.remove(42);
    EXPECT_NO_THROW(index.flush());
    EXPECT_EQ(index.size(), 0u);
}

TEST(BoundingVolumeIndex, UpsertWithNulloptRemoves)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});
    index.flush();

    index.upsert(1, std::nullopt);
    EXPECT_TRUE(query(index).empty());
}

TEST(BoundingVolumeIndex, MarkChangedReadsSphereSourceOncePerFlush)
{
    std::map<ObjectId, BoundingSphere> live;
    int                                reads = 0;

    BoundingVolumeIndex index([&](ObjectId id) -> std::optional<BoundingSphere> {
        ++reads;
        auto it = live.find(id);
        if (it == live.end())
            return std::nullopt;
        return it->second;
    });

    live[1] = {glm::vec3(0.f), 1.f};
    index.markChanged(1);
    index.markChanged(1);
    index.markChanged(1);

    EXPECT_EQ(reads, 0);
    EXPECT_EQ(query(index), std::vector<ObjectId>{1});
    EXPECT_EQ(reads, 1);

    // The object moved out of the ray's path.
    live[1] = {glm::vec3(50.f, 0.f, 0.f), 1.f};
    index.markChanged(1);
    EXPECT_TRUE(query(index).empty());
    EXPECT_EQ(reads, 2);
}

TEST(BoundingVolumeIndex, MissingSourceAnswerBecomesRemove)
{
    bool alive = true;

    BoundingVolumeIndex index([&](ObjectId) -> std::optional<BoundingSphere> {
        if (!alive)
            return std::nullopt;
        return BoundingSphere{glm::vec3(0.f), 1.f};
    });

    index.markChanged(3);
    EXPECT_EQ(query(index).size(), 1u);

    alive = false;
    index.markChanged(3);
    EXPECT_TRUE(query(index).empty());
    EXPECT_FALSE(index.contains(3));
}

TEST(BoundingVolumeIndex, ChangesQueuedDuringQueryWaitForNextFlush)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});
    index.upsert(2, BoundingSphere{glm::vec3(0.f, 0.f, -3.f), 1.f});

    std::vector<ObjectId> seen;
    index.queryRay(kDownZ, [&](const BoundingSphere&, ObjectId id) {
        seen.push_back(id);
        index.remove(1);
        index.remove(2);
    });

    EXPECT_EQ(seen.size(), 2u);
    EXPECT_TRUE(index.hasPendingChanges());
    EXPECT_TRUE(query(index).empty());
}

TEST(BoundingVolumeIndex, ClearDropsEntriesAndPendingChanges)
{
    BoundingVolumeIndex index;
    index.upsert(1, BoundingSphere{glm::vec3(0.f), 1.f});
    index.flush();
    index.upsert(2, BoundingSphere{glm::vec3(0.f), 1.f});

    index.clear();
    EXPECT_FALSE(index.hasPendingChanges());
    EXPECT_EQ(index.size(), 0u);
    EXPECT_TRUE(query(index).empty());
}

TEST(BoundingVolumeIndex, MarkAddedCancelsQueuedRemove)
{
    BoundingVolumeIndex index([](ObjectId) -> std::optional<BoundingSphere> {
        return BoundingSphere{glm::vec3(0.f), 1.f};
    });

    index.markAdded(9);
    index.flush();

    index.remove(9);
    index.markAdded(9);

    EXPECT_EQ(query(index), std::vector<ObjectId>{9});
}
