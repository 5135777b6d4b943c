#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>
#include <random>
#include <set>

#include "BoundingSphereOctree.hpp"

namespace
{
    std::map<ObjectId, int> visitCounts(const BoundingSphereOctree& tree, const un::ray& ray)
    {
        std::map<ObjectId, int> counts;
        tree.forEachSphereOnRay(ray, [&](const BoundingSphere&, ObjectId id) {
            ++counts[id];
        });
        return counts;
    }

    // Reference answer: brute force over every sphere.
    std::set<ObjectId> bruteForce(const std::map<ObjectId, BoundingSphere>& spheres, const un::ray& ray)
    {
        std::set<ObjectId> out;
        for (const auto& [id, s] : spheres)
        {
            float t = 0.0f;
            if (s.intersects(ray, t))
                out.insert(id);
        }
        return out;
    }
} // namespace

TEST(BoundingSphereOctree, EmptyTreeVisitsNothing)
{
    BoundingSphereOctree tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.depth(), -1);
    EXPECT_TRUE(visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(1.f, 0.f, 0.f))).empty());
}

TEST(BoundingSphereOctree, PutAndQuerySingleSphere)
{
    BoundingSphereOctree tree;
    EXPECT_TRUE(tree.putSphere(7, {glm::vec3(0.f, 0.f, -5.f), 1.0f}));
    EXPECT_EQ(tree.size(), 1u);

    const auto hit = visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 0.f, -1.f)));
    ASSERT_EQ(hit.size(), 1u);
    EXPECT_EQ(hit.at(7), 1);

    const auto miss = visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 1.f, 0.f)));
    EXPECT_TRUE(miss.empty());
}

TEST(BoundingSphereOctree, SphereBehindOriginIsNotVisited)
{
    BoundingSphereOctree tree;
    tree.putSphere(1, {glm::vec3(0.f, 0.f, 5.f), 1.0f});

    EXPECT_TRUE(visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 0.f, -1.f))).empty());
}

TEST(BoundingSphereOctree, OriginInsideSphereIsVisited)
{
    BoundingSphereOctree tree;
    tree.putSphere(1, {glm::vec3(0.f), 2.0f});

    const auto hit = visitCounts(tree, un::make_ray(glm::vec3(0.5f, 0.f, 0.f), glm::vec3(0.f, 0.f, 1.f)));
    EXPECT_EQ(hit.size(), 1u);
}

TEST(BoundingSphereOctree, EverySphereOnTheRayIsVisitedExactlyOnce)
{
    OctreeSettings settings;
    settings.maxLeavesPerNode = 2;

    BoundingSphereOctree             tree(settings);
    std::map<ObjectId, BoundingSphere> spheres;

    std::mt19937                          rng(1234);
    std::uniform_real_distribution<float> pos(-50.f, 50.f);
    std::uniform_real_distribution<float> rad(0.1f, 6.f);

    for (ObjectId id = 1; id <= 500; ++id)
    {
        BoundingSphere s{glm::vec3(pos(rng), pos(rng), pos(rng)), rad(rng)};
        spheres[id] = s;
        ASSERT_TRUE(tree.putSphere(id, s));
    }
    EXPECT_EQ(tree.size(), 500u);
    EXPECT_GT(tree.depth(), 0);

    for (int i = 0; i < 20; ++i)
    {
        const un::ray ray = un::make_ray(glm::vec3(pos(rng), pos(rng), -80.f),
                                         glm::vec3(pos(rng) * 0.01f, pos(rng) * 0.01f, 1.f));

        const auto counts = visitCounts(tree, ray);
        for (const auto& [id, n] : counts)
            EXPECT_EQ(n, 1) << "sphere " << id << " visited " << n << " times";

        std::set<ObjectId> visited;
        for (const auto& [id, n] : counts)
            visited.insert(id);

        EXPECT_EQ(visited, bruteForce(spheres, ray));
    }
}

TEST(BoundingSphereOctree, RemovedSphereIsNeverYielded)
{
    BoundingSphereOctree tree;
    for (ObjectId id = 1; id <= 20; ++id)
        tree.putSphere(id, {glm::vec3(0.f, 0.f, -static_cast<float>(id) * 3.f), 1.0f});

    EXPECT_TRUE(tree.removeSphere(5));
    EXPECT_FALSE(tree.removeSphere(5));
    EXPECT_FALSE(tree.removeSphere(999));
    EXPECT_EQ(tree.sphere(5), nullptr);

    const auto counts = visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 0.f, -1.f)));
    EXPECT_EQ(counts.size(), 19u);
    EXPECT_EQ(counts.count(5), 0u);
}

TEST(BoundingSphereOctree, PutReplacesPreviousSphere)
{
    BoundingSphereOctree tree;
    tree.putSphere(3, {glm::vec3(0.f, 0.f, -5.f), 1.0f});
    tree.putSphere(3, {glm::vec3(100.f, 0.f, -5.f), 1.0f});

    EXPECT_EQ(tree.size(), 1u);
    ASSERT_NE(tree.sphere(3), nullptr);
    EXPECT_FLOAT_EQ(tree.sphere(3)->center.x, 100.f);

    EXPECT_TRUE(visitCounts(tree, un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 0.f, -1.f))).empty());
    EXPECT_EQ(visitCounts(tree, un::make_ray(glm::vec3(100.f, 0.f, 0.f), glm::vec3(0.f, 0.f, -1.f))).size(), 1u);
}

TEST(BoundingSphereOctree, NonFiniteSphereIsRejectedAndDropsOldEntry)
{
    BoundingSphereOctree tree;
    tree.putSphere(1, {glm::vec3(0.f), 1.0f});

    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(tree.putSphere(1, {glm::vec3(nan, 0.f, 0.f), 1.0f}));
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_FALSE(tree.putSphere(2, {glm::vec3(0.f), std::numeric_limits<float>::infinity()}));
    EXPECT_TRUE(tree.empty());
}

TEST(BoundingSphereOctree, HugeAndTinySpheresCoexist)
{
    OctreeSettings settings;
    settings.maxLeavesPerNode = 1;

    BoundingSphereOctree tree(settings);
    tree.putSphere(1, {glm::vec3(0.f), 1000.f});
    for (ObjectId id = 2; id < 40; ++id)
        tree.putSphere(id, {glm::vec3(static_cast<float>(id), 0.f, 0.f), 0.01f});

    const auto counts = visitCounts(tree, un::make_ray(glm::vec3(0.f, 0.f, 0.f), glm::vec3(1.f, 0.f, 0.f)));
    EXPECT_EQ(counts.size(), 39u);
    for (const auto& [id, n] : counts)
        EXPECT_EQ(n, 1);
}

TEST(BoundingSphereOctree, DepthIsBoundedBySettings)
{
    OctreeSettings settings;
    settings.maxLeavesPerNode = 1;
    settings.maxDepth         = 3;

    BoundingSphereOctree tree(settings);
    // Identical centers can never be separated by splitting.
    for (ObjectId id = 1; id <= 16; ++id)
        tree.putSphere(id, {glm::vec3(0.25f), 0.001f});

    EXPECT_LE(tree.depth(), 3);
    EXPECT_EQ(visitCounts(tree, un::make_ray(glm::vec3(0.25f, 0.25f, 5.f), glm::vec3(0.f, 0.f, -1.f))).size(), 16u);
}

TEST(BoundingSphereOctree, ClearEmptiesTheTree)
{
    BoundingSphereOctree tree;
    tree.putSphere(1, {glm::vec3(0.f), 1.f});
    tree.putSphere(2, {glm::vec3(5.f), 1.f});
    tree.clear();

    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.sphere(1), nullptr);
    EXPECT_TRUE(tree.putSphere(1, {glm::vec3(0.f), 1.f}));
}

TEST(BoundingSphereOctree, FarSphereSurvivesRepeatedRootGrowth)
{
    BoundingSphereOctree tree;
    tree.putSphere(1, {glm::vec3(0.f), 1.0f});
    tree.putSphere(2, {glm::vec3(1e25f, 0.f, 0.f), 1e6f});

    const un::ray ray = un::make_ray(glm::vec3(1e25f, 0.f, -1e7f), glm::vec3(0.f, 0.f, 1.f));
    EXPECT_EQ(visitCounts(tree, ray).count(2), 1u);

    // Growing toward the opposite side wraps the old root in a new one.
    tree.putSphere(3, {glm::vec3(-1e25f, 0.f, 0.f), 1e6f});

    const auto counts = visitCounts(tree, ray);
    ASSERT_EQ(counts.count(2), 1u);
    EXPECT_EQ(counts.at(2), 1);
    EXPECT_EQ(tree.size(), 3u);

    EXPECT_TRUE(tree.removeSphere(2));
    EXPECT_EQ(visitCounts(tree, ray).count(2), 0u);
    EXPECT_NE(tree.sphere(3), nullptr);
}
