#include <gtest/gtest.h>

#include "Viewport.hpp"
#include "test_helpers.hpp"

TEST(Viewport, ProjectsTargetToCenter)
{
    Viewport vp;
    test::setupViewport(vp);

    const glm::vec3 p = vp.project(glm::vec3(0.f));
    EXPECT_NEAR(p.x, 100.f, 1e-3f);
    EXPECT_NEAR(p.y, 100.f, 1e-3f);
    EXPECT_GT(p.z, 0.f);
    EXPECT_LT(p.z, 1.f);
}

TEST(Viewport, ScreenYGrowsDownwards)
{
    Viewport vp;
    test::setupViewport(vp);

    EXPECT_LT(vp.project(glm::vec3(0.f, 1.f, 0.f)).y, 100.f);
    EXPECT_GT(vp.project(glm::vec3(1.f, 0.f, 0.f)).x, 100.f);
}

TEST(Viewport, UnprojectInvertsProject)
{
    Viewport vp;
    test::setupViewport(vp);

    const glm::vec3 world(1.5f, -2.f, -3.f);
    const glm::vec3 back = vp.unproject(vp.project(world));

    EXPECT_NEAR(back.x, world.x, 1e-2f);
    EXPECT_NEAR(back.y, world.y, 1e-2f);
    EXPECT_NEAR(back.z, world.z, 1e-2f);
}

TEST(Viewport, RayThroughPixelPassesThroughProjectedPoint)
{
    Viewport vp;
    test::setupViewport(vp);

    const un::ray center = vp.ray(100.f, 100.f);
    EXPECT_NEAR(center.dir.z, -1.f, 1e-4f);
    EXPECT_NEAR(glm::length(center.dir), 1.f, 1e-5f);

    const glm::vec3 world(2.f, 1.f, 0.f);
    const glm::vec3 s   = vp.project(world);
    const un::ray   r   = vp.ray(s.x, s.y);
    const float     t   = glm::dot(world - r.org, r.dir);
    const glm::vec3 pt  = un::ray_point(r, t);

    EXPECT_NEAR(glm::length(pt - world), 0.f, 1e-3f);
}

TEST(Viewport, OrthographicRaysAreParallel)
{
    Viewport vp;
    vp.resize(200, 100);
    vp.lookAt(glm::vec3(0.f, 0.f, 10.f), glm::vec3(0.f));
    vp.orthographic(5.f, 0.1f, 100.f);

    EXPECT_EQ(vp.viewMode(), ViewMode::ORTHOGRAPHIC);

    const un::ray a = vp.ray(0.f, 0.f);
    const un::ray b = vp.ray(200.f, 100.f);
    EXPECT_NEAR(glm::dot(a.dir, b.dir), 1.f, 1e-5f);

    // Top-left corner: half height 5, half width 10.
    EXPECT_NEAR(a.org.x, -10.f, 1e-3f);
    EXPECT_NEAR(a.org.y, 5.f, 1e-3f);
}

TEST(Viewport, EmptyViewportIsInert)
{
    Viewport vp;
    EXPECT_EQ(vp.project(glm::vec3(1.f)), glm::vec3(0.f));
    EXPECT_EQ(vp.unproject(glm::vec3(1.f)), glm::vec3(0.f));
    EXPECT_TRUE(un::is_zero(vp.ray(1.f, 1.f).dir));

    vp.resize(-5, 10);
    EXPECT_EQ(vp.width(), 0);
    EXPECT_FLOAT_EQ(vp.aspect(), 1.f);
}

TEST(Viewport, LinearDepthAndCamera)
{
    Viewport vp;
    test::setupViewport(vp);

    EXPECT_NEAR(vp.linearDepth(glm::vec3(0.f)), 10.f, 1e-4f);
    EXPECT_NEAR(vp.linearDepth(glm::vec3(0.f, 0.f, 20.f)), -10.f, 1e-4f);
    EXPECT_NEAR(vp.cameraPosition().z, 10.f, 1e-4f);
    EXPECT_NEAR(vp.viewDirection().z, -1.f, 1e-5f);
}
