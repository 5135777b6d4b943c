#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "MeshIntersector.hpp"
#include "PointerEventTypes.hpp"
#include "PointerWorld.hpp"
#include "SceneSphere.hpp"
#include "test_helpers.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace
{
    class PointerWorldTest : public ::testing::Test
    {
    protected:
        PointerWorldTest()
        {
            test::setupViewport(viewport);
            world.setViewport(&viewport);
            world.setSurface(&surface);
        }

        SceneSphere* makeSphere(ObjectId id, const glm::vec3& center, float radius)
        {
            auto s = std::make_unique<SceneSphere>(id, radius);
            s->model(glm::translate(glm::mat4(1.0f), center));
            SceneSphere* raw = s.get();
            owned.push_back(std::move(s));
            return raw;
        }

        SceneSphere* addSphere(ObjectId id, const glm::vec3& center, float radius)
        {
            SceneSphere* s = makeSphere(id, center, radius);
            world.objectAdded(s);
            return s;
        }

        void send(NativeInputEvent e) { world.dispatchNativeEvent(e); }

        std::vector<std::unique_ptr<SceneObject>> owned;
        Viewport                                  viewport;
        test::FakeSurface                         surface;
        PointerWorld                              world;
        test::EventLog                            log;
    };

    using Entries = std::vector<std::string>;

    const un::ray kDownZ = un::make_ray(glm::vec3(0.f, 0.f, 10.f), glm::vec3(0.f, 0.f, -1.f));
} // namespace

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

TEST_F(PointerWorldTest, AddedObjectsBecomePickable)
{
    SceneSphere* s = addSphere(1, glm::vec3(0.f), 1.f);

    EXPECT_EQ(world.object(1), s);
    EXPECT_EQ(world.hitTester().pickAtRay(kDownZ).size(), 1u);
}

TEST_F(PointerWorldTest, NullObjectThrows)
{
    EXPECT_THROW(world.objectAdded(nullptr), std::runtime_error);
}

TEST_F(PointerWorldTest, DuplicateIdKeepsFirstObject)
{
    SceneSphere* first  = addSphere(1, glm::vec3(0.f), 1.f);
    SceneSphere* second = makeSphere(1, glm::vec3(50.f, 0.f, 0.f), 1.f);

    world.objectAdded(second);

    EXPECT_EQ(world.object(1), first);
    EXPECT_EQ(world.hitTester().pickAtRay(kDownZ).size(), 1u);
}

TEST_F(PointerWorldTest, BoundsChangeIsPickedUpOnNextQuery)
{
    SceneSphere* s = addSphere(1, glm::vec3(0.f), 1.f);
    ASSERT_EQ(world.hitTester().pickAtRay(kDownZ).size(), 1u);

    s->model(glm::translate(glm::mat4(1.0f), glm::vec3(30.f, 0.f, 0.f)));
    world.objectBoundsChanged(1);
    EXPECT_TRUE(world.index().hasPendingChanges());
    EXPECT_TRUE(world.hitTester().pickAtRay(kDownZ).empty());

    EXPECT_NO_THROW(world.objectBoundsChanged(99));
}

TEST_F(PointerWorldTest, RemoveThenReAddInOneBatchStaysIndexed)
{
    SceneSphere* s = addSphere(1, glm::vec3(0.f), 1.f);
    world.index().flush();

    world.objectRemoved(1);
    world.objectAdded(s);

    EXPECT_EQ(world.hitTester().pickAtRay(kDownZ).size(), 1u);
}

TEST_F(PointerWorldTest, RemovedObjectLosesHover)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    world.addEventListener(1, pointer_events::MouseOver, log.record("a"));

    send(test::mouse(NativeEventType::MouseMove, 100.f, 100.f));
    ASSERT_EQ(world.pipeline().state().hoveredId, std::optional<ObjectId>(1));

    world.objectRemoved(1);
    EXPECT_FALSE(world.pipeline().state().hoveredId.has_value());
    EXPECT_EQ(world.object(1), nullptr);
    EXPECT_TRUE(world.hitTester().pickAtRay(kDownZ).empty());

    EXPECT_NO_THROW(world.objectRemoved(1));
}

TEST_F(PointerWorldTest, ListenersCanBeRemovedByToken)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    const ListenerId id = world.addEventListener(1, pointer_events::Click, log.record("a"));

    send(test::mouse(NativeEventType::Click, 100.f, 100.f));
    EXPECT_TRUE(world.removeEventListener(1, pointer_events::Click, id));
    send(test::mouse(NativeEventType::Click, 100.f, 100.f));

    EXPECT_EQ(log.entries, Entries{"a:click"});
}

// -----------------------------------------------------------------------------
// Routing
// -----------------------------------------------------------------------------

TEST_F(PointerWorldTest, ReleaseWhileDraggingDropsThenActs)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    for (std::string_view type : {pointer_events::DragStart, pointer_events::DragEnd, pointer_events::MouseUp})
        world.addEventListener(1, type, log.record("a"));

    send(test::mouse(NativeEventType::MouseDown, 100.f, 100.f));
    EXPECT_TRUE(surface.capturing);

    send(test::mouse(NativeEventType::MouseMove, 102.f, 100.f));
    send(test::mouse(NativeEventType::MouseUp, 102.f, 100.f));

    EXPECT_EQ(log.entries, (Entries{"a:dragstart", "a:dragend", "a:mouseup"}));
    EXPECT_FALSE(surface.capturing);
}

TEST_F(PointerWorldTest, CapturedReleaseOutsideSurfaceOnlyEndsDrag)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    for (std::string_view type : {pointer_events::DragStart, pointer_events::DragEnd, pointer_events::MouseUp})
        world.addEventListener(1, type, log.record("a"));

    send(test::mouse(NativeEventType::MouseDown, 100.f, 100.f));

    NativeInputEvent up    = test::mouse(NativeEventType::MouseUp, 100.f, 100.f);
    up.originatedOnSurface = false;
    send(up);

    EXPECT_EQ(log.entries, Entries{"a:dragend"});
    EXPECT_FALSE(world.pipeline().isDragging());
}

TEST_F(PointerWorldTest, RayMotionAndActionUseTheRay)
{
    addSphere(1, glm::vec3(0.f, 0.f, -5.f), 1.f);
    world.addEventListener(1, pointer_events::MouseOver, log.record("a"));
    world.addEventListener(1, pointer_events::Wheel, [&](SyntheticEvent& e) {
        log.entries.push_back("a:wheel");
        EXPECT_TRUE(e.isRayEvent);
        EXPECT_FLOAT_EQ(e.deltaY, 3.f);
        EXPECT_TRUE(e.ctrlKey);
    });

    // No viewport is needed for ray input.
    world.setViewport(nullptr);

    const un::ray ray = un::make_ray(glm::vec3(0.f), glm::vec3(0.f, 0.f, -1.f));
    world.pointerRayMotion(ray, 10.0);

    RayActionParams params;
    params.deltaY  = 3.f;
    params.ctrlKey = true;
    world.pointerRayAction(NativeEventType::Wheel, ray, params);

    EXPECT_EQ(log.entries, (Entries{"a:mouseover", "a:wheel"}));
}

TEST_F(PointerWorldTest, EventsAfterDestroyAreIgnored)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    world.addEventListener(1, pointer_events::MouseDown, log.record("a"));

    world.destroy();
    send(test::mouse(NativeEventType::MouseDown, 100.f, 100.f));
    world.pointerRayMotion(kDownZ);

    EXPECT_TRUE(log.entries.empty());
    EXPECT_TRUE(world.destroyed());
    EXPECT_EQ(world.object(1), nullptr);
    EXPECT_EQ(world.registry().listenerCount(), 0u);
    EXPECT_FALSE(surface.listening);
}

TEST_F(PointerWorldTest, DestroyIsIdempotentAndEndsDrag)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    world.addEventListener(1, pointer_events::DragStart, [](SyntheticEvent&) {});
    send(test::mouse(NativeEventType::MouseDown, 100.f, 100.f));
    ASSERT_TRUE(surface.capturing);

    world.destroy();
    const int calls = surface.listenerCalls;
    world.destroy();

    EXPECT_FALSE(surface.capturing);
    EXPECT_EQ(surface.listenerCalls, calls);

    // Objects added after destroy are ignored.
    world.objectAdded(makeSphere(2, glm::vec3(0.f), 1.f));
    EXPECT_EQ(world.object(2), nullptr);
}

// -----------------------------------------------------------------------------
// Camera and overlays
// -----------------------------------------------------------------------------

TEST_F(PointerWorldTest, ProjectWorldPositionSignsDistance)
{
    const auto front = world.projectWorldPosition(glm::vec3(0.f));
    ASSERT_TRUE(front.has_value());
    EXPECT_NEAR(front->x, 100.f, 1e-3f);
    EXPECT_NEAR(front->y, 100.f, 1e-3f);
    EXPECT_NEAR(front->signedDistance, 10.f, 1e-4f);

    const auto behind = world.projectWorldPosition(glm::vec3(0.f, 0.f, 20.f));
    ASSERT_TRUE(behind.has_value());
    EXPECT_NEAR(behind->signedDistance, -10.f, 1e-4f);

    world.setViewport(nullptr);
    EXPECT_FALSE(world.projectWorldPosition(glm::vec3(0.f)).has_value());

    Viewport empty;
    world.setViewport(&empty);
    EXPECT_FALSE(world.projectWorldPosition(glm::vec3(0.f)).has_value());
}

TEST_F(PointerWorldTest, OverlayItemsSkipHiddenAndRemovedObjects)
{
    addSphere(3, glm::vec3(2.f, 0.f, 0.f), 1.f);
    addSphere(1, glm::vec3(0.f), 1.f);
    addSphere(2, glm::vec3(0.f, 0.f, 30.f), 1.f); // behind the camera
    SceneSphere* dying = addSphere(4, glm::vec3(-2.f, 0.f, 0.f), 1.f);

    for (ObjectId id : {1, 2, 3, 4, 5})
        world.addOverlay(id);

    dying->markDestroying();

    const std::vector<OverlayItem> items = world.collectOverlayItems();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, 1u);
    EXPECT_EQ(items[1].id, 3u);
    EXPECT_GT(items[1].x, items[0].x);
    EXPECT_NEAR(items[0].z, 10.f, 1e-4f);

    world.objectRemoved(3);
    world.removeOverlay(1);
    EXPECT_TRUE(world.collectOverlayItems().empty());
}

// -----------------------------------------------------------------------------
// Surface
// -----------------------------------------------------------------------------

TEST_F(PointerWorldTest, SurfaceSwitchTogglesListeners)
{
    EXPECT_TRUE(surface.listening);

    world.setPointerListenersEnabled(false);
    EXPECT_FALSE(surface.listening);
    world.setPointerListenersEnabled(true);
    EXPECT_TRUE(surface.listening);

    test::FakeSurface other;
    world.setSurface(&other);
    EXPECT_FALSE(surface.listening);
    EXPECT_TRUE(other.listening);

    world.setSurface(nullptr);
    EXPECT_FALSE(other.listening);
}

TEST_F(PointerWorldTest, SurfaceRectMapsClientCoordinates)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    world.addEventListener(1, pointer_events::MouseDown, log.record("a"));

    surface.rect = {20.f, 30.f, 400.f, 400.f};
    send(test::mouse(NativeEventType::MouseDown, 220.f, 230.f));

    EXPECT_EQ(log.entries, Entries{"a:mousedown"});
}

// -----------------------------------------------------------------------------
// Misc
// -----------------------------------------------------------------------------

TEST_F(PointerWorldTest, MeshIntersectorFactory)
{
    EXPECT_EQ(world.createMeshIntersector("Cpu")->name(), "Cpu");
    EXPECT_EQ(world.createMeshIntersector()->name(), world.settings().meshIntersector);
    EXPECT_THROW((void)world.createMeshIntersector("Nope"), std::runtime_error);
}

TEST(PointerWorld, StatsCallbackRunsOnlyWhenEnabled)
{
    Viewport vp;
    test::setupViewport(vp);

    SceneSphere sphere(1, 1.f);

    PointerSettings settings;
    settings.collectStats = true;

    PointerWorld world(settings);
    world.setViewport(&vp);
    world.objectAdded(&sphere);
    world.addEventListener(1, pointer_events::MouseMove, [](SyntheticEvent&) {});

    std::vector<PointerStats> reports;
    world.onStatsUpdate([&](const PointerStats& s) { reports.push_back(s); });

    NativeInputEvent e = test::mouse(NativeEventType::MouseMove, 100.f, 100.f);
    world.dispatchNativeEvent(e);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].hits, 1u);

    PointerWorld quiet;
    quiet.setViewport(&vp);
    int quietCalls = 0;
    quiet.onStatsUpdate([&](const PointerStats&) { ++quietCalls; });
    quiet.dispatchNativeEvent(e);
    EXPECT_EQ(quietCalls, 0);
}

TEST(PointerWorld, StatsSkipEventsThatDidNotPick)
{
    Viewport vp;
    test::setupViewport(vp);

    SceneSphere sphere(1, 1.f);

    PointerSettings settings;
    settings.collectStats = true;

    PointerWorld world(settings);
    world.setViewport(&vp);
    world.objectAdded(&sphere);
    world.addEventListener(1, pointer_events::Click, [](SyntheticEvent&) {});

    int reports = 0;
    world.onStatsUpdate([&](const PointerStats&) { ++reports; });

    // No motion listeners, so hover tracking never picks.
    NativeInputEvent move = test::mouse(NativeEventType::MouseMove, 100.f, 100.f);
    world.dispatchNativeEvent(move);
    EXPECT_EQ(reports, 0);

    NativeInputEvent click = test::mouse(NativeEventType::Click, 100.f, 100.f);
    world.dispatchNativeEvent(click);
    EXPECT_EQ(reports, 1);

    world.dispatchNativeEvent(move);
    EXPECT_EQ(reports, 1);
}

TEST_F(PointerWorldTest, BackgroundClickForEmptySpace)
{
    addSphere(1, glm::vec3(0.f), 1.f);
    world.addEventListener(1, pointer_events::Click, log.record("a"));

    std::vector<std::pair<float, float>> background;
    world.onBackgroundClick([&](SyntheticEvent& e) {
        EXPECT_EQ(e.target, nullptr);
        background.emplace_back(e.clientX, e.clientY);
    });

    send(test::mouse(NativeEventType::Click, 100.f, 100.f));
    send(test::mouse(NativeEventType::Click, 10.f, 20.f));

    EXPECT_EQ(log.entries, Entries{"a:click"});
    ASSERT_EQ(background.size(), 1u);
    EXPECT_FLOAT_EQ(background[0].first, 10.f);
    EXPECT_FLOAT_EQ(background[0].second, 20.f);

    // A controller ray that misses everything counts too.
    world.pointerRayAction(NativeEventType::Click, un::make_ray(glm::vec3(0.f, 5.f, 10.f), glm::vec3(0.f, 0.f, -1.f)));
    EXPECT_EQ(background.size(), 2u);

    world.destroy();
    send(test::mouse(NativeEventType::Click, 10.f, 20.f));
    EXPECT_EQ(background.size(), 2u);
}
