#include <gtest/gtest.h>

#include "PointerEventTypes.hpp"
#include "SceneObject.hpp"
#include "SyntheticEvent.hpp"
#include "test_helpers.hpp"

TEST(SyntheticEvent, CopiesNativeFields)
{
    NativeInputEvent native = test::mouse(NativeEventType::MouseDown, 12.f, 34.f, 500.0, 2);
    native.screenX          = 112.f;
    native.screenY          = 134.f;
    native.buttons          = 2;
    native.shiftKey         = true;
    native.metaKey          = true;

    SceneObject target(5);
    SceneObject related(6);

    Hit hit;
    hit.id       = 5;
    hit.object   = &target;
    hit.distance = 3.5f;

    SyntheticEvent e = SyntheticEvent::fromNative(native, pointer_events::MouseDown, &target, &related, hit);

    EXPECT_EQ(e.type, "mousedown");
    EXPECT_EQ(e.nativeType, NativeEventType::MouseDown);
    EXPECT_FLOAT_EQ(e.clientX, 12.f);
    EXPECT_FLOAT_EQ(e.clientY, 34.f);
    EXPECT_FLOAT_EQ(e.screenX, 112.f);
    EXPECT_EQ(e.button, 2);
    EXPECT_EQ(e.buttons, 2);
    EXPECT_TRUE(e.shiftKey);
    EXPECT_FALSE(e.ctrlKey);
    EXPECT_TRUE(e.metaKey);
    EXPECT_DOUBLE_EQ(e.timeStamp, 500.0);
    EXPECT_EQ(e.target, &target);
    EXPECT_EQ(e.relatedTarget, &related);
    EXPECT_EQ(e.currentTarget, nullptr);
    ASSERT_TRUE(e.extra.has_value());
    EXPECT_FLOAT_EQ(e.extra->distance, 3.5f);
    EXPECT_EQ(e.nativeEvent(), &native);
}

TEST(SyntheticEvent, SingleTouchStartUsesTouchCoordinates)
{
    NativeInputEvent native = test::touchStart(40.f, 50.f, 0.0);
    native.clientX          = 0.f;
    native.clientY          = 0.f;

    SyntheticEvent e = SyntheticEvent::fromNative(native, pointer_events::MouseDown, nullptr, nullptr, std::nullopt);

    EXPECT_FLOAT_EQ(e.clientX, 40.f);
    EXPECT_FLOAT_EQ(e.clientY, 50.f);
    EXPECT_EQ(e.touches.size(), 1u);
}

TEST(SyntheticEvent, TouchEndUsesChangedTouches)
{
    NativeInputEvent native = test::touchEnd(70.f, 80.f, 0.0);
    native.clientX          = 0.f;
    native.clientY          = 0.f;

    SyntheticEvent e = SyntheticEvent::fromNative(native, pointer_events::MouseUp, nullptr, nullptr, std::nullopt);

    EXPECT_FLOAT_EQ(e.clientX, 70.f);
    EXPECT_FLOAT_EQ(e.clientY, 80.f);
}

TEST(SyntheticEvent, MultiTouchKeepsNativeCoordinates)
{
    NativeInputEvent native = test::touch(NativeEventType::TouchMove,
                                          {test::touchAt(10.f, 10.f, 1), test::touchAt(90.f, 90.f, 2)},
                                          {test::touchAt(10.f, 10.f, 1)},
                                          0.0);
    native.clientX = 1.f;
    native.clientY = 2.f;

    SyntheticEvent e = SyntheticEvent::fromNative(native, pointer_events::MouseMove, nullptr, nullptr, std::nullopt);

    EXPECT_FLOAT_EQ(e.clientX, 1.f);
    EXPECT_FLOAT_EQ(e.clientY, 2.f);
}

TEST(SyntheticEvent, PreventDefaultAndStopPropagationForwardToNative)
{
    NativeInputEvent native;
    SyntheticEvent   e = SyntheticEvent::fromNative(native, pointer_events::Click, nullptr, nullptr, std::nullopt);

    EXPECT_FALSE(e.defaultPrevented());
    e.preventDefault();
    EXPECT_TRUE(e.defaultPrevented());
    EXPECT_TRUE(native.defaultPrevented);

    e.stopPropagation();
    EXPECT_TRUE(e.propagationStopped());
    EXPECT_TRUE(native.propagationStopped);
}

TEST(SyntheticEvent, DetachedEventKeepsOwnFlagsOnly)
{
    NativeInputEvent native;
    SyntheticEvent   e = SyntheticEvent::fromNative(native, pointer_events::DragStart, nullptr, nullptr, std::nullopt);
    e.detachNative();

    EXPECT_EQ(e.nativeEvent(), nullptr);
    e.preventDefault();
    e.stopPropagation();

    EXPECT_TRUE(e.defaultPrevented());
    EXPECT_TRUE(e.propagationStopped());
    EXPECT_FALSE(native.defaultPrevented);
    EXPECT_FALSE(native.propagationStopped);
}

TEST(SyntheticEvent, RayFieldsAreCarried)
{
    NativeInputEvent native;
    native.isRayEvent = true;
    native.ray        = un::make_ray(glm::vec3(1.f, 2.f, 3.f), glm::vec3(0.f, 0.f, -1.f));

    SyntheticEvent e = SyntheticEvent::fromNative(native, pointer_events::MouseMove, nullptr, nullptr, std::nullopt);

    EXPECT_TRUE(e.isRayEvent);
    ASSERT_TRUE(e.ray.has_value());
    EXPECT_FLOAT_EQ(e.ray->org.y, 2.f);
}
