#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "CoreUtilities.hpp"

/**
 * @brief Raw input event kinds an InputSurface can forward.
 */
enum class NativeEventType : uint8_t
{
    MouseMove,
    MouseOut,
    MouseDown,
    MouseUp,
    Click,
    DblClick,
    Wheel,
    TouchStart,
    TouchMove,
    TouchEnd,
    TouchCancel
};

/// DOM-style name of the event type ("mousemove", "touchstart", ...).
[[nodiscard]] std::string_view toString(NativeEventType type) noexcept;

[[nodiscard]] constexpr bool isTouchType(NativeEventType type) noexcept
{
    return type == NativeEventType::TouchStart || type == NativeEventType::TouchMove ||
           type == NativeEventType::TouchEnd || type == NativeEventType::TouchCancel;
}

[[nodiscard]] constexpr bool isTouchEndOrCancel(NativeEventType type) noexcept
{
    return type == NativeEventType::TouchEnd || type == NativeEventType::TouchCancel;
}

/// Pointer moved without an action.
[[nodiscard]] constexpr bool isMotionType(NativeEventType type) noexcept
{
    return type == NativeEventType::MouseMove || type == NativeEventType::MouseOut ||
           type == NativeEventType::TouchMove;
}

/// Events that can end a drag.
[[nodiscard]] constexpr bool isReleaseType(NativeEventType type) noexcept
{
    return type == NativeEventType::MouseUp || isTouchEndOrCancel(type);
}

/**
 * @brief One touch contact of a touch event.
 */
struct TouchPoint
{
    int64_t identifier = 0;
    float   clientX    = 0.0f;
    float   clientY    = 0.0f;
    float   screenX    = 0.0f;
    float   screenY    = 0.0f;
    float   pageX      = 0.0f;
    float   pageY      = 0.0f;
};

/**
 * @brief Input event as delivered by an InputSurface or a VR controller.
 *
 * For touch events `touches` holds the contacts still down and
 * `changedTouches` the contacts that triggered this event. Ray events
 * carry their picking ray instead of meaningful coordinates.
 */
struct NativeInputEvent
{
    NativeEventType type = NativeEventType::MouseMove;

    float clientX = 0.0f;
    float clientY = 0.0f;
    float screenX = 0.0f;
    float screenY = 0.0f;
    float pageX   = 0.0f;
    float pageY   = 0.0f;

    int button  = 0; ///< 0 primary, 1 middle, 2 secondary.
    int buttons = 0; ///< Bit mask of pressed buttons.

    bool shiftKey = false;
    bool ctrlKey  = false;
    bool altKey   = false;
    bool metaKey  = false;

    float deltaX    = 0.0f;
    float deltaY    = 0.0f;
    float deltaZ    = 0.0f;
    int   deltaMode = 0;

    double timeStamp = 0.0; ///< Milliseconds, monotonic per surface.

    std::vector<TouchPoint> touches;
    std::vector<TouchPoint> changedTouches;

    bool                   isRayEvent = false;
    std::optional<un::ray> ray;

    /// False for release events captured outside the surface during a drag.
    bool originatedOnSurface = true;

    bool defaultPrevented   = false;
    bool propagationStopped = false;

    void preventDefault() noexcept { defaultPrevented = true; }
    void stopPropagation() noexcept { propagationStopped = true; }

    [[nodiscard]] bool isTouch() const noexcept { return isTouchType(type); }
};
