#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Hit.hpp"
#include "NativeInputEvent.hpp"

class SceneObject;

/**
 * @brief Normalized pointer event handed to listeners.
 *
 * Every data field of the native event is copied. For single-touch events
 * the client/screen/page coordinates are taken from the active touch (the
 * changed touch for touch-end/cancel), so touch handlers can read them like
 * mouse coordinates.
 *
 * `target` stays fixed while the event bubbles; `currentTarget` is the
 * object whose handlers are currently running. The propagation and default
 * flags are only set by stopPropagation() and preventDefault(), which also
 * forward the call to the native event while it is still attached.
 */
class SyntheticEvent
{
public:
    /**
     * @brief Builds the event delivered for @p native.
     *
     * @p native must outlive the synthetic event unless detachNative() is called.
     */
    [[nodiscard]] static SyntheticEvent fromNative(NativeInputEvent&  native,
                                                   std::string_view   type,
                                                   SceneObject*       target,
                                                   SceneObject*       relatedTarget,
                                                   std::optional<Hit> extra);

    std::string     type;
    NativeEventType nativeType = NativeEventType::MouseMove;

    float clientX = 0.0f;
    float clientY = 0.0f;
    float screenX = 0.0f;
    float screenY = 0.0f;
    float pageX   = 0.0f;
    float pageY   = 0.0f;

    int button  = 0;
    int buttons = 0;

    bool shiftKey = false;
    bool ctrlKey  = false;
    bool altKey   = false;
    bool metaKey  = false;

    float deltaX    = 0.0f;
    float deltaY    = 0.0f;
    float deltaZ    = 0.0f;
    int   deltaMode = 0;

    double timeStamp = 0.0;

    std::vector<TouchPoint> touches;
    std::vector<TouchPoint> changedTouches;

    bool                   isRayEvent = false;
    std::optional<un::ray> ray;

    SceneObject*       target        = nullptr;
    SceneObject*       currentTarget = nullptr;
    SceneObject*       relatedTarget = nullptr;
    std::optional<Hit> extra; ///< Hit that resolved the target, if any.

    void preventDefault() noexcept;
    void stopPropagation() noexcept;

    [[nodiscard]] bool defaultPrevented() const noexcept;
    [[nodiscard]] bool propagationStopped() const noexcept;

    /// Native event this one was built from, nullptr once detached.
    [[nodiscard]] NativeInputEvent* nativeEvent() const noexcept;

    /// Stops forwarding to the native event; used for events stored past their native's lifetime.
    void detachNative() noexcept;

private:
    SyntheticEvent() = default;

    NativeInputEvent* m_native             = nullptr;
    bool              m_defaultPrevented   = false;
    bool              m_propagationStopped = false;
};
