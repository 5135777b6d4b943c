#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "CoreTypes.hpp"
#include "EventRegistry.hpp"
#include "Hit.hpp"
#include "NativeInputEvent.hpp"
#include "PointerSettings.hpp"
#include "SyntheticEvent.hpp"

class HitTester;
class InputSurface;
class SceneObjectTable;
class Viewport;

/**
 * @brief Drag in progress.
 *
 * The dragstart event is built on press but only fired on the first motion
 * that follows, so a plain click never produces drag events.
 */
struct DragInfo
{
    ObjectId                      draggedId      = 0;
    bool                          dragStartFired = false;
    std::optional<SyntheticEvent> dragStartEvent;
};

/**
 * @brief Candidate tap started by a single-touch press.
 */
struct TapInfo
{
    ObjectId targetId   = 0;
    float    x          = 0.0f;
    float    y          = 0.0f;
    double   startTime  = 0.0;
    bool     isDblClick = false;
};

/**
 * @brief Gesture trackers of one input surface.
 */
struct GestureState
{
    std::optional<ObjectId> hoveredId;
    std::optional<DragInfo> drag;
    std::optional<TapInfo>  tap;
};

/**
 * @brief Pointer gesture state machine for one surface.
 *
 * Consumes native motion, action and drop events, resolves targets through
 * the HitTester and fires synthetic events that bubble from the target up
 * the parent chain:
 *
 *  - motion: lazy dragstart, drag, mouseout/dragleave, mouseover/dragenter,
 *    mousemove/dragover, and tap cancellation when a touch travels too far
 *  - action: canonical press/release (touchstart -> mousedown, touchend and
 *    touchcancel -> mouseup), tap-to-click and double-tap, drag initiation
 *  - drop: drop on the release target, dragend on the dragged object
 *  - background: a click on the surface that resolves no target goes to
 *    the background click handler, if one is set
 *
 * Time comes from NativeInputEvent::timeStamp, never from a wall clock.
 * Handler exceptions are not caught and abort the current bubbling walk.
 */
class PointerPipeline
{
public:
    PointerPipeline(HitTester&              hitTester,
                    EventRegistry&          registry,
                    const SceneObjectTable& objects,
                    PointerSettings         settings = {});

    PointerPipeline(const PointerPipeline&)            = delete;
    PointerPipeline& operator=(const PointerPipeline&) = delete;

    void setSurface(InputSurface* surface) noexcept;
    void setViewport(const Viewport* viewport) noexcept;

    /// Receives clicks that hit no pointer target. The event has no target.
    void setBackgroundClickHandler(EventHandler handler);

    [[nodiscard]] const PointerSettings& settings() const noexcept;
    void                                 settings(const PointerSettings& value) noexcept;

    /// Pointer moved (mousemove, mouseout, touchmove, ray motion).
    void handleMotionEvent(NativeInputEvent& e);

    /// Press, release, click, wheel or touch start/end/cancel.
    void handleActionEvent(NativeInputEvent& e);

    /// Release seen while dragging, on or off the surface. Ignored when not dragging.
    void handleDropEvent(NativeInputEvent& e);

    /**
     * @brief Resolves the pointer target of @p e.
     *
     * Multi-touch events, events without usable coordinates, and ray events
     * without a ray have no target.
     */
    [[nodiscard]] std::optional<Hit> findHoverTarget(const NativeInputEvent& e);

    /**
     * @brief Fires @p event at @p targetId and bubbles it up the parent chain.
     *
     * The chain is captured before the first handler runs; objects removed
     * during the walk are skipped.
     */
    void dispatch(SyntheticEvent& event, ObjectId targetId);

    [[nodiscard]] const GestureState& state() const noexcept;
    [[nodiscard]] bool                isDragging() const noexcept;

    /// Drops hover and tap references to a removed object.
    void forgetObject(ObjectId id) noexcept;

    /// Clears every tracker and stops release capture.
    void reset();

private:
    void fire(std::string_view          type,
              NativeInputEvent&         native,
              ObjectId                  targetId,
              std::optional<ObjectId>   relatedId,
              const std::optional<Hit>& extra);

    [[nodiscard]] bool hasListenerInChain(ObjectId id, std::string_view type) const;
    [[nodiscard]] bool withinTapDistance(const TouchPoint& touch) const noexcept;

    void setReleaseCapture(bool enabled);
    void setContextMenu(bool enabled);

    HitTester&              m_hitTester;
    EventRegistry&          m_registry;
    const SceneObjectTable& m_objects;
    PointerSettings         m_settings;

    InputSurface*   m_surface  = nullptr;
    const Viewport* m_viewport = nullptr;

    GestureState m_state;
    EventHandler m_backgroundClick;
};
