#include "PointerPipeline.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "EventRegistry.hpp"
#include "HitTester.hpp"
#include "InputSurface.hpp"
#include "PointerEventTypes.hpp"
#include "SceneObject.hpp"
#include "SceneObjectTable.hpp"
#include "Viewport.hpp"

namespace
{
    template<typename Types>
    bool anyListenerOf(const EventRegistry& registry, const Types& types)
    {
        return std::any_of(types.begin(), types.end(), [&](std::string_view type) {
            return registry.hasAnyListenersOfType(type);
        });
    }

    std::string_view canonicalActionType(NativeEventType type) noexcept
    {
        switch (type)
        {
            case NativeEventType::TouchStart:
                return pointer_events::MouseDown;
            case NativeEventType::TouchEnd:
            case NativeEventType::TouchCancel:
                return pointer_events::MouseUp;
            default:
                return toString(type);
        }
    }

    // Parent chains are expected to be short. Each step is resolved through
    // the object table; the walk stops at an unregistered id or a cycle.
    template<typename Visit>
    void walkChain(const SceneObjectTable& objects, ObjectId start, Visit&& visit)
    {
        std::vector<ObjectId>   seen;
        std::optional<ObjectId> id = start;
        while (id)
        {
            if (std::find(seen.begin(), seen.end(), *id) != seen.end())
                return;
            seen.push_back(*id);

            const SceneObject* node = objects.find(*id);
            if (!node || visit(*node))
                return;

            id = node->parentId();
        }
    }
} // namespace

PointerPipeline::PointerPipeline(HitTester&              hitTester,
                                 EventRegistry&          registry,
                                 const SceneObjectTable& objects,
                                 PointerSettings         settings) :
    m_hitTester{hitTester},
    m_registry{registry},
    m_objects{objects},
    m_settings{std::move(settings)}
{
}

void PointerPipeline::setSurface(InputSurface* surface) noexcept
{
    m_surface = surface;
}

void PointerPipeline::setBackgroundClickHandler(EventHandler handler)
{
    m_backgroundClick = std::move(handler);
}

void PointerPipeline::setViewport(const Viewport* viewport) noexcept
{
    m_viewport = viewport;
}

const PointerSettings& PointerPipeline::settings() const noexcept
{
    return m_settings;
}

void PointerPipeline::settings(const PointerSettings& value) noexcept
{
    m_settings = value;
}

// -----------------------------------------------------------------------------
// Motion
// -----------------------------------------------------------------------------

void PointerPipeline::handleMotionEvent(NativeInputEvent& e)
{
    if (anyListenerOf(m_registry, pointer_events::MotionTypes))
    {
        const bool dragging = m_state.drag.has_value();
        if (dragging)
        {
            const ObjectId draggedId = m_state.drag->draggedId;

            if (!m_state.drag->dragStartFired)
            {
                m_state.drag->dragStartFired = true;

                if (m_state.drag->dragStartEvent)
                {
                    SyntheticEvent start = std::move(*m_state.drag->dragStartEvent);
                    m_state.drag->dragStartEvent.reset();

                    // The dragged object may have been removed since the press.
                    if (SceneObject* dragged = m_objects.find(draggedId))
                    {
                        start.target = dragged;
                        dispatch(start, draggedId);
                    }
                }
            }

            fire(pointer_events::Drag, e, draggedId, std::nullopt, std::nullopt);
        }

        const std::optional<ObjectId> lastHovered = m_state.hoveredId;

        std::optional<Hit> hoverInfo;
        if (e.type != NativeEventType::MouseOut && !isTouchEndOrCancel(e.type))
            hoverInfo = findHoverTarget(e);

        const std::optional<ObjectId> hovered = hoverInfo ? std::optional<ObjectId>(hoverInfo->id) : std::nullopt;
        m_state.hoveredId                     = hovered;

        if (hovered != lastHovered)
        {
            if (lastHovered)
            {
                fire(pointer_events::MouseOut, e, *lastHovered, hovered, hoverInfo);
                if (dragging)
                    fire(pointer_events::DragLeave, e, *lastHovered, hovered, hoverInfo);
            }
            if (hovered)
            {
                fire(pointer_events::MouseOver, e, *hovered, lastHovered, hoverInfo);
                if (dragging)
                    fire(pointer_events::DragEnter, e, *hovered, lastHovered, hoverInfo);
            }
        }

        if (hovered)
        {
            fire(pointer_events::MouseMove, e, *hovered, std::nullopt, hoverInfo);
            if (dragging)
                fire(pointer_events::DragOver, e, *hovered, std::nullopt, hoverInfo);
        }
    }

    // A touch that wanders too far is a drag or scroll, not a tap.
    if (m_state.tap && e.type == NativeEventType::TouchMove && !e.changedTouches.empty() &&
        !withinTapDistance(e.changedTouches.front()))
    {
        m_state.tap.reset();
    }
}

// -----------------------------------------------------------------------------
// Action
// -----------------------------------------------------------------------------

void PointerPipeline::handleActionEvent(NativeInputEvent& e)
{
    // A single touch start also establishes hover, and suppresses the long-press menu.
    if (e.type == NativeEventType::TouchStart)
    {
        if (e.touches.size() == 1)
            handleMotionEvent(e);
        setContextMenu(false);
    }

    // Only clicks aimed at the surface itself count as background clicks.
    const bool backgroundClick = m_backgroundClick && e.type == NativeEventType::Click && e.originatedOnSurface;

    if (backgroundClick ||
        m_registry.hasAnyListenersOfType(pointer_events::DragStart) ||
        anyListenerOf(m_registry, pointer_events::ActionTypes))
    {
        const std::optional<Hit> hoverInfo = findHoverTarget(e);
        if (!hoverInfo && backgroundClick)
        {
            SyntheticEvent event = SyntheticEvent::fromNative(e, pointer_events::Click, nullptr, nullptr, std::nullopt);
            m_backgroundClick(event);
        }
        else if (hoverInfo)
        {
            const ObjectId targetId = hoverInfo->id;

            fire(canonicalActionType(e.type), e, targetId, std::nullopt, hoverInfo);

            // touchstart/touchend may be the two halves of a tap
            if (hasListenerInChain(targetId, pointer_events::Click) ||
                hasListenerInChain(targetId, pointer_events::DblClick))
            {
                const double now = e.timeStamp;

                if (e.type == NativeEventType::TouchStart && e.touches.size() == 1)
                {
                    TapInfo tap;
                    tap.targetId   = targetId;
                    tap.x          = e.touches.front().clientX;
                    tap.y          = e.touches.front().clientY;
                    tap.startTime  = now;
                    tap.isDblClick = m_state.tap && now - m_state.tap->startTime < m_settings.tapDblClickMaxDurationMs;
                    m_state.tap    = tap;
                }
                else if (m_state.tap && m_state.tap->targetId == targetId &&
                         e.type == NativeEventType::TouchEnd &&
                         e.touches.empty() && e.changedTouches.size() == 1 &&
                         now - m_state.tap->startTime < m_settings.tapGestureMaxDurationMs &&
                         withinTapDistance(e.changedTouches.front()))
                {
                    const bool isDblClick = m_state.tap->isDblClick;

                    fire(pointer_events::Click, e, targetId, std::nullopt, hoverInfo);
                    if (isDblClick)
                        fire(pointer_events::DblClick, e, targetId, std::nullopt, hoverInfo);
                }
            }

            // A primary press on a draggable object may start a drag.
            const bool primaryPress = (e.type == NativeEventType::MouseDown && e.button == 0) ||
                                      e.type == NativeEventType::TouchStart;

            if (primaryPress && m_registry.hasListenersOfType(targetId, pointer_events::DragStart))
            {
                if (SceneObject* target = m_objects.find(targetId))
                {
                    DragInfo drag;
                    drag.draggedId      = targetId;
                    drag.dragStartFired = false;
                    drag.dragStartEvent = SyntheticEvent::fromNative(e, pointer_events::DragStart, target, nullptr, hoverInfo);
                    drag.dragStartEvent->detachNative();

                    m_state.drag = std::move(drag);

                    // Releases outside the surface must still end the drag.
                    setReleaseCapture(true);
                }
            }

            e.preventDefault();
        }
    }

    // A single touch end also clears hover, and restores the context menu.
    if (isTouchEndOrCancel(e.type))
    {
        if (e.changedTouches.size() == 1)
            handleMotionEvent(e);
        setContextMenu(true);
    }
}

// -----------------------------------------------------------------------------
// Drop
// -----------------------------------------------------------------------------

void PointerPipeline::handleDropEvent(NativeInputEvent& e)
{
    if (!m_state.drag)
        return;

    const ObjectId draggedId = m_state.drag->draggedId;

    std::optional<Hit> hoverInfo;
    if (e.originatedOnSurface)
        hoverInfo = findHoverTarget(e);

    if (hoverInfo)
        fire(pointer_events::Drop, e, hoverInfo->id, std::nullopt, hoverInfo);

    fire(pointer_events::DragEnd, e, draggedId, std::nullopt, hoverInfo);

    setReleaseCapture(false);
    m_state.drag.reset();
}

// -----------------------------------------------------------------------------
// Targeting and dispatch
// -----------------------------------------------------------------------------

std::optional<Hit> PointerPipeline::findHoverTarget(const NativeInputEvent& e)
{
    std::vector<Hit> hits;

    if (e.isRayEvent)
    {
        if (!e.ray)
            return std::nullopt;

        hits = m_hitTester.pickAtRay(*e.ray);
    }
    else
    {
        float x = e.clientX;
        float y = e.clientY;

        if (e.isTouch())
        {
            // Only single touches are handled.
            if (e.touches.size() > 1)
                return std::nullopt;

            const TouchPoint* point = nullptr;
            if (!e.touches.empty())
                point = &e.touches.front();
            else if (!e.changedTouches.empty())
                point = &e.changedTouches.front();

            if (!point)
                return std::nullopt;

            x = point->clientX;
            y = point->clientY;
        }

        if (!m_viewport)
            return std::nullopt;

        const ViewportRect rect = m_surface ? m_surface->boundingRect() : ViewportRect{};
        hits                    = m_hitTester.pickAtScreenPoint(x, y, rect, *m_viewport);
    }

    return HitTester::findTarget(hits, m_registry);
}

void PointerPipeline::dispatch(SyntheticEvent& event, ObjectId targetId)
{
    // Snapshot the ids first so handlers can detach or remove nodes mid-walk.
    std::vector<ObjectId> chain;
    walkChain(m_objects, targetId, [&](const SceneObject& node) {
        chain.push_back(node.id());
        return false;
    });

    for (ObjectId id : chain)
    {
        if (event.propagationStopped())
            break;

        SceneObject* node = m_objects.find(id);
        if (!node)
            continue;

        event.currentTarget = node;
        m_registry.forEachListenerForObject(id, event.type, [&](const EventHandler& handler) {
            handler(event);
        });
    }
}

void PointerPipeline::fire(std::string_view          type,
                           NativeInputEvent&         native,
                           ObjectId                  targetId,
                           std::optional<ObjectId>   relatedId,
                           const std::optional<Hit>& extra)
{
    SceneObject* target = m_objects.find(targetId);
    if (!target)
        return;

    SceneObject* related = relatedId ? m_objects.find(*relatedId) : nullptr;

    SyntheticEvent event = SyntheticEvent::fromNative(native, type, target, related, extra);
    dispatch(event, targetId);
}

bool PointerPipeline::hasListenerInChain(ObjectId id, std::string_view type) const
{
    bool found = false;
    walkChain(m_objects, id, [&](const SceneObject& node) {
        found = m_registry.hasListenersOfType(node.id(), type);
        return found;
    });
    return found;
}

bool PointerPipeline::withinTapDistance(const TouchPoint& touch) const noexcept
{
    if (!m_state.tap)
        return false;

    const float dx = touch.clientX - m_state.tap->x;
    const float dy = touch.clientY - m_state.tap->y;
    return std::sqrt(dx * dx + dy * dy) <= m_settings.tapDistanceThreshold;
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------

const GestureState& PointerPipeline::state() const noexcept
{
    return m_state;
}

bool PointerPipeline::isDragging() const noexcept
{
    return m_state.drag.has_value();
}

void PointerPipeline::forgetObject(ObjectId id) noexcept
{
    if (m_state.hoveredId == id)
        m_state.hoveredId.reset();

    if (m_state.tap && m_state.tap->targetId == id)
        m_state.tap.reset();
}

void PointerPipeline::reset()
{
    const bool wasDragging = m_state.drag.has_value();
    m_state                = {};

    if (wasDragging)
        setReleaseCapture(false);
}

void PointerPipeline::setReleaseCapture(bool enabled)
{
    if (m_surface)
        m_surface->setReleaseCaptureEnabled(enabled);
}

void PointerPipeline::setContextMenu(bool enabled)
{
    if (m_surface)
        m_surface->setContextMenuEnabled(enabled);
}
