#include "SyntheticEvent.hpp"

#include <utility>

SyntheticEvent SyntheticEvent::fromNative(NativeInputEvent&  native,
                                          std::string_view   type,
                                          SceneObject*       target,
                                          SceneObject*       relatedTarget,
                                          std::optional<Hit> extra)
{
    SyntheticEvent e;
    e.m_native = &native;

    e.type       = std::string(type);
    e.nativeType = native.type;

    e.clientX = native.clientX;
    e.clientY = native.clientY;
    e.screenX = native.screenX;
    e.screenY = native.screenY;
    e.pageX   = native.pageX;
    e.pageY   = native.pageY;

    e.button  = native.button;
    e.buttons = native.buttons;

    e.shiftKey = native.shiftKey;
    e.ctrlKey  = native.ctrlKey;
    e.altKey   = native.altKey;
    e.metaKey  = native.metaKey;

    e.deltaX    = native.deltaX;
    e.deltaY    = native.deltaY;
    e.deltaZ    = native.deltaZ;
    e.deltaMode = native.deltaMode;

    e.timeStamp = native.timeStamp;

    e.touches        = native.touches;
    e.changedTouches = native.changedTouches;

    e.isRayEvent = native.isRayEvent;
    e.ray        = native.ray;

    e.target        = target;
    e.relatedTarget = relatedTarget;
    e.extra         = std::move(extra);

    // Touch events with one relevant contact look like mouse events downstream.
    if (native.isTouch())
    {
        const auto& points = isTouchEndOrCancel(native.type) ? native.changedTouches : native.touches;
        if (points.size() == 1)
        {
            const TouchPoint& p = points.front();
            e.clientX           = p.clientX;
            e.clientY           = p.clientY;
            e.screenX           = p.screenX;
            e.screenY           = p.screenY;
            e.pageX             = p.pageX;
            e.pageY             = p.pageY;
        }
    }

    return e;
}

void SyntheticEvent::preventDefault() noexcept
{
    m_defaultPrevented = true;
    if (m_native)
        m_native->preventDefault();
}

void SyntheticEvent::stopPropagation() noexcept
{
    m_propagationStopped = true;
    if (m_native)
        m_native->stopPropagation();
}

bool SyntheticEvent::defaultPrevented() const noexcept
{
    return m_defaultPrevented;
}

bool SyntheticEvent::propagationStopped() const noexcept
{
    return m_propagationStopped;
}

NativeInputEvent* SyntheticEvent::nativeEvent() const noexcept
{
    return m_native;
}

void SyntheticEvent::detachNative() noexcept
{
    m_native = nullptr;
}
