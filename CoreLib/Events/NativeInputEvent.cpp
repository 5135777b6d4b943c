#include "NativeInputEvent.hpp"

std::string_view toString(NativeEventType type) noexcept
{
    switch (type)
    {
        case NativeEventType::MouseMove:
            return "mousemove";
        case NativeEventType::MouseOut:
            return "mouseout";
        case NativeEventType::MouseDown:
            return "mousedown";
        case NativeEventType::MouseUp:
            return "mouseup";
        case NativeEventType::Click:
            return "click";
        case NativeEventType::DblClick:
            return "dblclick";
        case NativeEventType::Wheel:
            return "wheel";
        case NativeEventType::TouchStart:
            return "touchstart";
        case NativeEventType::TouchMove:
            return "touchmove";
        case NativeEventType::TouchEnd:
            return "touchend";
        case NativeEventType::TouchCancel:
            return "touchcancel";
    }
    return "unknown";
}
