#pragma once

#include <array>
#include <string_view>

/**
 * @brief Names of the pointer event types handlers can subscribe to.
 *
 * Motion types are fired while the pointer moves; action types on press,
 * release, click and wheel. Listening for any of them makes an object with
 * PointerEvents::Auto a pointer target.
 */
namespace pointer_events
{
    inline constexpr std::string_view MouseOver = "mouseover";
    inline constexpr std::string_view MouseOut  = "mouseout";
    inline constexpr std::string_view MouseMove = "mousemove";
    inline constexpr std::string_view DragStart = "dragstart";
    inline constexpr std::string_view Drag      = "drag";
    inline constexpr std::string_view DragEnter = "dragenter";
    inline constexpr std::string_view DragOver  = "dragover";
    inline constexpr std::string_view DragLeave = "dragleave";

    inline constexpr std::string_view MouseDown = "mousedown";
    inline constexpr std::string_view MouseUp   = "mouseup";
    inline constexpr std::string_view Click     = "click";
    inline constexpr std::string_view DblClick  = "dblclick";
    inline constexpr std::string_view Drop      = "drop";
    inline constexpr std::string_view DragEnd   = "dragend";
    inline constexpr std::string_view Wheel     = "wheel";

    inline constexpr std::array<std::string_view, 8> MotionTypes = {
        MouseOver, MouseOut, MouseMove, DragStart, Drag, DragEnter, DragOver, DragLeave};

    inline constexpr std::array<std::string_view, 7> ActionTypes = {
        MouseDown, MouseUp, Click, DblClick, Drop, DragEnd, Wheel};

    /// True for every motion and action type above.
    [[nodiscard]] constexpr bool isPointerType(std::string_view type) noexcept
    {
        for (std::string_view t : MotionTypes)
        {
            if (t == type)
                return true;
        }
        for (std::string_view t : ActionTypes)
        {
            if (t == type)
                return true;
        }
        return false;
    }

} // namespace pointer_events
