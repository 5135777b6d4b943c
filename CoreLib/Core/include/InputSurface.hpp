#pragma once

#include "CoreTypes.hpp"

/**
 * @brief The widget (or other native element) a PointerWorld receives input from.
 *
 * The world never pulls events from the surface. The surface pushes native
 * events into PointerWorld::dispatchNativeEvent() and the world only flips
 * the switches below.
 */
class InputSurface
{
public:
    virtual ~InputSurface() = default;

    /// Client-space rect used to map pointer coordinates to viewport pixels.
    [[nodiscard]] virtual ViewportRect boundingRect() const = 0;

    /// Starts or stops forwarding pointer motion and action events.
    virtual void setPointerListenersEnabled(bool enabled) = 0;

    /// Allows or suppresses the native context menu (long-press menus during touch).
    virtual void setContextMenuEnabled(bool enabled) = 0;

    /**
     * @brief Starts or stops listening for release events anywhere in the application.
     *
     * Released events seen outside the surface must be forwarded with
     * NativeInputEvent::originatedOnSurface set to false.
     */
    virtual void setReleaseCaptureEnabled(bool enabled) = 0;

protected:
    InputSurface() = default;
};
