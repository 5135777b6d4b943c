#ifndef QTINPUTSURFACE_HPP
#define QTINPUTSURFACE_HPP

#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QWidget>
#include <optional>

#include "InputSurface.hpp"
#include "NativeInputEvent.hpp"

class QEvent;
class QMouseEvent;
class QTouchEvent;
class QWheelEvent;

class PointerWorld;

/**
 * @brief InputSurface backed by a QWidget.
 *
 * Mouse, touch, wheel and leave events of the widget are translated into
 * NativeInputEvent and pushed into PointerWorld::dispatchNativeEvent().
 * Qt has no click events, so click and dblclick are synthesized after the
 * matching release.
 *
 * Release capture installs an application-wide event filter; releases seen
 * on other widgets are forwarded with originatedOnSurface = false.
 */
class QtInputSurface : public QObject, public InputSurface
{
    Q_OBJECT
public:
    explicit QtInputSurface(QWidget* widget, PointerWorld* world = nullptr, QObject* parent = nullptr);
    ~QtInputSurface() override;

    void          setWorld(PointerWorld* world) noexcept;
    PointerWorld* world() const noexcept
    {
        return m_world;
    }

    QWidget* widget() const noexcept
    {
        return m_widget;
    }

    ViewportRect boundingRect() const override;
    void         setPointerListenersEnabled(bool enabled) override;
    void         setContextMenuEnabled(bool enabled) override;
    void         setReleaseCaptureEnabled(bool enabled) override;

    bool pointerListenersEnabled() const noexcept
    {
        return m_listening;
    }

    bool releaseCaptureEnabled() const noexcept
    {
        return m_capturing;
    }

    bool contextMenuEnabled() const;

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    bool handleWidgetEvent(QEvent* event);
    bool handleCapturedEvent(QObject* watched, QEvent* event);

    NativeInputEvent fromMouse(const QMouseEvent* e, NativeEventType type) const;
    NativeInputEvent fromWheel(const QWheelEvent* e) const;

    std::optional<NativeInputEvent> fromTouch(const QTouchEvent* e) const;

    void forward(NativeInputEvent& e);

    QPointer<QWidget> m_widget;
    PointerWorld*     m_world = nullptr;

    bool              m_listening     = false;
    bool              m_capturing     = false;
    QPointer<QObject> m_captureFilter;

    // Click synthesis
    std::optional<int> m_pressedButton;
    bool               m_dblClickPending = false;

    QPointF m_lastPos       = {};
    double  m_lastTimeStamp = 0.0;
};

#endif // QTINPUTSURFACE_HPP
