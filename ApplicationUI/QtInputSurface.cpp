#include "QtInputSurface.hpp"

#include <QApplication>
#include <QEvent>
#include <QEventPoint>
#include <QMouseEvent>
#include <QTouchEvent>
#include <QWheelEvent>
#include <exception>
#include <functional>
#include <iostream>
#include <utility>

#include "PointerWorld.hpp"

namespace
{
    // DOM button numbering: 0 primary, 1 middle, 2 secondary.
    int domButton(Qt::MouseButton button) noexcept
    {
        switch (button)
        {
            case Qt::LeftButton:
                return 0;
            case Qt::MiddleButton:
                return 1;
            case Qt::RightButton:
                return 2;
            case Qt::BackButton:
                return 3;
            case Qt::ForwardButton:
                return 4;
            default:
                return 0;
        }
    }

    int domButtons(Qt::MouseButtons buttons) noexcept
    {
        int mask = 0;
        if (buttons & Qt::LeftButton)
            mask |= 1;
        if (buttons & Qt::RightButton)
            mask |= 2;
        if (buttons & Qt::MiddleButton)
            mask |= 4;
        if (buttons & Qt::BackButton)
            mask |= 8;
        if (buttons & Qt::ForwardButton)
            mask |= 16;
        return mask;
    }

    void copyModifiers(NativeInputEvent& out, Qt::KeyboardModifiers mods) noexcept
    {
        out.shiftKey = (mods & Qt::ShiftModifier) != 0;
        out.ctrlKey  = (mods & Qt::ControlModifier) != 0;
        out.altKey   = (mods & Qt::AltModifier) != 0;
        out.metaKey  = (mods & Qt::MetaModifier) != 0;
    }

    TouchPoint toTouchPoint(const QEventPoint& p) noexcept
    {
        TouchPoint out;
        out.identifier = p.id();
        out.clientX    = static_cast<float>(p.position().x());
        out.clientY    = static_cast<float>(p.position().y());
        out.screenX    = static_cast<float>(p.globalPosition().x());
        out.screenY    = static_cast<float>(p.globalPosition().y());
        out.pageX      = out.clientX;
        out.pageY      = out.clientY;
        return out;
    }

    /// Application-wide filter used for release capture.
    class ReleaseCaptureFilter final : public QObject
    {
    public:
        using Callback = std::function<bool(QObject*, QEvent*)>;

        ReleaseCaptureFilter(Callback callback, QObject* parent) : QObject(parent), m_callback{std::move(callback)}
        {
        }

    protected:
        bool eventFilter(QObject* watched, QEvent* event) override
        {
            return m_callback(watched, event);
        }

    private:
        Callback m_callback;
    };
} // namespace

QtInputSurface::QtInputSurface(QWidget* widget, PointerWorld* world, QObject* parent) :
    QObject(parent),
    m_widget{widget},
    m_world{world}
{
    if (m_widget)
    {
        m_widget->setAttribute(Qt::WA_AcceptTouchEvents, true);
        m_widget->setMouseTracking(true);
    }
}

QtInputSurface::~QtInputSurface()
{
    setReleaseCaptureEnabled(false);
    setPointerListenersEnabled(false);
}

void QtInputSurface::setWorld(PointerWorld* world) noexcept
{
    m_world = world;
}

ViewportRect QtInputSurface::boundingRect() const
{
    if (!m_widget)
        return {};

    // Client coordinates are widget-local.
    ViewportRect rect;
    rect.width  = static_cast<float>(m_widget->width());
    rect.height = static_cast<float>(m_widget->height());
    return rect;
}

void QtInputSurface::setPointerListenersEnabled(bool enabled)
{
    if (enabled == m_listening || !m_widget)
        return;

    if (enabled)
        m_widget->installEventFilter(this);
    else
        m_widget->removeEventFilter(this);

    m_listening = enabled;
}

void QtInputSurface::setContextMenuEnabled(bool enabled)
{
    if (m_widget)
        m_widget->setContextMenuPolicy(enabled ? Qt::DefaultContextMenu : Qt::PreventContextMenu);
}

bool QtInputSurface::contextMenuEnabled() const
{
    return m_widget && m_widget->contextMenuPolicy() != Qt::PreventContextMenu;
}

void QtInputSurface::setReleaseCaptureEnabled(bool enabled)
{
    if (enabled == m_capturing)
        return;

    QCoreApplication* app = QCoreApplication::instance();

    if (enabled)
    {
        if (!app)
        {
            std::cerr << "QtInputSurface: release capture needs a QApplication\n";
            return;
        }

        m_captureFilter = new ReleaseCaptureFilter(
            [this](QObject* watched, QEvent* event) {
                return handleCapturedEvent(watched, event);
            },
            this);
        app->installEventFilter(m_captureFilter);
    }
    else if (m_captureFilter)
    {
        if (app)
            app->removeEventFilter(m_captureFilter);

        // May be called from inside the filter itself.
        m_captureFilter->deleteLater();
        m_captureFilter = nullptr;
    }

    m_capturing = enabled;
}

// -----------------------------------------------------------------------------
// Event filters
// -----------------------------------------------------------------------------

bool QtInputSurface::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_widget && m_listening)
        return handleWidgetEvent(event);

    return QObject::eventFilter(watched, event);
}

bool QtInputSurface::handleWidgetEvent(QEvent* event)
{
    switch (event->type())
    {
        case QEvent::MouseMove:
        {
            NativeInputEvent e = fromMouse(static_cast<QMouseEvent*>(event), NativeEventType::MouseMove);
            forward(e);
            return false;
        }
        case QEvent::MouseButtonPress:
        case QEvent::MouseButtonDblClick:
        {
            // Qt sends DblClick in place of the second press.
            const auto*      me = static_cast<QMouseEvent*>(event);
            NativeInputEvent e  = fromMouse(me, NativeEventType::MouseDown);

            m_pressedButton   = e.button;
            m_dblClickPending = event->type() == QEvent::MouseButtonDblClick && e.button == 0;

            forward(e);
            return false;
        }
        case QEvent::MouseButtonRelease:
        {
            const auto* me     = static_cast<QMouseEvent*>(event);
            const bool  inside = m_widget && m_widget->rect().contains(me->position().toPoint());

            // The implicit grab delivers releases outside the widget here too.
            NativeInputEvent up    = fromMouse(me, NativeEventType::MouseUp);
            up.originatedOnSurface = inside;
            forward(up);

            if (m_pressedButton == up.button && inside)
            {
                NativeInputEvent click = fromMouse(me, NativeEventType::Click);
                forward(click);

                if (m_dblClickPending)
                {
                    NativeInputEvent dbl = fromMouse(me, NativeEventType::DblClick);
                    forward(dbl);
                }
            }

            m_pressedButton.reset();
            m_dblClickPending = false;
            return false;
        }
        case QEvent::Wheel:
        {
            NativeInputEvent e = fromWheel(static_cast<QWheelEvent*>(event));
            forward(e);
            return e.defaultPrevented;
        }
        case QEvent::Leave:
        {
            NativeInputEvent e;
            e.type      = NativeEventType::MouseOut;
            e.clientX   = static_cast<float>(m_lastPos.x());
            e.clientY   = static_cast<float>(m_lastPos.y());
            e.pageX     = e.clientX;
            e.pageY     = e.clientY;
            e.timeStamp = m_lastTimeStamp;
            forward(e);
            return false;
        }
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
        {
            std::optional<NativeInputEvent> e = fromTouch(static_cast<QTouchEvent*>(event));
            if (e)
                forward(*e);

            // Accepting the touch stops Qt from synthesizing mouse events for it.
            event->accept();
            return true;
        }
        default:
            return false;
    }
}

bool QtInputSurface::handleCapturedEvent(QObject* watched, QEvent* event)
{
    if (event->type() != QEvent::MouseButtonRelease || !m_widget)
        return false;

    // Window-level copies of the event are skipped; the widget copy follows.
    auto* target = qobject_cast<QWidget*>(watched);
    if (!target || target == m_widget || m_widget->isAncestorOf(target))
        return false;

    const auto* me = static_cast<QMouseEvent*>(event);

    NativeInputEvent e = fromMouse(me, NativeEventType::MouseUp);

    const QPointF local = m_widget->mapFromGlobal(me->globalPosition());
    e.clientX           = static_cast<float>(local.x());
    e.clientY           = static_cast<float>(local.y());
    e.pageX             = e.clientX;
    e.pageY             = e.clientY;

    e.originatedOnSurface = false;

    m_pressedButton.reset();
    m_dblClickPending = false;

    forward(e);
    return false;
}

// -----------------------------------------------------------------------------
// Translation
// -----------------------------------------------------------------------------

NativeInputEvent QtInputSurface::fromMouse(const QMouseEvent* me, NativeEventType type) const
{
    NativeInputEvent e;
    e.type = type;

    e.clientX = static_cast<float>(me->position().x());
    e.clientY = static_cast<float>(me->position().y());
    e.screenX = static_cast<float>(me->globalPosition().x());
    e.screenY = static_cast<float>(me->globalPosition().y());
    e.pageX   = e.clientX;
    e.pageY   = e.clientY;

    e.button  = domButton(me->button());
    e.buttons = domButtons(me->buttons());
    copyModifiers(e, me->modifiers());

    e.timeStamp = static_cast<double>(me->timestamp());
    return e;
}

NativeInputEvent QtInputSurface::fromWheel(const QWheelEvent* we) const
{
    NativeInputEvent e;
    e.type = NativeEventType::Wheel;

    e.clientX = static_cast<float>(we->position().x());
    e.clientY = static_cast<float>(we->position().y());
    e.screenX = static_cast<float>(we->globalPosition().x());
    e.screenY = static_cast<float>(we->globalPosition().y());
    e.pageX   = e.clientX;
    e.pageY   = e.clientY;

    e.buttons = domButtons(we->buttons());
    copyModifiers(e, we->modifiers());

    // Qt reports "away from the user" as positive; wheel deltas are positive towards the user.
    if (!we->pixelDelta().isNull())
    {
        e.deltaX    = -static_cast<float>(we->pixelDelta().x());
        e.deltaY    = -static_cast<float>(we->pixelDelta().y());
        e.deltaMode = 0;
    }
    else
    {
        // 120 units per notch, 3 lines per notch.
        e.deltaX    = -static_cast<float>(we->angleDelta().x()) / 40.0f;
        e.deltaY    = -static_cast<float>(we->angleDelta().y()) / 40.0f;
        e.deltaMode = 1;
    }

    e.timeStamp = static_cast<double>(we->timestamp());
    return e;
}

std::optional<NativeInputEvent> QtInputSurface::fromTouch(const QTouchEvent* te) const
{
    NativeInputEvent e;
    e.timeStamp = static_cast<double>(te->timestamp());
    copyModifiers(e, te->modifiers());

    const QEventPoint::States states = te->touchPointStates();

    switch (te->type())
    {
        case QEvent::TouchBegin:
            e.type = NativeEventType::TouchStart;
            break;
        case QEvent::TouchEnd:
            e.type = NativeEventType::TouchEnd;
            break;
        case QEvent::TouchCancel:
            e.type = NativeEventType::TouchCancel;
            break;
        default:
            if (states & QEventPoint::Pressed)
                e.type = NativeEventType::TouchStart;
            else if (states & QEventPoint::Released)
                e.type = NativeEventType::TouchEnd;
            else
                e.type = NativeEventType::TouchMove;
            break;
    }

    for (const QEventPoint& p : te->points())
    {
        if (p.state() != QEventPoint::Released)
            e.touches.push_back(toTouchPoint(p));
        if (p.state() != QEventPoint::Stationary)
            e.changedTouches.push_back(toTouchPoint(p));
    }

    if (te->points().isEmpty() && te->type() != QEvent::TouchCancel)
    {
        std::cerr << "QtInputSurface: touch event without touch points ignored\n";
        return std::nullopt;
    }

    const TouchPoint* primary = nullptr;
    if (!e.touches.empty())
        primary = &e.touches.front();
    else if (!e.changedTouches.empty())
        primary = &e.changedTouches.front();

    if (primary)
    {
        e.clientX = primary->clientX;
        e.clientY = primary->clientY;
        e.screenX = primary->screenX;
        e.screenY = primary->screenY;
        e.pageX   = primary->pageX;
        e.pageY   = primary->pageY;
    }

    return e;
}

void QtInputSurface::forward(NativeInputEvent& e)
{
    if (!e.isTouch())
        m_lastPos = QPointF(e.clientX, e.clientY);
    m_lastTimeStamp = e.timeStamp;

    if (!m_world)
        return;

    // Qt's event loop cannot unwind exceptions; listener failures end here.
    try
    {
        m_world->dispatchNativeEvent(e);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "QtInputSurface: listener failed on " << toString(e.type) << ": " << ex.what() << "\n";
    }
}
