#include "PointerViewWidget.hpp"

#include <QMetaObject>
#include <QPaintEvent>
#include <QPainter>
#include <QPolygonF>
#include <QResizeEvent>
#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>
#include <iostream>

#include "PointerEventTypes.hpp"
#include "QtInputSurface.hpp"
#include "SceneMesh.hpp"
#include "SceneSphere.hpp"
#include "SyntheticEvent.hpp"

namespace
{
    PointerSettings viewerSettings()
    {
        PointerSettings settings;
        settings.collectStats = true;
        return settings;
    }

    const char* typeName(const SceneObject& object)
    {
        switch (object.type())
        {
            case SceneObjectType::Group:
                return "group";
            case SceneObjectType::Sphere:
                return "sphere";
            case SceneObjectType::Mesh:
                return "mesh";
        }
        return "object";
    }
} // namespace

PointerViewWidget::PointerViewWidget(QWidget* parent) : QWidget(parent), m_world{viewerSettings()}
{
    setMinimumSize(320, 240);
    setAutoFillBackground(true);

    m_viewport.lookAt(glm::vec3(0.f, 2.f, 12.f), glm::vec3(0.f));
    m_viewport.perspective(45.0f, 0.1f, 1000.0f);

    m_surface = new QtInputSurface(this, &m_world, this);

    m_world.setViewport(&m_viewport);
    m_world.setSurface(m_surface);

    m_world.onStatsUpdate([this](const PointerStats& stats) {
        m_lastStats = stats;
    });

    m_world.onBackgroundClick([](SyntheticEvent& e) {
        std::cerr << "PointerViewWidget: background click at " << e.clientX << "," << e.clientY << "\n";
    });
}

PointerViewWidget::~PointerViewWidget()
{
    m_world.setSurface(nullptr);
    m_surface->setWorld(nullptr);
    m_world.destroy();
}

// -----------------------------------------------------------------------------
// Scene
// -----------------------------------------------------------------------------

SceneObject* PointerViewWidget::addGroup(const glm::vec3& position)
{
    auto group = std::make_unique<SceneObject>(nextId());
    group->model(glm::translate(glm::mat4(1.0f), position));

    SceneObject* raw = group.get();
    m_objects.push_back(std::move(group));

    m_world.objectAdded(raw);

    // Only bubbled events reach a group.
    m_world.addEventListener(raw->id(), pointer_events::Click, [](SyntheticEvent& e) {
        std::cerr << "PointerViewer: click bubbled to group " << e.currentTarget->id()
                  << " from " << typeName(*e.target) << " " << e.target->id() << "\n";
    });

    return raw;
}

SceneSphere* PointerViewWidget::addSphere(const glm::vec3& center, float radius, SceneObject* parent)
{
    auto sphere = std::make_unique<SceneSphere>(nextId(), radius);
    sphere->model(glm::translate(glm::mat4(1.0f), center));
    if (parent)
        sphere->parentId(parent->id());

    SceneSphere* raw = sphere.get();
    m_objects.push_back(std::move(sphere));

    m_world.objectAdded(raw);
    m_world.addOverlay(raw->id());
    wireListeners(raw);

    // Wheel resizes spheres only.
    m_world.addEventListener(raw->id(), pointer_events::Wheel, [this, raw](SyntheticEvent& e) {
        const float scale = e.deltaY < 0.0f ? 1.1f : 1.0f / 1.1f;
        raw->radius(std::clamp(raw->radius() * scale, 0.1f, 10.0f));
        m_world.objectBoundsChanged(raw->id());
        e.preventDefault();
        update();
    });

    return raw;
}

SceneMesh* PointerViewWidget::addBox(const glm::vec3& center, const glm::vec3& halfExtent)
{
    auto mesh = std::make_unique<SceneMesh>(nextId(), m_world.createMeshIntersector());

    std::vector<glm::vec3> positions;
    for (int i = 0; i < 8; ++i)
    {
        positions.emplace_back((i & 1) ? halfExtent.x : -halfExtent.x,
                               (i & 2) ? halfExtent.y : -halfExtent.y,
                               (i & 4) ? halfExtent.z : -halfExtent.z);
    }

    std::vector<uint32_t> indices = {
        0, 2, 1, 1, 2, 3, // -z
        4, 5, 6, 5, 7, 6, // +z
        0, 1, 4, 1, 5, 4, // -y
        2, 6, 3, 3, 6, 7, // +y
        0, 4, 2, 2, 4, 6, // -x
        1, 3, 5, 3, 7, 5, // +x
    };

    mesh->geometry(std::move(positions), std::move(indices));
    mesh->model(glm::translate(glm::mat4(1.0f), center));

    SceneMesh* raw = mesh.get();
    m_objects.push_back(std::move(mesh));

    m_world.objectAdded(raw);
    wireListeners(raw);
    return raw;
}

void PointerViewWidget::removeObject(ObjectId id)
{
    auto it = std::find_if(m_objects.begin(), m_objects.end(), [id](const auto& obj) {
        return obj->id() == id;
    });
    if (it == m_objects.end())
        return;

    (*it)->markDestroying();

    for (auto& other : m_objects)
    {
        if (other->parentId() == id)
            other->parentId(std::nullopt);
    }

    m_world.removeAllEventListeners(id);
    m_world.objectRemoved(id);
    m_hovered.erase(id);

    m_objects.erase(it);
    update();
}

void PointerViewWidget::wireListeners(SceneObject* object)
{
    const ObjectId id = object->id();

    m_world.addEventListener(id, pointer_events::MouseOver, [this, id](SyntheticEvent&) {
        m_hovered.insert(id);
        update();
    });
    m_world.addEventListener(id, pointer_events::MouseOut, [this, id](SyntheticEvent&) {
        m_hovered.erase(id);
        update();
    });
    m_world.addEventListener(id, pointer_events::Click, [](SyntheticEvent& e) {
        if (!e.extra)
            return;
        const glm::vec3& p = e.extra->point;
        std::cerr << "PointerViewer: click on " << typeName(*e.target) << " " << e.target->id() << " at ("
                  << p.x << ", " << p.y << ", " << p.z << ") dist " << e.extra->distance << "\n";
    });
    m_world.addEventListener(id, pointer_events::DblClick, [this, id](SyntheticEvent&) {
        // Deferred so the current dispatch finishes first.
        QMetaObject::invokeMethod(
            this,
            [this, id]() {
                removeObject(id);
            },
            Qt::QueuedConnection);
    });

    m_world.addEventListener(id, pointer_events::DragStart, [this, object](SyntheticEvent&) {
        m_dragDepth = m_viewport.project(object->worldPosition()).z;
        std::cerr << "PointerViewer: dragstart " << object->id() << "\n";
    });
    m_world.addEventListener(id, pointer_events::Drag, [this, object](SyntheticEvent& e) {
        moveInViewPlane(object, e.clientX, e.clientY);
    });
    m_world.addEventListener(id, pointer_events::DragEnd, [object](SyntheticEvent&) {
        std::cerr << "PointerViewer: dragend " << object->id() << "\n";
    });
}

void PointerViewWidget::moveInViewPlane(SceneObject* object, float x, float y)
{
    const ViewportRect rect = m_surface->boundingRect();
    if (rect.width <= 0.0f || rect.height <= 0.0f)
        return;

    const float px = x / rect.width * static_cast<float>(m_viewport.width());
    const float py = y / rect.height * static_cast<float>(m_viewport.height());

    const glm::vec3 target = m_viewport.unproject(glm::vec3(px, py, m_dragDepth));

    glm::mat4 model = object->model();
    model[3]        = glm::vec4(target, 1.0f);
    object->model(model);

    m_world.objectBoundsChanged(object->id());
    update();
}

// -----------------------------------------------------------------------------
// Qt events
// -----------------------------------------------------------------------------

void PointerViewWidget::resizeEvent(QResizeEvent* e)
{
    QWidget::resizeEvent(e);
    m_viewport.resize(width(), height());
}

void PointerViewWidget::paintEvent(QPaintEvent* /*e*/)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.fillRect(rect(), QColor(37, 37, 41));

    for (const auto& object : m_objects)
    {
        const bool   hovered = m_hovered.count(object->id()) != 0;
        const QColor color   = hovered ? QColor(255, 170, 60) : QColor(160, 170, 190);
        painter.setPen(QPen(color, hovered ? 2.0 : 1.0));
        painter.setBrush(Qt::NoBrush);

        if (object->type() == SceneObjectType::Sphere)
        {
            const auto* sphere = static_cast<const SceneSphere*>(object.get());
            const auto  bounds = sphere->boundingSphere();
            const auto  center = m_world.projectWorldPosition(bounds->center);
            if (!center || center->signedDistance <= 0.0f)
                continue;

            // Screen radius from a point on the sphere's rim, parallel to the image plane.
            const glm::vec3 up  = glm::vec3(glm::inverse(m_viewport.view())[1]);
            const auto      rim = m_world.projectWorldPosition(bounds->center + up * bounds->radius);
            if (!rim)
                continue;

            const double r = std::hypot(rim->x - center->x, rim->y - center->y);
            painter.drawEllipse(QPointF(center->x, center->y), r, r);
        }
        else if (object->type() == SceneObjectType::Mesh)
        {
            const auto* mesh = static_cast<const SceneMesh*>(object.get());
            const auto& pos  = mesh->positions();
            const auto& idx  = mesh->indices();

            for (std::size_t t = 0; t + 2 < idx.size(); t += 3)
            {
                QPolygonF tri;
                bool      visible = true;
                for (std::size_t k = 0; k < 3; ++k)
                {
                    const glm::vec3 world = glm::vec3(mesh->model() * glm::vec4(pos[idx[t + k]], 1.0f));
                    const auto      p     = m_world.projectWorldPosition(world);
                    if (!p || p->signedDistance <= 0.0f)
                    {
                        visible = false;
                        break;
                    }
                    tri << QPointF(p->x, p->y);
                }
                if (visible)
                    painter.drawPolygon(tri);
            }
        }
    }

    painter.setPen(QColor(230, 230, 235));
    for (const OverlayItem& item : m_world.collectOverlayItems())
        painter.drawText(QPointF(item.x + 4.0f, item.y - 4.0f), QString::number(item.id));

    painter.drawText(QPointF(8.0, height() - 8.0),
                     QStringLiteral("pick %1 ms, %2 candidates, %3 hits")
                         .arg(m_lastStats.pickTimeMs, 0, 'f', 3)
                         .arg(m_lastStats.candidates)
                         .arg(m_lastStats.hits));
}
