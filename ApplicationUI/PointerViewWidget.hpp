#ifndef POINTERVIEWWIDGET_HPP
#define POINTERVIEWWIDGET_HPP

#include <QWidget>
#include <glm/glm.hpp>
#include <memory>
#include <unordered_set>
#include <vector>

#include "CoreTypes.hpp"
#include "PointerWorld.hpp"
#include "Viewport.hpp"

class QtInputSurface;
class SceneMesh;
class SceneObject;
class SceneSphere;

/**
 * @brief Demo view: a few spheres and boxes drawn with QPainter and wired to a PointerWorld.
 *
 * Hover highlights, drag moves objects in the view plane, the wheel
 * resizes spheres and a double click removes the object.
 */
class PointerViewWidget : public QWidget
{
    Q_OBJECT
public:
    explicit PointerViewWidget(QWidget* parent = nullptr);
    ~PointerViewWidget() override;

    PointerWorld& world() noexcept
    {
        return m_world;
    }

    Viewport& viewport() noexcept
    {
        return m_viewport;
    }

    SceneObject* addGroup(const glm::vec3& position);
    SceneSphere* addSphere(const glm::vec3& center, float radius, SceneObject* parent = nullptr);
    SceneMesh*   addBox(const glm::vec3& center, const glm::vec3& halfExtent);

    void removeObject(ObjectId id);

protected:
    void paintEvent(QPaintEvent* e) override;
    void resizeEvent(QResizeEvent* e) override;

private:
    void wireListeners(SceneObject* object);
    void moveInViewPlane(SceneObject* object, float x, float y);

    ObjectId nextId() noexcept
    {
        return m_nextId++;
    }

private:
    Viewport                                  m_viewport;
    std::vector<std::unique_ptr<SceneObject>> m_objects;
    PointerWorld                              m_world;
    QtInputSurface*                           m_surface = nullptr;

    std::unordered_set<ObjectId> m_hovered;
    PointerStats                 m_lastStats = {};
    float                        m_dragDepth = 0.0f;
    ObjectId                     m_nextId    = 1;
};

#endif // POINTERVIEWWIDGET_HPP
