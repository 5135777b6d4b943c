//=============================================================================
// PointerWorld.cpp
//=============================================================================
#include "PointerWorld.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "Config.hpp"
#include "CoreUtilities.hpp"
#include "InputSurface.hpp"
#include "SceneObject.hpp"
#include "Viewport.hpp"

PointerWorld::PointerWorld(PointerSettings settings, OctreeSettings octreeSettings) :
    m_settings{std::move(settings)},
    m_index{{}, octreeSettings},
    m_hitTester{m_index, m_objects},
    m_pipeline{m_hitTester, m_registry, m_objects, m_settings}
{
    // Spheres are read lazily at flush time, so a burst of bounds changes costs one read.
    m_index.setSphereSource([this](ObjectId id) -> std::optional<BoundingSphere> {
        const SceneObject* object = m_objects.find(id);
        if (!object || object->destroying())
            return std::nullopt;
        return object->boundingSphere();
    });

    config::registerMeshIntersectors(m_intersectors);
}

PointerWorld::~PointerWorld()
{
    destroy();
}

// -----------------------------------------------------------------------------
// Object lifecycle
// -----------------------------------------------------------------------------

void PointerWorld::objectAdded(SceneObject* object)
{
    if (!object)
        throw un::core_exception("PointerWorld::objectAdded: null object");

    if (m_destroyed)
        return;

    if (SceneObject* known = m_objects.find(object->id()))
    {
        if (known != object)
        {
            std::cerr << "PointerWorld: id " << object->id() << " is already registered to another object\n";
            return;
        }
        m_index.markChanged(object->id());
        return;
    }

    m_objects.add(object);
    m_index.markAdded(object->id());
}

void PointerWorld::objectBoundsChanged(ObjectId id)
{
    if (m_objects.contains(id))
        m_index.markChanged(id);
}

void PointerWorld::objectRemoved(ObjectId id)
{
    if (!m_objects.remove(id))
        return;

    m_index.remove(id);
    m_pipeline.forgetObject(id);
    m_overlays.erase(id);
}

SceneObject* PointerWorld::object(ObjectId id) const noexcept
{
    return m_objects.find(id);
}

// -----------------------------------------------------------------------------
// Listeners
// -----------------------------------------------------------------------------

ListenerId PointerWorld::addEventListener(ObjectId id, std::string_view type, EventHandler handler)
{
    return m_registry.addListener(id, type, std::move(handler));
}

bool PointerWorld::removeEventListener(ObjectId id, std::string_view type, ListenerId listener)
{
    return m_registry.removeListener(id, type, listener);
}

void PointerWorld::removeAllEventListeners(ObjectId id)
{
    m_registry.removeAllListeners(id);
}

// -----------------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------------

void PointerWorld::pointerMotionEvent(NativeInputEvent& e)
{
    if (m_destroyed)
        return;

    const std::uint64_t picks = m_hitTester.pickCount();
    m_pipeline.handleMotionEvent(e);
    reportStats(picks);
}

void PointerWorld::pointerActionEvent(NativeInputEvent& e)
{
    if (m_destroyed)
        return;

    const std::uint64_t picks = m_hitTester.pickCount();
    m_pipeline.handleActionEvent(e);
    reportStats(picks);
}

void PointerWorld::dropEvent(NativeInputEvent& e)
{
    if (m_destroyed)
        return;

    const std::uint64_t picks = m_hitTester.pickCount();
    m_pipeline.handleDropEvent(e);
    reportStats(picks);
}

void PointerWorld::dispatchNativeEvent(NativeInputEvent& e)
{
    if (m_destroyed)
        return;

    if (isMotionType(e.type))
    {
        pointerMotionEvent(e);
        return;
    }

    if (isReleaseType(e.type) && m_pipeline.isDragging())
        dropEvent(e);

    // Releases captured outside the surface only matter to a drag.
    if (!e.originatedOnSurface)
        return;

    pointerActionEvent(e);
}

void PointerWorld::pointerRayMotion(const un::ray& ray, double timeStamp)
{
    NativeInputEvent e;
    e.type                = NativeEventType::MouseMove;
    e.isRayEvent          = true;
    e.ray                 = ray;
    e.originatedOnSurface = true;
    e.timeStamp           = timeStamp;

    pointerMotionEvent(e);
}

void PointerWorld::pointerRayAction(NativeEventType type, const un::ray& ray, const RayActionParams& params)
{
    NativeInputEvent e;
    e.type                = type;
    e.isRayEvent          = true;
    e.ray                 = ray;
    e.originatedOnSurface = true;
    e.button              = params.button;
    e.buttons             = params.buttons;
    e.deltaX              = params.deltaX;
    e.deltaY              = params.deltaY;
    e.deltaZ              = params.deltaZ;
    e.shiftKey            = params.shiftKey;
    e.ctrlKey             = params.ctrlKey;
    e.altKey              = params.altKey;
    e.metaKey             = params.metaKey;
    e.timeStamp           = params.timeStamp;

    dispatchNativeEvent(e);
}

void PointerWorld::reportStats(std::uint64_t picksBefore)
{
    // Events that never reached the hit tester have nothing new to report.
    if (m_settings.collectStats && m_statsCallback && m_hitTester.pickCount() != picksBefore)
        m_statsCallback(m_hitTester.lastStats());
}

// -----------------------------------------------------------------------------
// Camera and overlays
// -----------------------------------------------------------------------------

void PointerWorld::setViewport(const Viewport* viewport) noexcept
{
    m_viewport = viewport;
    m_pipeline.setViewport(viewport);
}

const Viewport* PointerWorld::viewport() const noexcept
{
    return m_viewport;
}

std::optional<ProjectedPosition> PointerWorld::projectWorldPosition(const glm::vec3& world) const
{
    if (!m_viewport || m_viewport->width() <= 0 || m_viewport->height() <= 0)
        return std::nullopt;

    // Forward is -Z in view space.
    const glm::vec4 viewPos = m_viewport->view() * glm::vec4(world, 1.0f);
    const float     dist    = glm::length(glm::vec3(viewPos));

    const glm::vec3 screen = m_viewport->project(world);

    ProjectedPosition out;
    out.x              = screen.x;
    out.y              = screen.y;
    out.signedDistance = viewPos.z > 0.0f ? -dist : dist;
    return out;
}

void PointerWorld::addOverlay(ObjectId id)
{
    m_overlays.insert(id);
}

void PointerWorld::removeOverlay(ObjectId id)
{
    m_overlays.erase(id);
}

std::vector<OverlayItem> PointerWorld::collectOverlayItems() const
{
    std::vector<OverlayItem> items;
    if (!m_viewport)
        return items;

    for (ObjectId id : m_overlays)
    {
        const SceneObject* object = m_objects.find(id);
        if (!object || object->destroying())
            continue;

        const std::optional<ProjectedPosition> pos = projectWorldPosition(object->worldPosition());
        if (!pos || pos->signedDistance < 0.0f)
            continue;

        items.push_back({id, pos->x, pos->y, pos->signedDistance});
    }

    std::sort(items.begin(), items.end(), [](const OverlayItem& a, const OverlayItem& b) {
        return a.id < b.id;
    });
    return items;
}

// -----------------------------------------------------------------------------
// Surface
// -----------------------------------------------------------------------------

void PointerWorld::setSurface(InputSurface* surface)
{
    if (surface == m_surface)
        return;

    if (m_surface)
        m_surface->setPointerListenersEnabled(false);

    // Ends a drag on the old surface, releasing its capture.
    m_pipeline.reset();

    m_surface = surface;
    m_pipeline.setSurface(surface);

    if (m_surface && !m_destroyed)
        m_surface->setPointerListenersEnabled(true);
}

void PointerWorld::setPointerListenersEnabled(bool enabled)
{
    if (m_surface && !m_destroyed)
        m_surface->setPointerListenersEnabled(enabled);
}

// -----------------------------------------------------------------------------
// Misc
// -----------------------------------------------------------------------------

void PointerWorld::onStatsUpdate(StatsCallback callback)
{
    m_statsCallback = std::move(callback);
}

void PointerWorld::onBackgroundClick(EventHandler handler)
{
    if (!m_destroyed)
        m_pipeline.setBackgroundClickHandler(std::move(handler));
}

std::unique_ptr<MeshIntersector> PointerWorld::createMeshIntersector(std::string_view name) const
{
    const std::string key = name.empty() ? m_settings.meshIntersector : std::string(name);

    std::unique_ptr<MeshIntersector> isect = m_intersectors.createItem(key);
    if (!isect)
        throw un::core_exception("Unknown mesh intersector \"" + key + "\"");

    return isect;
}

const PointerSettings& PointerWorld::settings() const noexcept
{
    return m_settings;
}

EventRegistry& PointerWorld::registry() noexcept
{
    return m_registry;
}

BoundingVolumeIndex& PointerWorld::index() noexcept
{
    return m_index;
}

HitTester& PointerWorld::hitTester() noexcept
{
    return m_hitTester;
}

const PointerPipeline& PointerWorld::pipeline() const noexcept
{
    return m_pipeline;
}

const SceneObjectTable& PointerWorld::objects() const noexcept
{
    return m_objects;
}

void PointerWorld::destroy()
{
    if (m_destroyed)
        return;
    m_destroyed = true;

    if (m_surface)
        m_surface->setPointerListenersEnabled(false);

    // Stops release capture if a drag was active.
    m_pipeline.reset();
    m_pipeline.setSurface(nullptr);
    m_pipeline.setViewport(nullptr);
    m_pipeline.setBackgroundClickHandler(nullptr);

    m_registry.clear();
    m_index.clear();
    m_objects.clear();
    m_overlays.clear();

    m_surface       = nullptr;
    m_viewport      = nullptr;
    m_statsCallback = nullptr;
}

bool PointerWorld::destroyed() const noexcept
{
    return m_destroyed;
}
