//=============================================================================
// PointerWorld.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "BoundingVolumeIndex.hpp"
#include "CoreTypes.hpp"
#include "EventRegistry.hpp"
#include "HitTester.hpp"
#include "ItemFactory.hpp"
#include "MeshIntersector.hpp"
#include "NativeInputEvent.hpp"
#include "PointerPipeline.hpp"
#include "PointerSettings.hpp"
#include "SceneObjectTable.hpp"

class InputSurface;
class SceneObject;
class Viewport;

/**
 * @brief Extra fields of a ray action event (VR controller buttons and wheels).
 */
struct RayActionParams
{
    int    button    = 0;
    int    buttons   = 0;
    float  deltaX    = 0.0f;
    float  deltaY    = 0.0f;
    float  deltaZ    = 0.0f;
    bool   shiftKey  = false;
    bool   ctrlKey   = false;
    bool   altKey    = false;
    bool   metaKey   = false;
    double timeStamp = 0.0;
};

/**
 * @brief Pointer hit-testing and event dispatch for one rendering surface.
 *
 * PointerWorld is the coordination layer between the scene layer, the
 * input surface and the camera. It owns the object table, the bounding
 * volume index, the listener registry, the hit tester and the gesture
 * pipeline; nothing is shared between worlds.
 *
 * The scene layer reports object lifecycle and listeners; the surface
 * pushes native input; the world fires synthetic events at listeners.
 * All work happens synchronously inside each call.
 */
class PointerWorld
{
public:
    using StatsCallback = std::function<void(const PointerStats&)>;

    explicit PointerWorld(PointerSettings settings = {}, OctreeSettings octreeSettings = {});

    /** @brief Runs destroy(). */
    ~PointerWorld();

    PointerWorld(const PointerWorld&)            = delete;
    PointerWorld& operator=(const PointerWorld&) = delete;

    // ------------------------------------------------------------
    // Object lifecycle
    // ------------------------------------------------------------

    /**
     * @brief Registers @p object and queues its bounds for indexing.
     *
     * Group nodes that only receive bubbled events must be registered too.
     * Re-adding the same object re-queues its bounds; a different object
     * with an already registered id is rejected with a diagnostic.
     */
    void objectAdded(SceneObject* object);

    /// Queues a re-read of the object's bounding sphere. Unknown ids are ignored.
    void objectBoundsChanged(ObjectId id);

    /// Unregisters @p id and queues its removal from the index. Unknown ids are ignored.
    void objectRemoved(ObjectId id);

    [[nodiscard]] SceneObject* object(ObjectId id) const noexcept;

    // ------------------------------------------------------------
    // Listeners
    // ------------------------------------------------------------

    ListenerId addEventListener(ObjectId id, std::string_view type, EventHandler handler);
    bool       removeEventListener(ObjectId id, std::string_view type, ListenerId listener);
    void       removeAllEventListeners(ObjectId id);

    // ------------------------------------------------------------
    // Input
    // ------------------------------------------------------------

    void pointerMotionEvent(NativeInputEvent& e);
    void pointerActionEvent(NativeInputEvent& e);
    void dropEvent(NativeInputEvent& e);

    /**
     * @brief Routes a native event from the input surface.
     *
     * While dragging, a release reaches the drop handler first. Releases
     * that did not originate on the surface stop there.
     */
    void dispatchNativeEvent(NativeInputEvent& e);

    /// Hover tracking for a controller ray.
    void pointerRayMotion(const un::ray& ray, double timeStamp = 0.0);

    /// Button or wheel action of a controller ray.
    void pointerRayAction(NativeEventType type, const un::ray& ray, const RayActionParams& params = {});

    // ------------------------------------------------------------
    // Camera and overlays
    // ------------------------------------------------------------

    void                          setViewport(const Viewport* viewport) noexcept;
    [[nodiscard]] const Viewport* viewport() const noexcept;

    /**
     * @brief Projects a world position into surface pixels.
     * @return nullopt without a sized viewport.
     */
    [[nodiscard]] std::optional<ProjectedPosition> projectWorldPosition(const glm::vec3& world) const;

    void addOverlay(ObjectId id);
    void removeOverlay(ObjectId id);

    /// Screen placement of every live overlay object in front of the camera.
    [[nodiscard]] std::vector<OverlayItem> collectOverlayItems() const;

    // ------------------------------------------------------------
    // Surface
    // ------------------------------------------------------------

    /**
     * @brief Attaches the input surface and enables its pointer listeners.
     *
     * Passing nullptr detaches the current surface after disabling it.
     */
    void setSurface(InputSurface* surface);

    /// Turns surface pointer input on or off, e.g. while a VR session drives input by ray.
    void setPointerListenersEnabled(bool enabled);

    // ------------------------------------------------------------
    // Misc
    // ------------------------------------------------------------

    /// Called after each input event that ran a pick, while PointerSettings::collectStats is set.
    void onStatsUpdate(StatsCallback callback);

    /**
     * @brief Handler for clicks on the surface that hit no pointer target.
     *
     * The event's target and currentTarget are null. Pass an empty handler to
     * stop receiving background clicks.
     */
    void onBackgroundClick(EventHandler handler);

    /**
     * @brief Creates a mesh intersector backend by name.
     *
     * An empty name uses PointerSettings::meshIntersector. Throws for
     * unknown names.
     */
    [[nodiscard]] std::unique_ptr<MeshIntersector> createMeshIntersector(std::string_view name = {}) const;

    [[nodiscard]] const PointerSettings& settings() const noexcept;

    [[nodiscard]] EventRegistry&          registry() noexcept;
    [[nodiscard]] BoundingVolumeIndex&    index() noexcept;
    [[nodiscard]] HitTester&              hitTester() noexcept;
    [[nodiscard]] const PointerPipeline&  pipeline() const noexcept;
    [[nodiscard]] const SceneObjectTable& objects() const noexcept;

    /**
     * @brief Stops all input, ends any drag and drops every object and listener.
     *
     * Safe to call more than once.
     */
    void destroy();

    [[nodiscard]] bool destroyed() const noexcept;

private:
    void reportStats(std::uint64_t picksBefore);

    PointerSettings m_settings;

    SceneObjectTable    m_objects;
    BoundingVolumeIndex m_index;
    EventRegistry       m_registry;
    HitTester           m_hitTester;
    PointerPipeline     m_pipeline;

    ItemFactory<MeshIntersector> m_intersectors;

    std::unordered_set<ObjectId> m_overlays;

    const Viewport* m_viewport  = nullptr;
    InputSurface*   m_surface   = nullptr;
    bool            m_destroyed = false;

    StatsCallback m_statsCallback;
};
