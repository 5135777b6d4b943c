#pragma once

#include <cstdint>
#include <glm/mat4x4.hpp>
#include <optional>

#include "BoundingSphere.hpp"
#include "CoreUtilities.hpp"

/**
 * @brief Identifies the concrete category of a SceneObject.
 *
 * SceneObjectType provides a lightweight alternative to RTTI-based type checks.
 */
enum class SceneObjectType : uint8_t
{
    Group,
    Sphere,
    Mesh
};

/**
 * @brief Pointer participation flag of an object.
 *
 *  - Auto:     interactive only while it has a pointer event listener.
 *  - Enabled:  always a candidate pointer target.
 *  - Disabled: never a pointer target, even with listeners.
 */
enum class PointerEvents : uint8_t
{
    Auto,
    Enabled,
    Disabled
};

/**
 * @brief Base class for any interactive object known to a PointerWorld.
 *
 * SceneObject provides the narrow interface the hit tester and the event
 * dispatcher need:
 *  - a stable id
 *  - the id of its parent, used for event bubbling
 *  - a world-space transform and bounding sphere
 *  - optional exact ray intersection
 *
 * A plain SceneObject has no geometry of its own; it is used as a group
 * node that receives bubbled events from its descendants.
 *
 * Objects are owned by the caller. The world only stores raw pointers and
 * must be told through PointerWorld::objectRemoved() before an object dies.
 */
class SceneObject
{
public:
    explicit SceneObject(ObjectId id) noexcept;

    /** @brief Virtual destructor. */
    virtual ~SceneObject() noexcept = default;

    SceneObject(const SceneObject&)            = delete;
    SceneObject& operator=(const SceneObject&) = delete;

    /**
     * @brief Returns the object category.
     */
    [[nodiscard]] virtual SceneObjectType type() const noexcept;

    [[nodiscard]] ObjectId id() const noexcept;

    // ------------------------------------------------------------
    // Hierarchy
    // ------------------------------------------------------------

    /**
     * @brief Id of the parent used for event bubbling, or nullopt for a root.
     *
     * The parent is resolved through the world's object table on every
     * dispatch, so a parent that has been removed simply ends the chain.
     */
    [[nodiscard]] std::optional<ObjectId> parentId() const noexcept;
    void                                  parentId(std::optional<ObjectId> value) noexcept;

    // ------------------------------------------------------------
    // Pointer participation
    // ------------------------------------------------------------

    [[nodiscard]] PointerEvents pointerEvents() const noexcept;
    void                        pointerEvents(PointerEvents value) noexcept;

    /**
     * @brief Tie-break for hits at exactly equal distance; lower wins.
     */
    [[nodiscard]] float distanceBias() const noexcept;
    void                distanceBias(float value) noexcept;

    /**
     * @brief True once the object is being torn down.
     *
     * A destroying object keeps its id and parent so in-flight dispatch can
     * still walk through it, but it is never (re)inserted into the index.
     */
    [[nodiscard]] bool destroying() const noexcept;
    void               markDestroying() noexcept;

    // ------------------------------------------------------------
    // Transform
    // ------------------------------------------------------------

    /**
     * @brief Object-to-world transform.
     */
    [[nodiscard]] const glm::mat4& model() const noexcept;
    void                           model(const glm::mat4& mtx) noexcept;

    /**
     * @brief World-space origin of the object.
     */
    [[nodiscard]] virtual glm::vec3 worldPosition() const noexcept;

    // ------------------------------------------------------------
    // Picking
    // ------------------------------------------------------------

    /**
     * @brief World-space bounding sphere, or nullopt if the object has no extent.
     */
    [[nodiscard]] virtual std::optional<BoundingSphere> boundingSphere() const;

    /**
     * @brief Closest exact intersection with @p ray, if any.
     *
     * Objects that return nullopt unconditionally never produce hits even
     * when their bounding sphere is indexed.
     */
    [[nodiscard]] virtual std::optional<un::ray_hit> raycast(const un::ray& ray) const;

private:
    ObjectId                m_id;
    std::optional<ObjectId> m_parentId;
    PointerEvents           m_pointerEvents = PointerEvents::Auto;
    float                   m_distanceBias  = 0.0f;
    bool                    m_destroying    = false;
    glm::mat4               m_model         = glm::mat4(1.0f);
};
