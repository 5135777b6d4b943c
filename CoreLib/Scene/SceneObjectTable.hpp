#pragma once

#include <functional>
#include <unordered_map>

#include "SceneObject.hpp"

/**
 * @brief Non-owning id -> SceneObject lookup for one world.
 *
 * The table is the single source of truth for which objects are live.
 * Event dispatch re-resolves ids through it at every step so an object
 * removed by a handler simply stops receiving events.
 */
class SceneObjectTable
{
public:
    SceneObjectTable() = default;

    /**
     * @brief Registers @p object under its id.
     * @return False if the id is already registered (the table is unchanged).
     */
    bool add(SceneObject* object);

    /**
     * @brief Forgets @p id.
     * @return The object that was registered, or nullptr.
     */
    SceneObject* remove(ObjectId id) noexcept;

    /// Live object for @p id, or nullptr.
    [[nodiscard]] SceneObject* find(ObjectId id) const noexcept;

    [[nodiscard]] bool        contains(ObjectId id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Visits every object; the callback must not add or remove objects.
    void forEach(const std::function<void(SceneObject&)>& visit) const;

    void clear() noexcept;

private:
    std::unordered_map<ObjectId, SceneObject*> m_objects;
};
