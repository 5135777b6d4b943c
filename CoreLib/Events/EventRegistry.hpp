#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "CoreTypes.hpp"

class SyntheticEvent;

/// Handle returned by EventRegistry::addListener(), used to remove that listener.
using ListenerId = uint64_t;

/// Callback invoked with the event being dispatched.
using EventHandler = std::function<void(SyntheticEvent&)>;

/**
 * @brief Per-type, per-object registry of event listeners.
 *
 * Listeners are stored as type -> object -> ordered list, and empty levels
 * are erased eagerly, so hasAnyListenersOfType() is a single hash lookup.
 *
 * Iteration works on a snapshot of the handler list. Handlers may add or
 * remove listeners while being called: listeners added during iteration are
 * not called for the current event, and listeners removed during iteration
 * are skipped if they have not run yet.
 */
class EventRegistry
{
public:
    using ListenerVisitor = std::function<void(const EventHandler&)>;
    using TypeVisitor     = std::function<void(ObjectId, const EventHandler&)>;

    EventRegistry() = default;

    /**
     * @brief Registers @p handler for @p type on @p objectId.
     *
     * Throws if @p handler is empty.
     */
    ListenerId addListener(ObjectId objectId, std::string_view type, EventHandler handler);

    /**
     * @brief Removes one listener.
     * @return True if it was registered.
     */
    bool removeListener(ObjectId objectId, std::string_view type, ListenerId listener);

    /// Removes every listener of every type registered on @p objectId.
    void removeAllListeners(ObjectId objectId);

    [[nodiscard]] bool hasAnyListenersOfType(std::string_view type) const;
    [[nodiscard]] bool hasListenersOfType(ObjectId objectId, std::string_view type) const;

    /// True if @p objectId listens for any motion or action pointer type.
    [[nodiscard]] bool hasPointerListeners(ObjectId objectId) const;

    /// Calls @p visit for each handler of @p type on @p objectId in registration order.
    void forEachListenerForObject(ObjectId objectId, std::string_view type, const ListenerVisitor& visit) const;

    /// Calls @p visit for each handler of @p type on any object.
    void forEachListenerOfType(std::string_view type, const TypeVisitor& visit) const;

    [[nodiscard]] std::size_t listenerCount() const noexcept;

    void clear() noexcept;

private:
    struct Listener
    {
        ListenerId   id;
        EventHandler handler;
    };

    using ObjectListeners = std::unordered_map<ObjectId, std::vector<Listener>>;

    [[nodiscard]] const std::vector<Listener>* listeners(ObjectId objectId, std::string_view type) const;
    [[nodiscard]] bool                         stillRegistered(ObjectId objectId, std::string_view type, ListenerId id) const;

    std::unordered_map<std::string, ObjectListeners>                 m_byType;
    std::unordered_map<ObjectId, std::unordered_set<std::string>>    m_typesByObject;
    std::size_t                                                      m_count  = 0;
    ListenerId                                                       m_nextId = 1;
};
