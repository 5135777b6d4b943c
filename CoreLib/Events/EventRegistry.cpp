#include "EventRegistry.hpp"

#include <algorithm>
#include <utility>

#include "CoreUtilities.hpp"
#include "PointerEventTypes.hpp"

ListenerId EventRegistry::addListener(ObjectId objectId, std::string_view type, EventHandler handler)
{
    if (!handler)
        throw un::core_exception("EventRegistry: empty handler for '" + std::string(type) + "'");

    const ListenerId id = m_nextId++;

    std::string key(type);
    m_byType[key][objectId].push_back(Listener{id, std::move(handler)});
    m_typesByObject[objectId].insert(std::move(key));
    ++m_count;

    return id;
}

bool EventRegistry::removeListener(ObjectId objectId, std::string_view type, ListenerId listener)
{
    auto typeIt = m_byType.find(std::string(type));
    if (typeIt == m_byType.end())
        return false;

    auto objIt = typeIt->second.find(objectId);
    if (objIt == typeIt->second.end())
        return false;

    auto& list = objIt->second;
    auto  it   = std::find_if(list.begin(), list.end(), [listener](const Listener& l) { return l.id == listener; });
    if (it == list.end())
        return false;

    list.erase(it);
    --m_count;

    if (list.empty())
    {
        typeIt->second.erase(objIt);

        if (auto types = m_typesByObject.find(objectId); types != m_typesByObject.end())
        {
            types->second.erase(typeIt->first);
            if (types->second.empty())
                m_typesByObject.erase(types);
        }

        if (typeIt->second.empty())
            m_byType.erase(typeIt);
    }

    return true;
}

void EventRegistry::removeAllListeners(ObjectId objectId)
{
    auto types = m_typesByObject.find(objectId);
    if (types == m_typesByObject.end())
        return;

    for (const std::string& type : types->second)
    {
        auto typeIt = m_byType.find(type);
        if (typeIt == m_byType.end())
            continue;

        if (auto objIt = typeIt->second.find(objectId); objIt != typeIt->second.end())
        {
            m_count -= objIt->second.size();
            typeIt->second.erase(objIt);
        }

        if (typeIt->second.empty())
            m_byType.erase(typeIt);
    }

    m_typesByObject.erase(types);
}

bool EventRegistry::hasAnyListenersOfType(std::string_view type) const
{
    return m_byType.find(std::string(type)) != m_byType.end();
}

bool EventRegistry::hasListenersOfType(ObjectId objectId, std::string_view type) const
{
    return listeners(objectId, type) != nullptr;
}

bool EventRegistry::hasPointerListeners(ObjectId objectId) const
{
    auto types = m_typesByObject.find(objectId);
    if (types == m_typesByObject.end())
        return false;

    return std::any_of(types->second.begin(), types->second.end(), [](const std::string& type) {
        return pointer_events::isPointerType(type);
    });
}

void EventRegistry::forEachListenerForObject(ObjectId objectId, std::string_view type, const ListenerVisitor& visit) const
{
    const auto* list = listeners(objectId, type);
    if (!list)
        return;

    const std::vector<Listener> snapshot = *list;
    for (const Listener& l : snapshot)
    {
        if (stillRegistered(objectId, type, l.id))
            visit(l.handler);
    }
}

void EventRegistry::forEachListenerOfType(std::string_view type, const TypeVisitor& visit) const
{
    auto typeIt = m_byType.find(std::string(type));
    if (typeIt == m_byType.end())
        return;

    std::vector<std::pair<ObjectId, Listener>> snapshot;
    for (const auto& [objectId, list] : typeIt->second)
    {
        for (const Listener& l : list)
            snapshot.emplace_back(objectId, l);
    }

    for (const auto& [objectId, l] : snapshot)
    {
        if (stillRegistered(objectId, type, l.id))
            visit(objectId, l.handler);
    }
}

std::size_t EventRegistry::listenerCount() const noexcept
{
    return m_count;
}

void EventRegistry::clear() noexcept
{
    m_byType.clear();
    m_typesByObject.clear();
    m_count = 0;
}

const std::vector<EventRegistry::Listener>* EventRegistry::listeners(ObjectId objectId, std::string_view type) const
{
    auto typeIt = m_byType.find(std::string(type));
    if (typeIt == m_byType.end())
        return nullptr;

    auto objIt = typeIt->second.find(objectId);
    if (objIt == typeIt->second.end())
        return nullptr;

    return &objIt->second;
}

bool EventRegistry::stillRegistered(ObjectId objectId, std::string_view type, ListenerId id) const
{
    const auto* list = listeners(objectId, type);
    return list && std::any_of(list->begin(), list->end(), [id](const Listener& l) { return l.id == id; });
}
