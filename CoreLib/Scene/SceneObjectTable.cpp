#include "SceneObjectTable.hpp"

bool SceneObjectTable::add(SceneObject* object)
{
    if (!object)
        return false;

    return m_objects.emplace(object->id(), object).second;
}

SceneObject* SceneObjectTable::remove(ObjectId id) noexcept
{
    auto it = m_objects.find(id);
    if (it == m_objects.end())
        return nullptr;

    SceneObject* object = it->second;
    m_objects.erase(it);
    return object;
}

SceneObject* SceneObjectTable::find(ObjectId id) const noexcept
{
    auto it = m_objects.find(id);
    return it == m_objects.end() ? nullptr : it->second;
}

bool SceneObjectTable::contains(ObjectId id) const noexcept
{
    return m_objects.contains(id);
}

std::size_t SceneObjectTable::size() const noexcept
{
    return m_objects.size();
}

void SceneObjectTable::forEach(const std::function<void(SceneObject&)>& visit) const
{
    for (const auto& [id, object] : m_objects)
        visit(*object);
}

void SceneObjectTable::clear() noexcept
{
    m_objects.clear();
}
