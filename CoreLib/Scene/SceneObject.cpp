#include "SceneObject.hpp"

SceneObject::SceneObject(ObjectId id) noexcept : m_id{id}
{
}

SceneObjectType SceneObject::type() const noexcept
{
    return SceneObjectType::Group;
}

ObjectId SceneObject::id() const noexcept
{
    return m_id;
}

std::optional<ObjectId> SceneObject::parentId() const noexcept
{
    return m_parentId;
}

void SceneObject::parentId(std::optional<ObjectId> value) noexcept
{
    m_parentId = value;
}

PointerEvents SceneObject::pointerEvents() const noexcept
{
    return m_pointerEvents;
}

void SceneObject::pointerEvents(PointerEvents value) noexcept
{
    m_pointerEvents = value;
}

float SceneObject::distanceBias() const noexcept
{
    return m_distanceBias;
}

void SceneObject::distanceBias(float value) noexcept
{
    m_distanceBias = value;
}

bool SceneObject::destroying() const noexcept
{
    return m_destroying;
}

void SceneObject::markDestroying() noexcept
{
    m_destroying = true;
}

const glm::mat4& SceneObject::model() const noexcept
{
    return m_model;
}

void SceneObject::model(const glm::mat4& mtx) noexcept
{
    m_model = mtx;
}

glm::vec3 SceneObject::worldPosition() const noexcept
{
    return glm::vec3(m_model[3]);
}

std::optional<BoundingSphere> SceneObject::boundingSphere() const
{
    return std::nullopt;
}

std::optional<un::ray_hit> SceneObject::raycast(const un::ray& /*ray*/) const
{
    return std::nullopt;
}
