#pragma once

#include <glm/vec3.hpp>

#include "CoreTypes.hpp"

class SceneObject;

/**
 * @brief Exact intersection of a picking ray with one object.
 */
struct Hit
{
    ObjectId     id           = 0;
    SceneObject* object       = nullptr; ///< Non-owning, valid until the object is removed.
    float        distance     = 0.0f;    ///< Distance along the ray to the first exact hit.
    float        distanceBias = 0.0f;    ///< Tie-break for equal distances; lower wins.
    glm::vec3    point{0.0f};            ///< World-space hit point.
};
