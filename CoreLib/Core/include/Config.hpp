#pragma once

#include "ItemFactory.hpp"

class MeshIntersector;

namespace config
{

    /**
     * @brief Register all available mesh intersector backends.
     *
     * Registers "Cpu" (brute-force triangle tests) and "Embree". All Embree
     * intersectors created from one factory share a single Embree device,
     * created on first use and released with the last intersector.
     *
     * Typical usage:
     * @code
     * ItemFactory<MeshIntersector> intersectors;
     * config::registerMeshIntersectors(intersectors);
     * auto isect = intersectors.createItem("Embree");
     * @endcode
     *
     * @param factory Factory instance that will receive registered backends.
     */
    void registerMeshIntersectors(ItemFactory<MeshIntersector>& factory);

} // namespace config
