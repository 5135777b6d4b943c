#include "Config.hpp"

#include <memory>

#include "MeshIntersectorCpu.hpp"
#include "MeshIntersectorEmbree.hpp"

namespace config
{

    void registerMeshIntersectors(ItemFactory<MeshIntersector>& factory)
    {
        factory.registerItem("Cpu", factory.createItemType<MeshIntersectorCpu>);

        auto device = std::make_shared<std::weak_ptr<EmbreeDevice>>();
        factory.registerItem("Embree", [device]() -> std::unique_ptr<MeshIntersector> {
            std::shared_ptr<EmbreeDevice> shared = device->lock();
            if (!shared)
            {
                shared  = std::make_shared<EmbreeDevice>();
                *device = shared;
            }
            return std::make_unique<MeshIntersectorEmbree>(shared);
        });
    }

} // namespace config
