#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @defgroup Factories Factory System
 * @brief Generic runtime factory for pluggable backends.
 *
 * The factory stores string -> constructor mappings so that backends (such as
 * the exact mesh intersectors) can be registered once and created by name.
 */

/**
 * @class ItemFactory
 * @brief Generic factory for constructing items by string key.
 *
 * @ingroup Factories
 *
 * Usage example:
 * @code
 * ItemFactory<MeshIntersector> factory;
 * factory.registerItem("Cpu", factory.createItemType<MeshIntersectorCpu>);
 * auto isect = factory.createItem("Cpu");
 * @endcode
 *
 * @tparam T Base type of items created by the factory.
 */
template<typename T>
class ItemFactory
{
public:
    ItemFactory() = default;

    /// Functor used to create new items.
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Register a new item type under a name.
     *
     * If the name already exists, the previous entry is replaced.
     *
     * @param name       Unique string identifier for the item type.
     * @param createFunc Function that constructs a new instance.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        registry[name] = std::move(createFunc);
    }

    /**
     * @brief Create an item instance by name.
     *
     * @param name Registered string key.
     * @return A newly constructed unique_ptr<T>, or nullptr if not found.
     */
    std::unique_ptr<T> createItem(const std::string& name) const
    {
        if (auto it = registry.find(name); it != registry.end())
        {
            return it->second();
        }
        return nullptr;
    }

    /// Registered names, in no particular order.
    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(registry.size());
        for (const auto& [name, func] : registry)
            out.push_back(name);
        return out;
    }

    /**
     * @brief Helper that constructs items of a specific derived type.
     *
     * @tparam Derived The concrete type to construct (must derive from T).
     */
    template<typename Derived>
    static std::unique_ptr<T> createItemType()
    {
        return std::make_unique<Derived>();
    }

private:
    /// Map of registered item names to constructor functions.
    std::unordered_map<std::string, CreateFunc> registry;
};
