#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include "BoundingSphere.hpp"

/**
 * @brief Tuning knobs for BoundingSphereOctree.
 */
struct OctreeSettings
{
    int maxLeavesPerNode = 8;  ///< A leaf splits once it holds more entries than this.
    int maxDepth         = 16; ///< Nodes at this depth never split.
};

/**
 * @brief Loose octree of bounding spheres keyed by object id.
 *
 * Each node covers a cube; its query bounds are that cube expanded by a
 * factor of two, so a sphere whose radius is at most the child half-size
 * always fits the child owning its center. Spheres that are too large stay
 * in the lowest node that can hold them. The root grows by doubling when a
 * sphere falls outside it and empty subtrees are pruned on removal. Spheres
 * the root cannot grow around are kept in a separate list tested on every
 * query.
 *
 * Every id lives in exactly one node, so a ray query visits each
 * intersecting sphere once. Within a node entries are visited by ray entry
 * distance, and children are descended in order of where the ray enters
 * them, which biases the visit order near-to-far.
 */
class BoundingSphereOctree
{
public:
    using SphereVisitor = std::function<void(const BoundingSphere&, ObjectId)>;

    explicit BoundingSphereOctree(OctreeSettings settings = {});
    ~BoundingSphereOctree();

    BoundingSphereOctree(const BoundingSphereOctree&)            = delete;
    BoundingSphereOctree& operator=(const BoundingSphereOctree&) = delete;

    /**
     * @brief Inserts or replaces the sphere for @p id.
     * @return False if the sphere is not finite; any previous entry is removed.
     */
    bool putSphere(ObjectId id, const BoundingSphere& sphere);

    /**
     * @brief Removes the entry for @p id.
     * @return True if an entry existed.
     */
    bool removeSphere(ObjectId id);

    /**
     * @brief Invokes @p visit for every sphere intersecting the forward ray.
     *
     * The visitor must not mutate the octree.
     */
    void forEachSphereOnRay(const un::ray& ray, const SphereVisitor& visit) const;

    /// Sphere currently stored for @p id, or nullptr.
    [[nodiscard]] const BoundingSphere* sphere(ObjectId id) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

    /// Depth of the deepest node (root = 0, empty tree = -1).
    [[nodiscard]] int depth() const noexcept;

    void clear() noexcept;

private:
    struct Entry
    {
        ObjectId       id;
        BoundingSphere sphere;
    };

    struct Node;

    void insert(ObjectId id, const BoundingSphere& sphere);
    void growToFit(const BoundingSphere& sphere);
    void split(Node* node, int depth);
    void prune(Node* node) noexcept;
    void visitNode(const Node* node, const un::ray& ray, const SphereVisitor& visit) const;

    OctreeSettings                      m_settings;
    std::unique_ptr<Node>               m_root;
    std::unique_ptr<Node>               m_outside; ///< Detached node for spheres too far to grow around.
    std::unordered_map<ObjectId, Node*> m_owner; ///< Node holding each id.
};
