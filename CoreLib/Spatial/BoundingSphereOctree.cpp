#include "BoundingSphereOctree.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace
{
    // Growth stops after this many doublings; a sphere that still does not
    // fit goes to the outside list.
    constexpr int kMaxGrowSteps = 64;

    int octantOf(const glm::vec3& center, const glm::vec3& p) noexcept
    {
        return (p.x >= center.x ? 1 : 0) |
               (p.y >= center.y ? 2 : 0) |
               (p.z >= center.z ? 4 : 0);
    }

    glm::vec3 octantSign(int octant) noexcept
    {
        return glm::vec3((octant & 1) ? 1.0f : -1.0f,
                         (octant & 2) ? 1.0f : -1.0f,
                         (octant & 4) ? 1.0f : -1.0f);
    }

    float startHalfSize(float radius) noexcept
    {
        float half = 1.0f;
        while (half < radius && std::isfinite(half))
            half *= 2.0f;
        return half;
    }

} // namespace

struct BoundingSphereOctree::Node
{
    glm::vec3 center{0.0f};
    float     halfSize = 1.0f;
    Node*     parent   = nullptr;
    bool      isSplit  = false;

    std::vector<Entry>                   entries;
    std::array<std::unique_ptr<Node>, 8> children;

    glm::vec3 looseMin() const noexcept
    {
        return center - glm::vec3(2.0f * halfSize);
    }

    glm::vec3 looseMax() const noexcept
    {
        return center + glm::vec3(2.0f * halfSize);
    }

    bool containsPoint(const glm::vec3& p) const noexcept
    {
        const glm::vec3 d = glm::abs(p - center);
        return d.x <= halfSize && d.y <= halfSize && d.z <= halfSize;
    }

    bool fitsLoose(const BoundingSphere& s) const noexcept
    {
        const glm::vec3 d     = glm::abs(s.center - center) + glm::vec3(s.radius);
        const float     limit = 2.0f * halfSize;
        return d.x <= limit && d.y <= limit && d.z <= limit;
    }

    bool hasChildren() const noexcept
    {
        return std::any_of(children.begin(), children.end(), [](const auto& c) { return c != nullptr; });
    }

    Node* child(int octant)
    {
        auto& slot = children[octant];
        if (!slot)
        {
            slot           = std::make_unique<Node>();
            slot->halfSize = halfSize * 0.5f;
            slot->center   = center + octantSign(octant) * slot->halfSize;
            slot->parent   = this;
        }
        return slot.get();
    }
};

BoundingSphereOctree::BoundingSphereOctree(OctreeSettings settings)
    : m_settings{settings}, m_outside{std::make_unique<Node>()}
{
    m_settings.maxLeavesPerNode = std::max(1, m_settings.maxLeavesPerNode);
    m_settings.maxDepth         = std::max(0, m_settings.maxDepth);
}

BoundingSphereOctree::~BoundingSphereOctree() = default;

bool BoundingSphereOctree::putSphere(ObjectId id, const BoundingSphere& sphere)
{
    if (auto it = m_owner.find(id); it != m_owner.end())
    {
        // Fast path: the sphere still belongs to the same node.
        Node* node = it->second;
        if (sphere.valid() && node != m_outside.get() && node->fitsLoose(sphere) &&
            !(node->isSplit && sphere.radius <= node->halfSize * 0.5f && node->containsPoint(sphere.center)))
        {
            for (Entry& e : node->entries)
            {
                if (e.id == id)
                {
                    e.sphere = sphere;
                    return true;
                }
            }
        }
        removeSphere(id);
    }

    if (!sphere.valid())
        return false;

    insert(id, sphere);
    return true;
}

bool BoundingSphereOctree::removeSphere(ObjectId id)
{
    auto it = m_owner.find(id);
    if (it == m_owner.end())
        return false;

    Node* node = it->second;
    m_owner.erase(it);

    auto& entries = node->entries;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        if (entries[i].id == id)
        {
            entries[i] = std::move(entries.back());
            entries.pop_back();
            break;
        }
    }

    prune(node);
    return true;
}

void BoundingSphereOctree::forEachSphereOnRay(const un::ray& ray, const SphereVisitor& visit) const
{
    if (!m_root || !visit)
        return;

    for (const Entry& e : m_outside->entries)
    {
        float t = 0.0f;
        if (e.sphere.intersects(ray, t))
            visit(e.sphere, e.id);
    }

    visitNode(m_root.get(), ray, visit);
}

const BoundingSphere* BoundingSphereOctree::sphere(ObjectId id) const noexcept
{
    auto it = m_owner.find(id);
    if (it == m_owner.end())
        return nullptr;

    for (const Entry& e : it->second->entries)
    {
        if (e.id == id)
            return &e.sphere;
    }
    return nullptr;
}

std::size_t BoundingSphereOctree::size() const noexcept
{
    return m_owner.size();
}

bool BoundingSphereOctree::empty() const noexcept
{
    return m_owner.empty();
}

int BoundingSphereOctree::depth() const noexcept
{
    if (!m_root)
        return -1;

    int                                    deepest = 0;
    std::vector<std::pair<const Node*, int>> stack{{m_root.get(), 0}};
    while (!stack.empty())
    {
        auto [node, d] = stack.back();
        stack.pop_back();
        deepest = std::max(deepest, d);
        for (const auto& c : node->children)
        {
            if (c)
                stack.emplace_back(c.get(), d + 1);
        }
    }
    return deepest;
}

void BoundingSphereOctree::clear() noexcept
{
    m_owner.clear();
    m_outside->entries.clear();
    m_root.reset();
}

void BoundingSphereOctree::insert(ObjectId id, const BoundingSphere& sphere)
{
    if (!m_root)
    {
        m_root           = std::make_unique<Node>();
        m_root->center   = sphere.center;
        m_root->halfSize = startHalfSize(sphere.radius);
    }
    else
    {
        growToFit(sphere);
        if (!m_root->fitsLoose(sphere))
        {
            m_outside->entries.push_back(Entry{id, sphere});
            m_owner[id] = m_outside.get();
            return;
        }
    }

    Node* node  = m_root.get();
    int   depth = 0;

    while (true)
    {
        const float childHalf = node->halfSize * 0.5f;
        if (node->isSplit && sphere.radius <= childHalf && node->containsPoint(sphere.center))
        {
            node = node->child(octantOf(node->center, sphere.center));
            ++depth;
            continue;
        }

        node->entries.push_back(Entry{id, sphere});
        m_owner[id] = node;

        if (!node->isSplit &&
            static_cast<int>(node->entries.size()) > m_settings.maxLeavesPerNode &&
            depth < m_settings.maxDepth)
        {
            split(node, depth);
        }
        return;
    }
}

void BoundingSphereOctree::growToFit(const BoundingSphere& sphere)
{
    for (int step = 0; step < kMaxGrowSteps && !m_root->fitsLoose(sphere); ++step)
    {
        const float     half = m_root->halfSize;
        const glm::vec3 dir  = sphere.center - m_root->center;
        const glm::vec3 sign(dir.x >= 0.0f ? 1.0f : -1.0f,
                             dir.y >= 0.0f ? 1.0f : -1.0f,
                             dir.z >= 0.0f ? 1.0f : -1.0f);

        auto grown      = std::make_unique<Node>();
        grown->center   = m_root->center + sign * half;
        grown->halfSize = half * 2.0f;
        grown->isSplit  = true;

        // The old root is exactly the octant of the new root facing away from the sphere.
        const int octant = octantOf(grown->center, m_root->center);
        m_root->parent   = grown.get();
        grown->children[octant] = std::move(m_root);
        m_root                  = std::move(grown);
    }
}

void BoundingSphereOctree::split(Node* node, int depth)
{
    node->isSplit = true;

    std::vector<Entry> keep;
    std::vector<Entry> moved;
    const float        childHalf = node->halfSize * 0.5f;

    for (Entry& e : node->entries)
    {
        if (e.sphere.radius <= childHalf && node->containsPoint(e.sphere.center))
            moved.push_back(std::move(e));
        else
            keep.push_back(std::move(e));
    }
    node->entries = std::move(keep);

    for (Entry& e : moved)
    {
        Node* child = node->child(octantOf(node->center, e.sphere.center));
        child->entries.push_back(e);
        m_owner[e.id] = child;
    }

    // Children that overflowed from the redistribution split in turn.
    for (auto& c : node->children)
    {
        if (c && static_cast<int>(c->entries.size()) > m_settings.maxLeavesPerNode && depth + 1 < m_settings.maxDepth)
            split(c.get(), depth + 1);
    }
}

void BoundingSphereOctree::prune(Node* node) noexcept
{
    while (node && node->parent && node->entries.empty() && !node->hasChildren())
    {
        Node* parent = node->parent;
        for (auto& c : parent->children)
        {
            if (c.get() == node)
            {
                c.reset();
                break;
            }
        }
        node = parent;
    }

    if (m_owner.empty())
        m_root.reset();
}

// The caller has already tested the node's loose bounds; the root is not
// box-tested.
void BoundingSphereOctree::visitNode(const Node* node, const un::ray& ray, const SphereVisitor& visit) const
{
    // Entries of this node first, nearest entry point first.
    std::vector<std::pair<float, const Entry*>> local;
    local.reserve(node->entries.size());
    for (const Entry& e : node->entries)
    {
        float t = 0.0f;
        if (e.sphere.intersects(ray, t))
            local.emplace_back(t, &e);
    }
    std::sort(local.begin(), local.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    for (const auto& [t, e] : local)
        visit(e->sphere, e->id);

    std::array<std::pair<float, const Node*>, 8> order{};
    int                                          count = 0;
    for (const auto& c : node->children)
    {
        float t = 0.0f;
        if (c && un::ray_box_intersect(ray, c->looseMin(), c->looseMax(), t))
            order[count++] = {t, c.get()};
    }
    std::sort(order.begin(), order.begin() + count, [](const auto& a, const auto& b) { return a.first < b.first; });

    for (int i = 0; i < count; ++i)
        visitNode(order[i].second, ray, visit);
}
