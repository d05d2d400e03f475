/**
 * @file quadtree.hpp
 * @brief Point quadtree for broad-phase collision queries
 *
 * The tree is rebuilt from scratch every tick: construct it over the world
 * bounds, insert every entity's current position, query, then drop it.
 *
 * Nodes are stored in a flat arena and refer to their children by index. A
 * leaf splits into four equal quadrants once it would hold more than
 * `capacity` points, unless it already sits at `maxDepth`, in which case it
 * keeps accepting points so coincident clusters cannot recurse forever.
 *
 * Region containment is closed on every edge, so a point lying exactly on a
 * split line is stored in every child that touches it. Queries may therefore
 * report the same entity more than once. This is accepted: query results
 * are a superset of the points inside the range and callers always run an
 * exact narrow-phase test on them.
 */

#ifndef QUADSIM_QUADTREE_HPP
#define QUADSIM_QUADTREE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include <entt/entt.hpp>

#include "quadsim/math/rect.hpp"
#include "quadsim/math/vector_math.hpp"

/**
 * @struct QuadtreeConfig
 * @brief Tree-wide subdivision limits
 */
struct QuadtreeConfig {
    // Points a leaf holds before it splits (>= 1)
    int capacity = 8;

    // Depth at which leaves stop splitting (root is depth 0, >= 0)
    int maxDepth = 10;
};

class Quadtree {
public:
    struct Entry {
        entt::entity id;
        Position position;
    };

    /**
     * @brief Debug traversal callback: node region, node depth, leaf flag
     */
    using Visitor = std::function<void(const Rect&, int, bool)>;

    /**
     * @brief Creates an empty tree whose root leaf covers region
     * @throws std::invalid_argument if capacity < 1 or maxDepth < 0
     */
    Quadtree(const Rect& region, const QuadtreeConfig& config);

    /**
     * @brief Inserts an entity snapshot
     * @return false if the position lies outside the root region (the point is dropped)
     */
    bool insert(entt::entity id, const Position& position);

    /**
     * @brief Appends every entry stored in leaves intersecting range
     *
     * Subtrees whose region misses range are pruned. Entries of an
     * intersecting leaf are reported without testing their own position.
     */
    void query(const Rect& range, std::vector<Entry>& found) const;

    std::vector<Entry> query(const Rect& range) const;
    std::vector<entt::entity> queryIds(const Rect& range) const;

    /**
     * @brief Depth-first, pre-order walk over every node
     *
     * Children are visited top-left, top-right, bottom-left, bottom-right.
     */
    void traverse(const Visitor& visitor) const;

    const Rect& region() const { return nodes.front().region; }
    const QuadtreeConfig& config() const { return treeConfig; }

    // Stored entries, counting boundary duplicates
    std::size_t size() const { return entryCount; }
    bool empty() const { return entryCount == 0; }
    bool isLeaf() const { return nodes.front().isLeaf(); }
    std::size_t nodeCount() const { return nodes.size(); }
    std::size_t leafCount() const;
    std::size_t splitCount() const { return splits; }
    int depth() const { return deepest; }

private:
    static constexpr int32_t NO_CHILDREN = -1;

    struct Node {
        Rect region;
        int depth = 0;
        // Index of the top-left child; the other three follow contiguously
        int32_t firstChild = NO_CHILDREN;
        std::vector<Entry> entries;

        Node(const Rect& r, int d) : region(r), depth(d) {}
        bool isLeaf() const { return firstChild == NO_CHILDREN; }
    };

    bool insertAt(int32_t nodeIndex, const Entry& entry);
    void split(int32_t nodeIndex);

    QuadtreeConfig treeConfig;
    std::vector<Node> nodes;
    std::size_t entryCount = 0;
    std::size_t splits = 0;
    int deepest = 0;
};

#endif // QUADSIM_QUADTREE_HPP
