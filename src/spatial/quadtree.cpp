/**
 * @file quadtree.cpp
 * @brief Arena-backed quadtree insert, split and query
 */

#include "quadsim/spatial/quadtree.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>

#include "quadsim/core/debug.hpp"

Quadtree::Quadtree(const Rect& region, const QuadtreeConfig& config)
    : treeConfig(config)
{
    if (config.capacity < 1) {
        throw std::invalid_argument("Quadtree: capacity must be at least 1, got " +
                                    std::to_string(config.capacity));
    }
    if (config.maxDepth < 0) {
        throw std::invalid_argument("Quadtree: maxDepth must be non-negative, got " +
                                    std::to_string(config.maxDepth));
    }
    nodes.emplace_back(region, 0);
}

bool Quadtree::insert(entt::entity id, const Position& position) {
    return insertAt(0, Entry{id, position});
}

bool Quadtree::insertAt(int32_t nodeIndex, const Entry& entry) {
    if (!nodes[nodeIndex].region.contains(entry.position)) {
        return false;
    }

    if (nodes[nodeIndex].isLeaf()) {
        Node& leaf = nodes[nodeIndex];
        bool const atCeiling = leaf.depth >= treeConfig.maxDepth;
        if (static_cast<int>(leaf.entries.size()) < treeConfig.capacity || atCeiling) {
            if (atCeiling && static_cast<int>(leaf.entries.size()) >= treeConfig.capacity) {
                DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Quadtree] depth ceiling " << leaf.depth
                          << " reached, leaf now holds " << leaf.entries.size() + 1 << " points\n");
            }
            leaf.entries.push_back(entry);
            ++entryCount;
            return true;
        }
        split(nodeIndex);
    }

    // nodes may have grown during split, so re-read the child index
    int32_t const first = nodes[nodeIndex].firstChild;
    bool stored = false;
    for (int32_t q = 0; q < 4; ++q) {
        if (insertAt(first + q, entry)) {
            stored = true;
        }
    }
    return stored;
}

void Quadtree::split(int32_t nodeIndex) {
    assert(nodes[nodeIndex].isLeaf() && "split() called on an internal node");

    Rect const parentRegion = nodes[nodeIndex].region;
    int const childDepth = nodes[nodeIndex].depth + 1;
    auto const first = static_cast<int32_t>(nodes.size());

    for (int q = 0; q < 4; ++q) {
        nodes.emplace_back(parentRegion.quadrant(q), childDepth);
    }

    Node& parent = nodes[nodeIndex];
    parent.firstChild = first;
    std::vector<Entry> drained = std::move(parent.entries);
    parent.entries.clear();
    entryCount -= drained.size();

    ++splits;
    deepest = std::max(deepest, childDepth);

    for (const auto& entry : drained) {
        for (int32_t q = 0; q < 4; ++q) {
            insertAt(first + q, entry);
        }
    }
}

void Quadtree::query(const Rect& range, std::vector<Entry>& found) const {
    std::vector<int32_t> pending{0};
    while (!pending.empty()) {
        int32_t const index = pending.back();
        pending.pop_back();

        const Node& node = nodes[index];
        if (!node.region.intersects(range)) {
            continue;
        }

        if (node.isLeaf()) {
            found.insert(found.end(), node.entries.begin(), node.entries.end());
            continue;
        }

        for (int32_t q = 3; q >= 0; --q) {
            pending.push_back(node.firstChild + q);
        }
    }
}

std::vector<Quadtree::Entry> Quadtree::query(const Rect& range) const {
    std::vector<Entry> found;
    query(range, found);
    return found;
}

std::vector<entt::entity> Quadtree::queryIds(const Rect& range) const {
    std::vector<Entry> found;
    query(range, found);

    std::vector<entt::entity> ids;
    ids.reserve(found.size());
    for (const auto& entry : found) {
        ids.push_back(entry.id);
    }
    return ids;
}

void Quadtree::traverse(const Visitor& visitor) const {
    std::vector<int32_t> pending{0};
    while (!pending.empty()) {
        int32_t const index = pending.back();
        pending.pop_back();

        const Node& node = nodes[index];
        visitor(node.region, node.depth, node.isLeaf());

        if (!node.isLeaf()) {
            for (int32_t q = 3; q >= 0; --q) {
                pending.push_back(node.firstChild + q);
            }
        }
    }
}

std::size_t Quadtree::leafCount() const {
    return static_cast<std::size_t>(
        std::count_if(nodes.begin(), nodes.end(), [](const Node& n) { return n.isLeaf(); }));
}
