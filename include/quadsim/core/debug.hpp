#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>

// Set to 1 (or pass -DQUADSIM_ENABLE_DEBUG=1) to enable debug output
#ifndef QUADSIM_ENABLE_DEBUG
#define QUADSIM_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

#define DEBUG_MSG(level, x) do { \
    if (QUADSIM_ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Cumulative broad/narrow phase counters across all ticks
class DebugStats {
public:
    static void reset() {
        ticks = 0;
        total_candidates = 0;
        total_hits = 0;
        total_splits = 0;
        max_depth = 0;
        max_nodes = 0;
    }

    static void updateTree(std::size_t nodes, std::size_t splits, int depth) {
        ticks++;
        total_splits += splits;
        max_nodes = std::max(max_nodes, nodes);
        max_depth = std::max(max_depth, depth);
    }

    static void updateCollisions(std::size_t candidates, std::size_t hits) {
        total_candidates += candidates;
        total_hits += hits;
    }

    static std::size_t tickCount() { return ticks; }
    static std::size_t candidateCount() { return total_candidates; }
    static std::size_t hitCount() { return total_hits; }

    static void printCollisionStats() {
        std::cout << "Collision stats:\n"
                  << "  Ticks: " << ticks << "\n"
                  << "  Avg splits/tick: " << (ticks > 0 ? double(total_splits) / ticks : 0.0) << "\n"
                  << "  Max nodes: " << max_nodes << "  Max depth: " << max_depth << "\n"
                  << "  Candidates: " << total_candidates << "  Hits: " << total_hits
                  << " (" << (total_candidates > 0 ? 100.0 * total_hits / total_candidates : 0.0)
                  << "% of candidates)\n";
    }

private:
    static std::size_t ticks;
    static std::size_t total_candidates;
    static std::size_t total_hits;
    static std::size_t total_splits;
    static std::size_t max_nodes;
    static int max_depth;
};
