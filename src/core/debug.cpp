#include "quadsim/core/debug.hpp"

// Initialize static members
std::size_t DebugStats::ticks = 0;
std::size_t DebugStats::total_candidates = 0;
std::size_t DebugStats::total_hits = 0;
std::size_t DebugStats::total_splits = 0;
std::size_t DebugStats::max_nodes = 0;
int DebugStats::max_depth = 0;
