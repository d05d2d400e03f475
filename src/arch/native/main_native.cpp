/**
 * @file main_native.cpp
 * @brief Entry point for the SFML debug viewer.
 */

#include <exception>
#include <iostream>

#include "quadsim/arch/native/sim_manager.hpp"
#include "quadsim/core/debug.hpp"
#include "quadsim/core/profile.hpp"

int main() {
    SimConfig config;

    try {
        SimManager manager(config);
        if (!manager.init()) {
            return 1;
        }
        {
            PROFILE_SCOPE("main");
            manager.run();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    Profiling::Profiler::printStats();
    DebugStats::printCollisionStats();
    return 0;
}
