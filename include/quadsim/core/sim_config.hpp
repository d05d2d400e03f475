#pragma once

#include <cstdint>

#include "quadsim/math/rect.hpp"
#include "quadsim/spatial/quadtree.hpp"
#include "quadsim/systems/collision/collision_resolver.hpp"

/**
 * @struct SimConfig
 * @brief All tunables of one simulation, passed explicitly to every system.
 */
struct SimConfig {
    double WorldWidth = 800.0;
    double WorldHeight = 600.0;
    double SecondsPerTick = 1.0 / 60.0;

    QuadtreeConfig QuadtreeParams;
    Systems::ResolverConfig ResolverParams;

    double ParticleRadius = 4.0;
    double ParticleSpeed = 60.0;
    int SpawnPerTick = 2;
    int MaxParticles = 1500;

    double PlayerRadius = 24.0;
    double PlayerSpeed = 240.0;

    // Seed for spawning, 0 draws one from std::random_device
    uint32_t Seed = 0;

    /** @brief World bounds with the origin at the top-left corner */
    Rect worldBounds() const { return {0.0, 0.0, WorldWidth, WorldHeight}; }

    /**
     * @brief Rejects configurations no system can run with
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const;
};
