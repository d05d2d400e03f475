/**
 * @file spawn.hpp
 * @brief System that feeds particles into the world at a fixed rate
 */

#pragma once

#include <cstddef>
#include <random>
#include <entt/entt.hpp>
#include "quadsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class SpawnSystem
 * @brief Creates up to SpawnPerTick particles per tick until MaxParticles exist
 *
 * Particles appear at uniformly random positions at least one radius away
 * from the world edges, moving in a random direction at ParticleSpeed.
 */
class SpawnSystem : public ISystem {
public:
    SpawnSystem();
    ~SpawnSystem() override = default;

    void update(entt::registry& registry) override;

    /** @brief Also reseeds the generator from config.Seed */
    void setSystemConfig(const SimConfig& config) override;

    std::size_t getSpawnedCount() const { return spawned; }

private:
    std::mt19937 rng;
    std::size_t spawned = 0;
};

} // namespace Systems
