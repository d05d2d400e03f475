/**
 * @file player_collision.hpp
 * @brief Per-tick broad and narrow phase between player bodies and particles
 *
 * Each update:
 * 1. Builds a fresh quadtree over the world bounds from every particle position
 * 2. For every player, queries the square around it
 * 3. Runs CollisionResolver on each candidate particle and writes the result back
 * 4. Optionally snapshots the tree outline for debug drawing, then drops the tree
 *
 * Required components:
 * - Player: Position, Velocity, Radius
 * - Particle: Position, Velocity, Radius
 */

#pragma once

#include <cstddef>
#include <memory>
#include <entt/entt.hpp>

#include "quadsim/rendering/drawable.hpp"
#include "quadsim/systems/collision/collision_resolver.hpp"
#include "quadsim/systems/i_system.hpp"

namespace Systems {

struct PlayerCollisionConfig {
    // Keep a QuadtreeOutline of each tick's tree
    bool captureOutline = true;
};

/**
 * @struct CollisionStats
 * @brief Counters for the most recent update
 */
struct CollisionStats {
    std::size_t inserted = 0;
    std::size_t nodes = 0;
    std::size_t splits = 0;
    int depth = 0;
    // Distinct ids returned by the broad phase, summed over players
    std::size_t candidates = 0;
    std::size_t hits = 0;
};

class PlayerCollisionSystem : public ConfigurableSystem<PlayerCollisionConfig> {
public:
    PlayerCollisionSystem();
    ~PlayerCollisionSystem() override = default;

    void update(entt::registry& registry) override;

    /** @brief Also rebuilds the resolver from config.ResolverParams */
    void setSystemConfig(const SimConfig& config) override;

    const CollisionStats& getLastStats() const { return lastStats; }
    const QuadtreeOutline& getOutline() const { return outline; }

private:
    std::unique_ptr<CollisionResolver> resolver;
    CollisionStats lastStats;
    QuadtreeOutline outline;
};

} // namespace Systems
