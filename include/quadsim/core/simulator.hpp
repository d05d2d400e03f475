/**
 * @file simulator.hpp
 * @brief Headless simulation that owns the registry and steps the systems.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <entt/entt.hpp>

#include "quadsim/core/sim_config.hpp"
#include "quadsim/math/vector_math.hpp"
#include "quadsim/rendering/drawable.hpp"
#include "quadsim/systems/collision/player_collision.hpp"
#include "quadsim/systems/i_system.hpp"

/**
 * @class Simulator
 * @brief Runs spawn, movement, boundary and player collision once per tick.
 */
class Simulator {
public:
    /**
     * @throws std::invalid_argument if config fails SimConfig::validate()
     */
    explicit Simulator(const SimConfig& config);

    /**
     * @brief Clears the registry and recreates the player at the world center
     */
    void reset();

    /**
     * @brief Steps every system once, in order
     */
    void tick();

    /**
     * @brief Input hook: steer the player
     *
     * The direction is normalized and scaled to PlayerSpeed. A zero
     * direction stops the player.
     */
    void setPlayerDirection(const Vector& direction);

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    entt::entity getPlayer() const { return player; }
    const SimConfig& getConfig() const { return config; }
    uint64_t getTickCount() const { return ticks; }

    const Systems::CollisionStats& getLastCollisionStats() const;
    const QuadtreeOutline& getQuadtreeOutline() const;

private:
    void createSystems();

    SimConfig config;
    entt::registry registry;
    entt::entity player = entt::null;
    uint64_t ticks = 0;

    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::PlayerCollisionSystem* collisionSystem = nullptr;
};
