/**
 * @file movement.hpp
 * @brief System for integrating positions from velocity
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 */

#pragma once

#include <entt/entt.hpp>
#include "quadsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct MovementConfig
 * @brief Configuration parameters specific to the movement system
 */
struct MovementConfig {
    // Multiplier on SecondsPerTick, 0 freezes the world
    double timeScale = 1.0;
};

/**
 * @class MovementSystem
 * @brief Advances every entity by velocity * dt
 */
class MovementSystem : public ConfigurableSystem<MovementConfig> {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems
