/**
 * @file boundary.hpp
 * @brief System for keeping bodies inside the world rectangle
 *
 * This system handles:
 * - Clamping a body back inside the world, offset by its radius
 * - Reflecting the velocity component that pushed it out
 * - Applying a bounce damping factor to that component
 *
 * Required components:
 * - Position (to read/modify)
 * - Velocity (to read/modify)
 *
 * Optional components:
 * - Radius (treated as 0 when absent)
 */

#pragma once

#include <entt/entt.hpp>
#include "quadsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Factor applied to the reflected velocity component (0-1)
    double bounceDamping = 1.0;
};

class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    BoundarySystem();
    ~BoundarySystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems
