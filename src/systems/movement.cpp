#include "quadsim/systems/movement.hpp"
#include "quadsim/components/basic.hpp"
#include "quadsim/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem() = default;

void MovementSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("MovementSystem");

    double const dt = sysConfig.SecondsPerTick * specificConfig.timeScale;

    auto view = registry.view<Components::Position, Components::Velocity>();
    for (auto [entity, pos, vel] : view.each()) {
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
