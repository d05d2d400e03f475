#include "quadsim/systems/boundary.hpp"
#include "quadsim/components/basic.hpp"
#include "quadsim/core/profile.hpp"

#include <algorithm>
#include <cmath>

namespace Systems {

BoundarySystem::BoundarySystem() = default;

void BoundarySystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BoundarySystem");

    const double width = sysConfig.WorldWidth;
    const double height = sysConfig.WorldHeight;
    const double bounceDamping = specificConfig.bounceDamping;

    auto view = registry.view<Components::Position, Components::Velocity>();
    for (auto&& [entity, pos, vel] : view.each()) {
        double r = 0.0;
        if (const auto* radius = registry.try_get<Components::Radius>(entity)) {
            r = std::min(radius->value, 0.5 * std::min(width, height));
        }

        if (pos.x < r) {
            pos.x = r;
            vel.x = std::abs(vel.x) * bounceDamping;
        } else if (pos.x > width - r) {
            pos.x = width - r;
            vel.x = -std::abs(vel.x) * bounceDamping;
        }

        if (pos.y < r) {
            pos.y = r;
            vel.y = std::abs(vel.y) * bounceDamping;
        } else if (pos.y > height - r) {
            pos.y = height - r;
            vel.y = -std::abs(vel.y) * bounceDamping;
        }
    }
}

} // namespace Systems
