#include "quadsim/systems/spawn.hpp"
#include "quadsim/components/basic.hpp"
#include "quadsim/core/debug.hpp"
#include "quadsim/core/profile.hpp"

#include <algorithm>
#include <cmath>

namespace Systems {

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

} // namespace

SpawnSystem::SpawnSystem() = default;

void SpawnSystem::setSystemConfig(const SimConfig& config) {
    ISystem::setSystemConfig(config);
    if (config.Seed != 0) {
        rng.seed(config.Seed);
    } else {
        std::random_device rd;
        rng.seed(rd());
    }
}

void SpawnSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("SpawnSystem");

    auto particles = registry.view<Components::Particle>();
    auto const existing = static_cast<int>(particles.size());
    int const toSpawn = std::min(sysConfig.SpawnPerTick, sysConfig.MaxParticles - existing);
    if (toSpawn <= 0) {
        return;
    }

    double const r = sysConfig.ParticleRadius;
    std::uniform_real_distribution<double> xDist(r, std::max(r, sysConfig.WorldWidth - r));
    std::uniform_real_distribution<double> yDist(r, std::max(r, sysConfig.WorldHeight - r));
    std::uniform_real_distribution<double> angleDist(0.0, kTwoPi);
    std::uniform_int_distribution<int> shadeDist(120, 255);

    for (int i = 0; i < toSpawn; ++i) {
        double const x = xDist(rng);
        double const y = yDist(rng);
        double const angle = angleDist(rng);

        auto particle = registry.create();
        registry.emplace<Components::Position>(particle, x, y);
        registry.emplace<Components::Velocity>(particle,
                                               std::cos(angle) * sysConfig.ParticleSpeed,
                                               std::sin(angle) * sysConfig.ParticleSpeed);
        registry.emplace<Components::Radius>(particle, r);
        registry.emplace<Components::Particle>(particle);

        auto const shade = static_cast<uint8_t>(shadeDist(rng));
        registry.emplace<Components::Color>(particle, uint8_t{80}, shade, uint8_t{255});
    }

    spawned += static_cast<std::size_t>(toSpawn);
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[SpawnSystem] spawned " << toSpawn << ", total " << spawned << "\n");
}

} // namespace Systems
