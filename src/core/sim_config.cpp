#include "quadsim/core/sim_config.hpp"

#include <stdexcept>
#include <string>

namespace {

void require(bool ok, const std::string& field, double value) {
    if (!ok) {
        throw std::invalid_argument("SimConfig: invalid " + field + " (" + std::to_string(value) + ")");
    }
}

} // namespace

void SimConfig::validate() const {
    require(WorldWidth > 0.0, "WorldWidth", WorldWidth);
    require(WorldHeight > 0.0, "WorldHeight", WorldHeight);
    require(SecondsPerTick > 0.0, "SecondsPerTick", SecondsPerTick);
    require(QuadtreeParams.capacity >= 1, "QuadtreeParams.capacity", QuadtreeParams.capacity);
    require(QuadtreeParams.maxDepth >= 0, "QuadtreeParams.maxDepth", QuadtreeParams.maxDepth);
    require(ParticleRadius > 0.0, "ParticleRadius", ParticleRadius);
    require(ParticleSpeed >= 0.0, "ParticleSpeed", ParticleSpeed);
    require(SpawnPerTick >= 0, "SpawnPerTick", SpawnPerTick);
    require(MaxParticles >= 0, "MaxParticles", MaxParticles);
    require(PlayerRadius > 0.0, "PlayerRadius", PlayerRadius);
    require(PlayerSpeed >= 0.0, "PlayerSpeed", PlayerSpeed);
    require(2.0 * PlayerRadius < WorldWidth && 2.0 * PlayerRadius < WorldHeight,
            "PlayerRadius", PlayerRadius);

    ResolverParams.validate();
}
