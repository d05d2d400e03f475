/**
 * @file simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "quadsim/core/simulator.hpp"

#include "quadsim/components/basic.hpp"
#include "quadsim/core/debug.hpp"
#include "quadsim/core/profile.hpp"
#include "quadsim/systems/boundary.hpp"
#include "quadsim/systems/movement.hpp"
#include "quadsim/systems/spawn.hpp"

Simulator::Simulator(const SimConfig& config)
    : config(config)
{
    config.validate();
    reset();
}

void Simulator::createSystems() {
    systems.clear();

    systems.push_back(std::make_unique<Systems::SpawnSystem>());
    systems.push_back(std::make_unique<Systems::MovementSystem>());
    systems.push_back(std::make_unique<Systems::BoundarySystem>());

    auto collision = std::make_unique<Systems::PlayerCollisionSystem>();
    collisionSystem = collision.get();
    systems.push_back(std::move(collision));

    for (auto& system : systems) {
        system->setSystemConfig(config);
    }
}

void Simulator::reset() {
    registry.clear();
    ticks = 0;
    DebugStats::reset();

    Rect const world = config.worldBounds();
    player = registry.create();
    registry.emplace<Components::Position>(player, world.center());
    registry.emplace<Components::Velocity>(player, 0.0, 0.0);
    registry.emplace<Components::Radius>(player, config.PlayerRadius);
    registry.emplace<Components::Player>(player);
    registry.emplace<Components::Color>(player, uint8_t{255}, uint8_t{90}, uint8_t{60});

    createSystems();
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Simulator] reset, world " << config.WorldWidth << "x"
              << config.WorldHeight << "\n");
}

void Simulator::tick() {
    PROFILE_SCOPE("Simulator::tick");

    for (auto& system : systems) {
        system->update(registry);
    }
    ++ticks;
}

void Simulator::setPlayerDirection(const Vector& direction) {
    auto& vel = registry.get<Components::Velocity>(player);
    if (direction.lengthSquared() < EPSILON * EPSILON) {
        vel = Vector(0.0, 0.0);
    } else {
        vel = direction.normalized() * config.PlayerSpeed;
    }
}

const Systems::CollisionStats& Simulator::getLastCollisionStats() const {
    return collisionSystem->getLastStats();
}

const QuadtreeOutline& Simulator::getQuadtreeOutline() const {
    return collisionSystem->getOutline();
}
