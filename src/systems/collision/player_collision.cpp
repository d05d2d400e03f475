#include "quadsim/systems/collision/player_collision.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "quadsim/components/basic.hpp"
#include "quadsim/core/debug.hpp"
#include "quadsim/core/profile.hpp"
#include "quadsim/spatial/quadtree.hpp"

namespace Systems {

PlayerCollisionSystem::PlayerCollisionSystem()
    : resolver(std::make_unique<CollisionResolver>(sysConfig.ResolverParams))
{
}

void PlayerCollisionSystem::setSystemConfig(const SimConfig& config) {
    ISystem::setSystemConfig(config);
    resolver = std::make_unique<CollisionResolver>(config.ResolverParams);
}

void PlayerCollisionSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("PlayerCollisionSystem");

    lastStats = CollisionStats{};

    auto players = registry.view<Components::Player, Components::Position,
                                 Components::Velocity, Components::Radius>();
    if (players.begin() == players.end()) {
        std::cerr << "[PlayerCollision] Warning: No player entity found. Skipping update.\n";
        return;
    }

    Quadtree tree(sysConfig.worldBounds(), sysConfig.QuadtreeParams);
    {
        PROFILE_SCOPE("Quadtree::build");
        auto particles = registry.view<Components::Particle, Components::Position>();
        for (auto [entity, pos] : particles.each()) {
            if (tree.insert(entity, pos)) {
                ++lastStats.inserted;
            }
        }
    }

    std::vector<Quadtree::Entry> candidates;
    for (auto [playerEntity, playerPos, playerVel, playerRadius] : players.each()) {
        Body const probe{playerPos, playerRadius.value, playerVel};

        candidates.clear();
        tree.query(CollisionResolver::queryRegion(probe), candidates);

        // Boundary ties come back once per leaf that holds them; resolve each id once
        std::sort(candidates.begin(), candidates.end(),
                  [](const Quadtree::Entry& a, const Quadtree::Entry& b) { return a.id < b.id; });
        candidates.erase(std::unique(candidates.begin(), candidates.end(),
                                     [](const Quadtree::Entry& a, const Quadtree::Entry& b) { return a.id == b.id; }),
                         candidates.end());
        lastStats.candidates += candidates.size();

        for (const auto& candidate : candidates) {
            if (!registry.valid(candidate.id) ||
                !registry.all_of<Components::Position, Components::Velocity, Components::Radius>(candidate.id)) {
                continue;
            }

            auto& pos = registry.get<Components::Position>(candidate.id);
            auto& vel = registry.get<Components::Velocity>(candidate.id);
            const auto& radius = registry.get<Components::Radius>(candidate.id);

            Body body{pos, radius.value, vel};
            if (resolver->resolve(probe, body)) {
                pos = body.position;
                vel = body.velocity;
                ++lastStats.hits;
            }
        }
    }

    lastStats.nodes = tree.nodeCount();
    lastStats.splits = tree.splitCount();
    lastStats.depth = tree.depth();
    DebugStats::updateTree(lastStats.nodes, lastStats.splits, lastStats.depth);
    DebugStats::updateCollisions(lastStats.candidates, lastStats.hits);

    if (specificConfig.captureOutline) {
        outline = QuadtreeOutline::capture(tree);
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[PlayerCollision] " << lastStats.inserted << " inserted, "
              << lastStats.candidates << " candidates, " << lastStats.hits << " hits\n");
}

} // namespace Systems
