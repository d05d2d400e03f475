#include "quadsim/systems/collision/collision_resolver.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Systems {

namespace {

constexpr double kPi = 3.14159265358979323846;

uint32_t pickSeed(uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return rd();
}

const ResolverConfig& validated(const ResolverConfig& config) {
    config.validate();
    return config;
}

} // namespace

void ResolverConfig::validate() const {
    if (!(damping >= 0.0 && damping < 1.0)) {
        throw std::invalid_argument("ResolverConfig: damping must be in [0, 1), got " +
                                    std::to_string(damping));
    }
    if (!(minSpeed >= 0.0)) {
        throw std::invalid_argument("ResolverConfig: minSpeed must be non-negative, got " +
                                    std::to_string(minSpeed));
    }
    if (!(jitterAngle >= 0.0 && jitterAngle <= kPi)) {
        throw std::invalid_argument("ResolverConfig: jitterAngle must be in [0, pi], got " +
                                    std::to_string(jitterAngle));
    }
}

CollisionResolver::CollisionResolver(const ResolverConfig& config)
    : config(validated(config))
    , rng(pickSeed(config.seed))
    , jitterDist(-config.jitterAngle, config.jitterAngle)
{
}

void CollisionResolver::checkRadius(const Body& body, const char* role) {
    if (!(body.radius > 0.0)) {
        throw std::invalid_argument(std::string("CollisionResolver: ") + role +
                                    " radius must be positive, got " + std::to_string(body.radius));
    }
}

Rect CollisionResolver::queryRegion(const Body& probe) {
    checkRadius(probe, "probe");
    return Rect::centeredSquare(probe.position, probe.radius);
}

bool CollisionResolver::overlaps(const Body& probe, const Body& candidate) {
    double const sumR = probe.radius + candidate.radius;
    Vector const delta = candidate.position - probe.position;
    return delta.lengthSquared() < sumR * sumR;
}

bool CollisionResolver::resolve(const Body& probe, Body& candidate) {
    checkRadius(probe, "probe");
    checkRadius(candidate, "candidate");

    if (!overlaps(probe, candidate)) {
        return false;
    }

    double const sumR = probe.radius + candidate.radius;
    Vector const delta = candidate.position - probe.position;
    double const dist = delta.length();

    // Coincident centers have no normal; push along the probe's motion instead
    Vector normal;
    if (dist > EPSILON) {
        normal = delta / dist;
    } else {
        normal = probe.velocity.normalized();
    }

    Position placed = probe.position;
    placed += normal * sumR;
    candidate.position = placed;

    Vector vel = (candidate.velocity + probe.velocity).reflect(normal);
    vel *= config.damping;

    double const speed = vel.length();
    if (speed < config.minSpeed) {
        vel = speed > EPSILON ? vel.scale(config.minSpeed) : normal * config.minSpeed;
    }

    if (config.jitterAngle > 0.0) {
        vel = vel.rotateByAngle(jitterDist(rng));
    }

    candidate.velocity = vel;
    return true;
}

} // namespace Systems
