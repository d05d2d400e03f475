/**
 * @file collision_resolver.hpp
 * @brief Narrow-phase circle test and response for broad-phase candidates
 *
 * For every candidate overlapping the probe:
 * - the candidate is placed exactly tangent to the probe along the normal
 *   pointing from the probe center to the candidate center
 * - the sum of both velocities is reflected across that normal
 * - the result is damped, then raised to a minimum speed if it fell below it
 * - a small uniform random rotation is applied so bounces do not repeat exactly
 */

#pragma once

#include <cstdint>
#include <random>

#include "quadsim/math/rect.hpp"
#include "quadsim/math/vector_math.hpp"

namespace Systems {

/**
 * @struct ResolverConfig
 * @brief Tunables of the collision response
 */
struct ResolverConfig {
    // Multiplier applied to the reflected velocity, in [0, 1)
    double damping = 0.8;

    // Speed floor after damping
    double minSpeed = 30.0;

    // Maximum jitter rotation in radians, in [0, pi]
    double jitterAngle = 0.1;

    // Seed for the jitter generator, 0 draws one from std::random_device
    uint32_t seed = 0;

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * @struct Body
 * @brief Circle snapshot passed in and out of the resolver
 */
struct Body {
    Position position;
    double radius = 0.0;
    Vector velocity;
};

class CollisionResolver {
public:
    /**
     * @throws std::invalid_argument on out-of-range config values
     */
    explicit CollisionResolver(const ResolverConfig& config);

    /**
     * @brief Broad-phase query box for a probe: square of side 2*radius around its center
     */
    static Rect queryRegion(const Body& probe);

    /**
     * @brief Exact test: center distance strictly less than the sum of radii
     */
    static bool overlaps(const Body& probe, const Body& candidate);

    /**
     * @brief Resolves one candidate against the probe, updating the candidate in place
     * @return true if the bodies overlapped and the candidate was changed
     * @throws std::invalid_argument if either radius is not positive
     */
    bool resolve(const Body& probe, Body& candidate);

    const ResolverConfig& getConfig() const { return config; }

private:
    static void checkRadius(const Body& body, const char* role);

    ResolverConfig config;
    std::mt19937 rng;
    std::uniform_real_distribution<double> jitterDist;
};

} // namespace Systems
