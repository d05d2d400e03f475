#ifndef QUADSIM_COMPONENTS_BASIC_HPP
#define QUADSIM_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "quadsim/math/vector_math.hpp"

namespace Components {

    using Position = ::Position;
    using Velocity = ::Vector;

    // Circle approximation used by the narrow phase and the renderer
    struct Radius {
        double value;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

    // The body that probes the quadtree each tick
    struct Player {};

    // Spawned bodies that the player pushes around
    struct Particle {};

} // namespace Components

#endif
