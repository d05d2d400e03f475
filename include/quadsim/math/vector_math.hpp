/**
 * @file vector_math.hpp
 * @brief Points and directions in the 2D world plane
 *
 * Position is a location in world space (y grows downwards). Vector is used
 * for velocities, offsets between bodies and collision normals.
 */

#ifndef QUADSIM_VECTOR_MATH_HPP
#define QUADSIM_VECTOR_MATH_HPP

class Vector;

// Tolerance for degenerate lengths and coincident points
constexpr double EPSILON = 1e-9;

bool nearlyEqual(double a, double b, double epsilon = EPSILON);

class Position {
public:
    double x;
    double y;

    Position();
    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;

    double dist(const Position& p) const;

    // Translate by an offset
    Position& operator+=(const Vector& v);

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
};

class Vector {
public:
    double x;
    double y;

    Vector();
    Vector(double x, double y);

    // Offset of p from the world origin
    Vector(const Position& p);
    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    double length() const;
    double lengthSquared() const;
    double dotProduct(const Vector& v) const;

    // z component of the 3D cross product
    double cross(const Vector& other) const;

    /**
     * @brief Unit vector in the same direction
     *
     * A zero-length vector normalizes to (1,0) so callers always get a usable
     * direction back.
     */
    Vector normalized() const;

    /**
     * @brief Same direction, new magnitude
     *
     * Zero-length vectors are returned unchanged.
     */
    Vector scale(double length) const;

    /**
     * @brief Mirror image across the line with unit normal n: v - 2(v.n)n
     */
    Vector reflect(const Vector& n) const;

    // Counter-clockwise in a y-up frame, radians
    Vector rotateByAngle(double angle) const;

    // Unsigned, in [0, pi]
    double angleBetween(const Vector& other) const;

    Vector& operator+=(const Vector& v);
    Vector& operator*=(double scalar);
};

#endif // QUADSIM_VECTOR_MATH_HPP
