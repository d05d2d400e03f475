/**
 * @file rect.hpp
 * @brief Axis-aligned rectangle used for quadtree regions and queries
 *
 * The origin is the top-left corner and y grows downwards, matching screen
 * space. Both predicates are closed: points on an edge are contained, and
 * rectangles that only touch along an edge intersect.
 */

#ifndef QUADSIM_RECT_HPP
#define QUADSIM_RECT_HPP

#include "quadsim/math/vector_math.hpp"

class Rect {
public:
    /** @brief Constructs an empty rectangle at the origin */
    Rect();

    /**
     * @brief Constructs a rectangle from origin and extents
     * @throws std::invalid_argument if width or height is negative or not finite
     */
    Rect(double x, double y, double width, double height);

    /**
     * @brief Square of side 2*halfExtent centered on a point
     *
     * Used to build the broad-phase query box around a circular body.
     */
    static Rect centeredSquare(const Position& center, double halfExtent);

    double x() const { return x_; }
    double y() const { return y_; }
    double width() const { return width_; }
    double height() const { return height_; }
    double right() const { return x_ + width_; }
    double bottom() const { return y_ + height_; }
    Position center() const;

    bool contains(const Position& p) const;
    bool intersects(const Rect& other) const;

    /**
     * @brief One of the four equal quadrants of this rectangle
     * @param index 0 = top-left, 1 = top-right, 2 = bottom-left, 3 = bottom-right
     */
    Rect quadrant(int index) const;

    bool operator==(const Rect& other) const;

private:
    double x_;
    double y_;
    double width_;
    double height_;
};

#endif // QUADSIM_RECT_HPP
