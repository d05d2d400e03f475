#include "quadsim/math/rect.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

Rect::Rect() : x_(0), y_(0), width_(0), height_(0) {}

Rect::Rect(double x, double y, double width, double height)
    : x_(x), y_(y), width_(width), height_(height)
{
    if (!std::isfinite(x) || !std::isfinite(y) ||
        !std::isfinite(width) || !std::isfinite(height)) {
        throw std::invalid_argument("Rect: coordinates must be finite");
    }
    if (width < 0.0 || height < 0.0) {
        throw std::invalid_argument("Rect: negative extents (" + std::to_string(width) +
                                    " x " + std::to_string(height) + ")");
    }
}

Rect Rect::centeredSquare(const Position& center, double halfExtent) {
    return {center.x - halfExtent, center.y - halfExtent, 2.0 * halfExtent, 2.0 * halfExtent};
}

Position Rect::center() const {
    return {x_ + width_ * 0.5, y_ + height_ * 0.5};
}

bool Rect::contains(const Position& p) const {
    return p.x >= x_ && p.x <= right() &&
           p.y >= y_ && p.y <= bottom();
}

bool Rect::intersects(const Rect& other) const {
    bool const outside = (other.x_ > right()) || (other.y_ > bottom()) ||
                         (other.right() < x_) || (other.bottom() < y_);
    return !outside;
}

Rect Rect::quadrant(int index) const {
    double const halfW = width_ * 0.5;
    double const halfH = height_ * 0.5;
    switch (index) {
        case 0: return {x_,         y_,         halfW, halfH};
        case 1: return {x_ + halfW, y_,         halfW, halfH};
        case 2: return {x_,         y_ + halfH, halfW, halfH};
        case 3: return {x_ + halfW, y_ + halfH, halfW, halfH};
        default:
            throw std::out_of_range("Rect::quadrant: index " + std::to_string(index));
    }
}

bool Rect::operator==(const Rect& other) const {
    return x_ == other.x_ && y_ == other.y_ &&
           width_ == other.width_ && height_ == other.height_;
}
