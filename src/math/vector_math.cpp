#include "quadsim/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

bool Position::operator==(const Position& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Position::operator!=(const Position& other) const {
  return !(*this == other);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector& other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::scale(double length) const {
  double const vlen = this->length();
  if (vlen > EPSILON) {
    double const factor = length / vlen;
    return {this->x * factor, this->y * factor};
  }
  return *this;
}

Vector Vector::reflect(const Vector& n) const {
  return *this - n * (2.0 * this->dotProduct(n));
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x * c - this->y * s, this->x * s + this->y * c};
}

double Vector::angleBetween(const Vector& other) const {
  double const lenProduct = this->length() * other.length();
  if (lenProduct < EPSILON) {
    return 0.0;  // undefined, but return 0 for no angle
  }
  double dotVal = this->dotProduct(other) / lenProduct;
  dotVal = std::max(-1.0, std::min(1.0, dotVal));
  return std::acos(dotVal);
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}
