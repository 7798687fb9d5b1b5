#include "gridgeom/math/vector_math.hpp"

#include <cmath>
#include <ostream>

namespace GridGeom {

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

// Position

Position::Position() : x(0), y(0), z(0) {}
Position::Position(double x, double y, double z) : x(x), y(y), z(z) {}

Position::operator Vector() const {
  return {this->x, this->y, this->z};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y, this->z + v.z};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    this->z += v.z;
    return *this;
}

bool Position::operator==(const Position& b) const {
  return this->x == b.x && this->y == b.y && this->z == b.z;
}

bool Position::operator!=(const Position& b) const {
  return !(*this == b);
}

Position Position::to2d() const {
  return {this->x, this->y, 0.0};
}

// Vector

Vector::Vector() : x(0), y(0), z(0) {}
Vector::Vector(double x, double y, double z) : x(x), y(y), z(z) {}

Vector::operator Position() const {
  return {this->x, this->y, this->z};
}

Vector Vector::operator-() const {
    return {-this->x, -this->y, -this->z};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar, this->z / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    this->z += v.z;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    this->z -= v.z;
    return *this;
}

double Vector::length() const {
  return std::sqrt(dot(*this, *this));
}

Vector Vector::abs() const {
  return {std::fabs(this->x), std::fabs(this->y), std::fabs(this->z)};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len, this->z / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0, 0.0};
}

// Free functions

double dot(const Vector& a, const Vector& b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vector rotateByAngle(const Vector& v, double angle) {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {v.x*c - v.y*s, v.x*s + v.y*c, v.z};
}

double distanceBetween(const Position& a, const Position& b) {
  return (b - a).length();
}

std::ostream& operator<<(std::ostream& out, const Position& p) {
  return out << "(" << p.x << ", " << p.y << ", " << p.z << ")";
}

} // namespace GridGeom
