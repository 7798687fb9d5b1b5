/**
 * @file vector_math.hpp
 * @brief 3D position and vector mathematics for canvas coordinates
 *
 * This file provides the value types every grid computation works with:
 * - Position class for point locations on the canvas (x, y in pixels, z = elevation in pixels)
 * - Vector class for differences and directions
 * - Free functions for dot product, rotation and distance
 */

#ifndef GRIDGEOM_VECTOR_MATH_HPP
#define GRIDGEOM_VECTOR_MATH_HPP

#include <iosfwd>

namespace GridGeom {

class Vector;

/**
 * @brief Threshold for floating point equality tests
 */
constexpr double EPSILON = 1e-8;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a point on the canvas
 *
 * x and y are canvas pixels; z is elevation, also in pixels so that one grid
 * cell of movement is the same length along every axis.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate
    double z;  ///< Elevation

    /** @brief Constructs a Position at (0,0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     * @param z Elevation, defaults to the canvas plane
     */
    Position(double x, double y, double z = 0.0);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& v) const;
    Vector operator-(const Position& b) const;
    Position& operator+=(const Vector& v);

    bool operator==(const Position& b) const;
    bool operator!=(const Position& b) const;

    /**
     * @brief Copy of this position flattened onto the canvas plane
     */
    Position to2d() const;
};

/**
 * @brief Represents a 3D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     * @param z Z component
     */
    Vector(double x, double y, double z = 0.0);

    /** @brief Converts Vector to Position */
    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;
    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Component-wise absolute value */
    Vector abs() const;

    /** @brief Returns normalized vector (length = 1), or +x for a zero vector */
    Vector normalized() const;
};

/**
 * @brief Dot product of two vectors
 */
double dot(const Vector& a, const Vector& b);

/**
 * @brief Rotates a vector about the z axis
 *
 * @param v Vector to rotate; z is left untouched
 * @param angle Rotation angle in radians
 * @return Rotated vector
 */
Vector rotateByAngle(const Vector& v, double angle);

/**
 * @brief Euclidean distance between two positions, all three axes
 */
double distanceBetween(const Position& a, const Position& b);

std::ostream& operator<<(std::ostream& out, const Position& p);

} // namespace GridGeom

#endif // GRIDGEOM_VECTOR_MATH_HPP
