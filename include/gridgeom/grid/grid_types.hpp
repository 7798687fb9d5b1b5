/**
 * @file grid_types.hpp
 * @brief Grid kinds, diagonal rules and discrete cell coordinates
 */

#ifndef GRIDGEOM_GRID_TYPES_HPP
#define GRIDGEOM_GRID_TYPES_HPP

#include <iosfwd>

namespace GridGeom {

/**
 * @brief The kinds of canvas grid
 */
enum class GridType {
    GRIDLESS,
    SQUARE,
    HEX
};

/**
 * @brief Conventions for weighting non axis-aligned movement
 *
 * The set is closed; any other value reaching the catalog is a programming error.
 */
enum class DiagonalRule {
    EQUIDISTANT,    ///< Diagonal moves cost the same as straight ones
    EXACT,          ///< sqrt(2) per planar diagonal, sqrt(3) per 3D diagonal
    APPROXIMATE,    ///< 1.5 per planar diagonal, 1.75 per 3D diagonal
    RECTILINEAR,    ///< Manhattan movement
    ALTERNATING_1,  ///< Diagonals alternate 1, 2, 1, 2...
    ALTERNATING_2,  ///< Diagonals alternate 2, 1, 2, 1...
    ILLEGAL,        ///< Diagonals not allowed; measured as rectilinear
    EUCLIDEAN       ///< Straight-line distance
};

/**
 * @brief Row, column, elevation coordinates of a grid space
 *
 * The vertical assumes grid cubes are stacked upon one another; k = 0 is the
 * scene elevation and negative k is below the scene.
 */
struct GridOffset3d {
    int i = 0;  ///< Row
    int j = 0;  ///< Column
    int k = 0;  ///< Elevation step

    bool operator==(const GridOffset3d& o) const { return i == o.i && j == o.j && k == o.k; }
    bool operator!=(const GridOffset3d& o) const { return !(*this == o); }
};

/**
 * @brief Integer cube coordinates of a hex. q + r + s == 0.
 */
struct HexCube {
    int q = 0;
    int r = 0;
    int s = 0;

    bool operator==(const HexCube& o) const { return q == o.q && r == o.r && s == o.s; }
    bool operator!=(const HexCube& o) const { return !(*this == o); }
};

/**
 * @brief Hex cube coordinates plus an elevation step
 */
struct HexCube3d {
    int q = 0;
    int r = 0;
    int s = 0;
    int k = 0;

    HexCube cube() const { return {q, r, s}; }

    bool operator==(const HexCube3d& o) const { return q == o.q && r == o.r && s == o.s && k == o.k; }
    bool operator!=(const HexCube3d& o) const { return !(*this == o); }
};

/**
 * @brief Unrounded cube coordinates, as produced by converting a canvas point
 */
struct FractionalCube {
    double q = 0.0;
    double r = 0.0;
    double s = 0.0;
};

std::ostream& operator<<(std::ostream& out, const GridOffset3d& o);
std::ostream& operator<<(std::ostream& out, const HexCube3d& h);

} // namespace GridGeom

#endif // GRIDGEOM_GRID_TYPES_HPP
