/**
 * @file bresenham.hpp
 * @brief Digital line drawing on integer lattices
 *
 * All rasterizers return every lattice point from start to end inclusive, with
 * each consecutive pair differing by at most one along every axis. The driving
 * axis is the one with the largest absolute delta; on ties the lower axis wins
 * (x, then y, then z, then w). Identical endpoints produce a single point.
 */

#ifndef GRIDGEOM_BRESENHAM_HPP
#define GRIDGEOM_BRESENHAM_HPP

#include <vector>

#include "gridgeom/grid/grid_types.hpp"
#include "gridgeom/raster/lattice.hpp"

namespace GridGeom {

std::vector<LatticePoint2> bresenham2d(const LatticePoint2& a, const LatticePoint2& b);

/**
 * @brief 3D line where each secondary axis keeps its own error term
 */
std::vector<LatticePoint3> bresenham3d(const LatticePoint3& a, const LatticePoint3& b);

std::vector<LatticePoint4> bresenham4d(const LatticePoint4& a, const LatticePoint4& b);

/**
 * @brief 3D line for elevation-aware square-grid movement
 *
 * The planar (x, y) line is drawn in 2D first. If the elevation change (z) is
 * larger than the planar Chebyshev length, elevation drives and planar steps are
 * spread over the elevation steps; otherwise planar steps drive and elevation
 * steps are spread over them. A move that changes planar position and
 * elevation together is emitted as one combined step, never as two.
 *
 * @return max(planar length, |dz|) + 1 points
 */
std::vector<LatticePoint3> bresenham3dVerticalPrimary(const LatticePoint3& a, const LatticePoint3& b);

/**
 * @brief Hex-cube line with elevation
 *
 * Steps N = max(cube distance, |dk|) times through fractional (q, r, s, k) space,
 * rounding at every step. The cube axis with the largest rounding residual is
 * recomputed from the other two, so every emitted hex satisfies q + r + s == 0.
 *
 * @param a Start hex; must satisfy the cube invariant
 * @param b End hex; must satisfy the cube invariant
 * @return N + 1 hexes
 */
std::vector<HexCube3d> hexLine3d(const HexCube3d& a, const HexCube3d& b);

} // namespace GridGeom

#endif // GRIDGEOM_BRESENHAM_HPP
