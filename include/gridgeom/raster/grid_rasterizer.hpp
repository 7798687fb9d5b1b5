/**
 * @file grid_rasterizer.hpp
 * @brief Direct grid paths between two canvas points
 */

#ifndef GRIDGEOM_GRID_RASTERIZER_HPP
#define GRIDGEOM_GRID_RASTERIZER_HPP

#include <vector>

#include "gridgeom/grid/i_grid_provider.hpp"
#include "gridgeom/raster/bresenham.hpp"

namespace GridGeom {

/**
 * @class GridRasterizer
 * @brief Converts a straight move between two canvas points into the cells it crosses
 */
class GridRasterizer {
public:
    explicit GridRasterizer(const IGridProvider& grid);

    /**
     * @brief Cell centres of the direct path from start to end, inclusive
     *
     * Square grids use the vertical-primary 3D line over (j, i, k); hex grids use
     * the hex-cube line. On a gridless canvas the path is the two endpoints, or a
     * single point when they coincide. Elevation of each centre is the elevation
     * of its step k.
     */
    std::vector<Position> directPath(const Position& start, const Position& end) const;

    /**
     * @brief Offsets of the square-grid direct path
     */
    std::vector<GridOffset3d> squarePath(const Position& start, const Position& end) const;

    /**
     * @brief Hexes of the hex-grid direct path
     */
    std::vector<HexCube3d> hexPath(const Position& start, const Position& end) const;

    /**
     * @brief Hex containing a canvas point, with the elevation step of z
     */
    HexCube3d hexCubeFor(const Position& p) const;

    /**
     * @brief Centre of a hex, with z at the elevation of k
     */
    Position hexCenter(const HexCube3d& hex) const;

private:
    const IGridProvider& grid;
};

} // namespace GridGeom

#endif // GRIDGEOM_GRID_RASTERIZER_HPP
