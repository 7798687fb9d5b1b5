/**
 * @file hex_grid.hpp
 * @brief Hexagonal scene grid using cube coordinates
 *
 * Hex (0, 0, 0) is centred on the origin and cellSize() is the distance between
 * the centres of adjacent hexes. Offsets store the axial coordinates of the hex:
 * i = r, j = q.
 *
 * See https://www.redblobgames.com/grids/hexagons/ for the underlying theory.
 */

#ifndef GRIDGEOM_HEX_GRID_HPP
#define GRIDGEOM_HEX_GRID_HPP

#include "gridgeom/grid/i_grid_provider.hpp"

namespace GridGeom {

class HexGrid : public IGridProvider {
public:
    explicit HexGrid(const GridConfig& cfg);

    GridType gridType() const override { return GridType::HEX; }
    GridOffset3d worldToOffset(const Position& p) const override;
    Position offsetToWorldCenter(const GridOffset3d& offset) const override;

    FractionalCube worldToCube(const Position& p) const override;
    Position cubeToWorld(const HexCube& cube) const override;

    /** @brief Flat-topped hexes in columns, otherwise pointy-topped rows */
    bool columns() const { return config.hexColumns; }

    /** @brief Cube coordinates of an offset */
    static HexCube offsetToCube(const GridOffset3d& offset) { return {offset.j, offset.i, -offset.i - offset.j}; }
};

} // namespace GridGeom

#endif // GRIDGEOM_HEX_GRID_HPP
