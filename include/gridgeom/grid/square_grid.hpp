/**
 * @file square_grid.hpp
 * @brief Square and gridless scene grids
 */

#ifndef GRIDGEOM_SQUARE_GRID_HPP
#define GRIDGEOM_SQUARE_GRID_HPP

#include "gridgeom/grid/i_grid_provider.hpp"

namespace GridGeom {

/**
 * @brief Square cells of side cellSize(), cell (0, 0) has its top-left corner at the origin
 */
class SquareGrid : public IGridProvider {
public:
    explicit SquareGrid(const GridConfig& cfg);

    GridType gridType() const override { return GridType::SQUARE; }
    GridOffset3d worldToOffset(const Position& p) const override;
    Position offsetToWorldCenter(const GridOffset3d& offset) const override;
};

/**
 * @brief A plane without cells
 *
 * Measurement is continuous. Offsets still resolve to square cells of cellSize()
 * so that points can be compared and snapped.
 */
class GridlessGrid : public SquareGrid {
public:
    explicit GridlessGrid(const GridConfig& cfg);

    GridType gridType() const override { return GridType::GRIDLESS; }
};

} // namespace GridGeom

#endif // GRIDGEOM_SQUARE_GRID_HPP
