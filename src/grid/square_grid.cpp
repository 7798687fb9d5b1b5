#include "gridgeom/grid/square_grid.hpp"

#include <cmath>

namespace GridGeom {

SquareGrid::SquareGrid(const GridConfig& cfg) : IGridProvider(cfg) {}

GridOffset3d SquareGrid::worldToOffset(const Position& p) const {
    GridOffset3d o;
    o.i = static_cast<int>(std::floor(p.y / config.size));
    o.j = static_cast<int>(std::floor(p.x / config.size));
    o.k = unitElevation(p.z);
    return o;
}

Position SquareGrid::offsetToWorldCenter(const GridOffset3d& offset) const {
    return {(offset.j + 0.5) * config.size,
            (offset.i + 0.5) * config.size,
            elevationForUnit(offset.k)};
}

GridlessGrid::GridlessGrid(const GridConfig& cfg) : SquareGrid(cfg) {}

} // namespace GridGeom
