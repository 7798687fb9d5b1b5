#include "gridgeom/grid/hex_grid.hpp"

#include "gridgeom/core/constants.hpp"

namespace GridGeom {

HexGrid::HexGrid(const GridConfig& cfg) : IGridProvider(cfg) {}

FractionalCube HexGrid::worldToCube(const Position& p) const {
    double const rowHeight = config.size * GridConstants::Sqrt3 * 0.5;
    FractionalCube c;
    if (config.hexColumns) {
        c.q = p.x / rowHeight;
        c.r = (p.y / config.size) - (c.q * 0.5);
    } else {
        c.r = p.y / rowHeight;
        c.q = (p.x / config.size) - (c.r * 0.5);
    }
    c.s = -c.q - c.r;
    return c;
}

Position HexGrid::cubeToWorld(const HexCube& cube) const {
    double const rowHeight = config.size * GridConstants::Sqrt3 * 0.5;
    if (config.hexColumns) {
        return {rowHeight * cube.q, config.size * (cube.r + (cube.q * 0.5)), 0.0};
    }
    return {config.size * (cube.q + (cube.r * 0.5)), rowHeight * cube.r, 0.0};
}

GridOffset3d HexGrid::worldToOffset(const Position& p) const {
    HexCube const cube = cubeRound(worldToCube(p));
    GridOffset3d o;
    o.i = cube.r;
    o.j = cube.q;
    o.k = unitElevation(p.z);
    return o;
}

Position HexGrid::offsetToWorldCenter(const GridOffset3d& offset) const {
    Position center = cubeToWorld(offsetToCube(offset));
    center.z = elevationForUnit(offset.k);
    return center;
}

} // namespace GridGeom
