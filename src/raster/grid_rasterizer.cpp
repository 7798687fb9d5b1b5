#include "gridgeom/raster/grid_rasterizer.hpp"

#include "gridgeom/core/debug.hpp"

namespace GridGeom {

GridRasterizer::GridRasterizer(const IGridProvider& grid) : grid(grid) {}

std::vector<Position> GridRasterizer::directPath(const Position& start, const Position& end) const {
    std::vector<Position> path;
    switch (grid.gridType()) {
        case GridType::GRIDLESS:
            path.push_back(start);
            if (end != start) path.push_back(end);
            break;

        case GridType::SQUARE:
            for (auto const& offset : squarePath(start, end)) {
                path.push_back(grid.offsetToWorldCenter(offset));
            }
            break;

        case GridType::HEX:
            for (auto const& hex : hexPath(start, end)) {
                path.push_back(hexCenter(hex));
            }
            break;
    }

    DebugStats::recordPath(path.size());
    GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_VERBOSE,
        "Direct path " << start << " -> " << end << ": " << path.size() << " cells\n");
    return path;
}

std::vector<GridOffset3d> GridRasterizer::squarePath(const Position& start, const Position& end) const {
    GridOffset3d const a = grid.worldToOffset(start);
    GridOffset3d const b = grid.worldToOffset(end);

    std::vector<GridOffset3d> offsets;
    for (auto const& p : bresenham3dVerticalPrimary({a.j, a.i, a.k}, {b.j, b.i, b.k})) {
        GridOffset3d o;
        o.i = p.y;
        o.j = p.x;
        o.k = p.z;
        offsets.push_back(o);
    }
    return offsets;
}

std::vector<HexCube3d> GridRasterizer::hexPath(const Position& start, const Position& end) const {
    return hexLine3d(hexCubeFor(start), hexCubeFor(end));
}

HexCube3d GridRasterizer::hexCubeFor(const Position& p) const {
    HexCube const cube = IGridProvider::cubeRound(grid.worldToCube(p));
    return {cube.q, cube.r, cube.s, grid.unitElevation(p.z)};
}

Position GridRasterizer::hexCenter(const HexCube3d& hex) const {
    Position center = grid.cubeToWorld(hex.cube());
    center.z = grid.elevationForUnit(hex.k);
    return center;
}

} // namespace GridGeom
