#include "gridgeom/grid/i_grid_provider.hpp"

#include <cmath>
#include <stdexcept>

#include "gridgeom/core/constants.hpp"

namespace GridGeom {

FractionalCube IGridProvider::worldToCube(const Position& /*p*/) const {
    throw std::logic_error("Cube coordinates are undefined on a " + GridConstants::getGridTypeName(gridType()) + " grid");
}

Position IGridProvider::cubeToWorld(const HexCube& /*cube*/) const {
    throw std::logic_error("Cube coordinates are undefined on a " + GridConstants::getGridTypeName(gridType()) + " grid");
}

double IGridProvider::cubeDistance(const FractionalCube& a, const FractionalCube& b) {
    return (std::fabs(a.q - b.q) + std::fabs(a.r - b.r) + std::fabs(a.s - b.s)) * 0.5;
}

int IGridProvider::cubeDistance(const HexCube& a, const HexCube& b) {
    return (std::abs(a.q - b.q) + std::abs(a.r - b.r) + std::abs(a.s - b.s)) / 2;
}

HexCube IGridProvider::cubeRound(const FractionalCube& cube) {
    double q = std::round(cube.q);
    double r = std::round(cube.r);
    double s = std::round(cube.s);
    double const qDiff = std::fabs(q - cube.q);
    double const rDiff = std::fabs(r - cube.r);
    double const sDiff = std::fabs(s - cube.s);

    // Reset the component with largest rounding error
    if (qDiff > rDiff && qDiff > sDiff) {
        q = -r - s;
    } else if (rDiff > sDiff) {
        r = -q - s;
    } else {
        s = -q - r;
    }
    return {static_cast<int>(q), static_cast<int>(r), static_cast<int>(s)};
}

} // namespace GridGeom
