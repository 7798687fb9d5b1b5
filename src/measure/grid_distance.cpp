#include "gridgeom/measure/grid_distance.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "gridgeom/core/constants.hpp"
#include "gridgeom/core/debug.hpp"

namespace GridGeom {

GridDistance::GridDistance(const IGridProvider& grid) : grid(grid) {}

double GridDistance::between(const Position& a, const Position& b,
                             std::optional<DiagonalRule> rule,
                             AlternatingTracker* tracker) const {
    DiagonalRule const diagonals = rule.value_or(grid.activeDiagonalRule());
    // Throws on a rule outside the catalog, gridless included.
    GridConstants::getDiagonalRuleName(diagonals);

    double dist = 0.0;
    switch (grid.gridType()) {
        case GridType::GRIDLESS:
            return grid.coordinates().pixelsToGridUnits(distanceBetween(a, b));
        case GridType::SQUARE:
            dist = cellsToDistance(diagonals, squareAxes(a, b), tracker);
            break;
        case GridType::HEX:
            dist = cellsToDistance(diagonals, hexAxes(a, b), tracker);
            break;
        default:
            throw std::invalid_argument("Unknown grid type " + std::to_string(static_cast<int>(grid.gridType())));
    }

    GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_VERBOSE,
        "GridDistance " << a << " -> " << b << " ["
        << GridConstants::getDiagonalRuleName(diagonals) << "] = " << dist << "\n");
    return snapToGridDistance(dist);
}

SortedAxes GridDistance::squareAxes(const Position& a, const Position& b) const {
    // Normalize so that a delta of 1 is one grid space.
    Vector const delta = (a - b).abs() / grid.cellSize();
    return sortAxes(delta.x, delta.y, delta.z);
}

SortedAxes GridDistance::hexAxes(const Position& a, const Position& b) const {
    double const dist2d = IGridProvider::cubeDistance(grid.worldToCube(a), grid.worldToCube(b));

    // Elevation normalized so that one grid space of vertical movement is 1.
    double const distElev = std::fabs(a.z - b.z) / grid.cellSize();
    return sortAxes(dist2d, distElev);
}

double GridDistance::snapToGridDistance(double dist) const {
    double const gridD = grid.distancePerCell();
    double const cells = std::round(dist / gridD);
    if (nearlyEqual(dist / gridD, cells, GridConstants::Epsilon)) {
        return cells * gridD;
    }
    return dist;
}

double GridDistance::cellsToDistance(DiagonalRule rule, const SortedAxes& axes,
                                     AlternatingTracker* tracker) const {
    double l = 0.0;
    if (GridConstants::isAlternating(rule) && tracker) {
        l = tracker->step(axes.maxAxis, axes.midAxis, axes.minAxis);
    } else {
        l = ruleDistance(rule, axes);
    }
    return l * grid.distancePerCell();
}

} // namespace GridGeom
