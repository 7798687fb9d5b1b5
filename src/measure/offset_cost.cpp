#include "gridgeom/measure/offset_cost.hpp"

#include <algorithm>
#include <cstdlib>

#include "gridgeom/core/constants.hpp"
#include "gridgeom/core/debug.hpp"
#include "gridgeom/grid/hex_grid.hpp"

namespace GridGeom {

OffsetCostFn::OffsetCostFn(const IGridProvider& grid, DiagonalRule rule, int priorDiagonals)
    : grid(grid),
      diagonalRule(rule),
      numDiagonals(priorDiagonals)
{
    // Fails fast on a rule outside the catalog.
    GridConstants::getDiagonalRuleName(rule);
    if (GridConstants::isAlternating(rule)) {
        tracker.emplace(AlternatingTracker::fromPriorDiagonals(rule, priorDiagonals));
    }
}

double OffsetCostFn::operator()(const Position& prevCell, const Position& currCell) {
    if (grid.isGridless()) {
        return grid.coordinates().pixelsToGridUnits(distanceBetween(prevCell, currCell));
    }

    SortedAxes const axes = offsetAxes(prevCell, currCell);
    double const l = tracker ? tracker->step(axes.maxAxis, axes.midAxis, axes.minAxis)
                             : ruleDistance(diagonalRule, axes);
    numDiagonals += numDiagonal(prevCell, currCell);

    GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_VERBOSE,
        "Offset step " << static_cast<int>(classify(prevCell, currCell))
        << " cost " << l << " cells, diagonals " << numDiagonals << "\n");
    return l * grid.distancePerCell();
}

StepKind OffsetCostFn::classify(const Position& prevCell, const Position& currCell) const {
    GridOffset3d const a = grid.worldToOffset(prevCell);
    GridOffset3d const b = grid.worldToOffset(currCell);
    bool const elevation = a.k != b.k;

    int planarAxes = 0;
    if (grid.isHexagonal()) {
        planarAxes = (a.i != b.i || a.j != b.j) ? 1 : 0;
    } else {
        planarAxes = (a.i != b.i ? 1 : 0) + (a.j != b.j ? 1 : 0);
    }

    if (planarAxes == 0) return elevation ? StepKind::ELEVATION : StepKind::NONE;
    if (planarAxes == 1) return elevation ? StepKind::DIAGONAL_ELEVATION : StepKind::STRAIGHT;
    return elevation ? StepKind::DOUBLE_DIAGONAL_ELEVATION : StepKind::DIAGONAL;
}

int OffsetCostFn::numDiagonal(const Position& a, const Position& b) const {
    if (grid.isGridless()) return 0;
    return static_cast<int>(offsetAxes(a, b).midAxis);
}

SortedAxes OffsetCostFn::offsetAxes(const Position& a, const Position& b) const {
    GridOffset3d const oa = grid.worldToOffset(a);
    GridOffset3d const ob = grid.worldToOffset(b);
    double const dk = std::abs(oa.k - ob.k);

    if (grid.isHexagonal()) {
        double const dist2d = IGridProvider::cubeDistance(HexGrid::offsetToCube(oa), HexGrid::offsetToCube(ob));
        return sortAxes(dist2d, dk);
    }
    return sortAxes(std::abs(oa.i - ob.i), std::abs(oa.j - ob.j), dk);
}

} // namespace GridGeom
