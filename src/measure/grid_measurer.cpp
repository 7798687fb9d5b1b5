#include "gridgeom/measure/grid_measurer.hpp"

#include "gridgeom/core/constants.hpp"
#include "gridgeom/core/debug.hpp"

namespace GridGeom {

GridMeasurer::GridMeasurer(const IGridProvider& grid)
    : grid(grid),
      distance(grid),
      rasterizer(grid)
{
}

double GridMeasurer::measureDistance(const Position& a, const Position& b,
                                     std::optional<DiagonalRule> rule) const {
    return distance.between(a, b, rule);
}

PathMeasurement GridMeasurer::measurePath(const std::vector<Position>& points,
                                          std::optional<DiagonalRule> rule) const {
    DiagonalRule const diagonals = rule.value_or(grid.activeDiagonalRule());
    PathMeasurement res;
    if (points.size() < 2) return res;

    std::optional<AlternatingTracker> tracker;
    if (GridConstants::isAlternating(diagonals)) {
        tracker.emplace(makeAlternatingTracker(diagonals));
    }

    // One cost walk spans every cell of the path.
    OffsetCostFn costFn(grid, diagonals);

    for (std::size_t i = 1; i < points.size(); ++i) {
        const Position& a = points[i - 1];
        const Position& b = points[i];

        SegmentMeasurement seg;
        seg.distance = distance.between(a, b, diagonals, tracker ? &*tracker : nullptr);

        std::vector<Position> const cells = rasterizer.directPath(a, b);
        double walked = 0.0;
        // cells[0] is the joint cell the previous segment already walked into.
        for (std::size_t c = 1; c < cells.size(); ++c) {
            walked += costFn(cells[c - 1], cells[c]);
        }
        seg.offsetDistance = distance.snapToGridDistance(walked);
        seg.cost = seg.offsetDistance;
        seg.numDiagonal = costFn.diagonals() - res.diagonalCount;

        res.diagonalCount = costFn.diagonals();
        res.totalDistance += seg.distance;
        res.totalOffsetCost += seg.cost;
        res.segments.push_back(seg);
        DebugStats::recordSegment(seg.distance);
    }

    res.totalDistance = distance.snapToGridDistance(res.totalDistance);
    res.totalOffsetCost = distance.snapToGridDistance(res.totalOffsetCost);

    GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_BASIC,
        "Path of " << points.size() << " waypoints ["
        << GridConstants::getDiagonalRuleName(diagonals) << "]: distance "
        << res.totalDistance << ", offset cost " << res.totalOffsetCost
        << ", diagonals " << res.diagonalCount << "\n");
    return res;
}

std::vector<Position> GridMeasurer::rasterizeDirectPath(const Position& start, const Position& end) const {
    return rasterizer.directPath(start, end);
}

AlternatingTracker GridMeasurer::makeAlternatingTracker(DiagonalRule rule) const {
    return AlternatingTracker(rule);
}

OffsetCostFn GridMeasurer::makeOffsetCostFn(int priorDiagonals, std::optional<DiagonalRule> rule) const {
    return OffsetCostFn(grid, rule.value_or(grid.activeDiagonalRule()), priorDiagonals);
}

SegmentMeasurement GridMeasurer::measureSegment(const Position& a, const Position& b,
                                                int numPrevDiagonal,
                                                const SegmentCostFunction& costFn,
                                                std::optional<DiagonalRule> rule) const {
    DiagonalRule const diagonals = rule.value_or(grid.activeDiagonalRule());

    // Separate trackers: the point and the offset measurements are two walks.
    std::optional<AlternatingTracker> pointTracker;
    std::optional<AlternatingTracker> offsetTracker;
    if (GridConstants::isAlternating(diagonals)) {
        pointTracker.emplace(AlternatingTracker::fromPriorDiagonals(diagonals, numPrevDiagonal));
        offsetTracker.emplace(AlternatingTracker::fromPriorDiagonals(diagonals, numPrevDiagonal));
    }

    SegmentMeasurement seg;
    seg.distance = distance.between(a, b, diagonals, pointTracker ? &*pointTracker : nullptr);
    seg.offsetDistance = distance.between(gridCenterForPoint(a), gridCenterForPoint(b), diagonals,
                                          offsetTracker ? &*offsetTracker : nullptr);
    seg.cost = costFn ? costFn(a, b, seg.offsetDistance) : seg.offsetDistance;
    seg.numDiagonal = numDiagonal(a, b);
    return seg;
}

int GridMeasurer::numDiagonal(const Position& a, const Position& b) const {
    return OffsetCostFn(grid, grid.activeDiagonalRule()).numDiagonal(a, b);
}

Position GridMeasurer::gridCenterForPoint(const Position& p) const {
    if (grid.isGridless()) return p;
    return grid.offsetToWorldCenter(grid.worldToOffset(p));
}

bool GridMeasurer::offsetsEqual(const Position& a, const Position& b) const {
    return grid.worldToOffset(a) == grid.worldToOffset(b);
}

} // namespace GridGeom
