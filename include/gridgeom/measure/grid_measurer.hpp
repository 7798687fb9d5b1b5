/**
 * @file grid_measurer.hpp
 * @brief Public measurement API over one scene grid
 *
 * GridMeasurer bundles the distance calculator, the rasterizer, the alternating
 * tracker and the offset cost function behind a small surface:
 * - measureDistance: point-to-point gameplay distance
 * - measurePath: distance, cell-walk cost and diagonal count along waypoints
 * - rasterizeDirectPath: the cells a straight move crosses
 * - makeAlternatingTracker / makeOffsetCostFn: per-walk stateful helpers
 *
 * Example usage:
 * @code
 * SquareGrid grid(GridPresetManager::configFor(GridPreset::SQUARE_5FT));
 * GridMeasurer measurer(grid);
 * double d = measurer.measureDistance({50, 50}, {350, 450});  // 20 under EQUIDISTANT
 * @endcode
 */

#ifndef GRIDGEOM_GRID_MEASURER_HPP
#define GRIDGEOM_GRID_MEASURER_HPP

#include <functional>
#include <optional>
#include <vector>

#include "gridgeom/grid/i_grid_provider.hpp"
#include "gridgeom/measure/alternating_tracker.hpp"
#include "gridgeom/measure/grid_distance.hpp"
#include "gridgeom/measure/offset_cost.hpp"
#include "gridgeom/raster/grid_rasterizer.hpp"

namespace GridGeom {

/**
 * @brief Measurements of one segment of a path
 */
struct SegmentMeasurement {
    double distance = 0.0;        ///< Point-to-point distance, grid units
    double offsetDistance = 0.0;  ///< Distance walked cell by cell, grid units
    double cost = 0.0;            ///< offsetDistance, or the caller's cost function of it
    int numDiagonal = 0;          ///< Diagonals taken by the segment
};

/**
 * @brief Measurements of a whole path
 */
struct PathMeasurement {
    double totalDistance = 0.0;
    double totalOffsetCost = 0.0;
    int diagonalCount = 0;
    std::vector<SegmentMeasurement> segments;
};

/**
 * @brief Caller-supplied cost of a segment: (start, end, offsetDistance) -> cost
 */
using SegmentCostFunction = std::function<double(const Position&, const Position&, double)>;

class GridMeasurer {
public:
    /**
     * @param grid Grid to measure against; must outlive the measurer
     */
    explicit GridMeasurer(const IGridProvider& grid);

    /**
     * @brief Gameplay distance between two points, grid units
     */
    double measureDistance(const Position& a, const Position& b,
                           std::optional<DiagonalRule> rule = std::nullopt) const;

    /**
     * @brief Measures consecutive segments of a waypoint list
     *
     * Distances share one alternating tracker across the whole path. Offset cost
     * is one walk through the direct paths of all segments, so splitting a path at
     * its own cells leaves the total unchanged. Fewer than two points measure as
     * zero.
     */
    PathMeasurement measurePath(const std::vector<Position>& points,
                                std::optional<DiagonalRule> rule = std::nullopt) const;

    /**
     * @brief Cell centres of the direct path between two points
     */
    std::vector<Position> rasterizeDirectPath(const Position& start, const Position& end) const;

    /**
     * @brief Fresh tracker for one alternating walk
     */
    AlternatingTracker makeAlternatingTracker(DiagonalRule rule) const;

    /**
     * @brief Fresh cost function for one walk, after priorDiagonals diagonals
     */
    OffsetCostFn makeOffsetCostFn(int priorDiagonals = 0,
                                  std::optional<DiagonalRule> rule = std::nullopt) const;

    /**
     * @brief Measures distance, offset distance, and cost for a single segment
     *
     * @param a Start of the segment
     * @param b End of the segment
     * @param numPrevDiagonal Diagonals taken before the segment, for alternating parity
     * @param costFn Optional cost function; defaults to the offset distance
     * @param rule Diagonal rule; defaults to the grid's active rule
     */
    SegmentMeasurement measureSegment(const Position& a, const Position& b,
                                      int numPrevDiagonal = 0,
                                      const SegmentCostFunction& costFn = nullptr,
                                      std::optional<DiagonalRule> rule = std::nullopt) const;

    /** @brief Diagonals between the cells of two points */
    int numDiagonal(const Position& a, const Position& b) const;

    /** @brief Centre of the cell containing a point; the point itself when gridless */
    Position gridCenterForPoint(const Position& p) const;

    /** @brief True when two points fall in the same cell and elevation step */
    bool offsetsEqual(const Position& a, const Position& b) const;

    const IGridProvider& getGrid() const { return grid; }

private:
    const IGridProvider& grid;
    GridDistance distance;
    GridRasterizer rasterizer;
};

} // namespace GridGeom

#endif // GRIDGEOM_GRID_MEASURER_HPP
