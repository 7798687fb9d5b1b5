/**
 * @file grid_distance.hpp
 * @brief Point-to-point gameplay distance on square, hex and gridless grids
 */

#ifndef GRIDGEOM_GRID_DISTANCE_HPP
#define GRIDGEOM_GRID_DISTANCE_HPP

#include <optional>

#include "gridgeom/grid/i_grid_provider.hpp"
#include "gridgeom/measure/alternating_tracker.hpp"
#include "gridgeom/measure/diagonal_rules.hpp"

namespace GridGeom {

/**
 * @class GridDistance
 * @brief Measures single segments against one grid
 *
 * Square grids divide the per-axis deltas by the cell size, sort them and apply
 * the rule. Hex grids measure the planar cube distance and the elevation change
 * in cells and apply the rule to those two values. Gridless grids measure the
 * straight 3D line. Results are in grid units.
 */
class GridDistance {
public:
    explicit GridDistance(const IGridProvider& grid);

    /**
     * @brief Distance between two canvas points
     *
     * @param a Segment start
     * @param b Segment end
     * @param rule Diagonal rule; defaults to the grid's active rule
     * @param tracker Tracker of the surrounding walk, used for alternating rules.
     *        When null, alternating rules measure the segment as a fresh walk.
     * @return double Distance in grid units, snapped to whole cells when within tolerance
     */
    double between(const Position& a, const Position& b,
                   std::optional<DiagonalRule> rule = std::nullopt,
                   AlternatingTracker* tracker = nullptr) const;

    /**
     * @brief Sorted per-axis deltas of a square-grid move, in cells
     */
    SortedAxes squareAxes(const Position& a, const Position& b) const;

    /**
     * @brief Sorted (planar, elevation) deltas of a hex-grid move, in cells; minAxis is zero
     */
    SortedAxes hexAxes(const Position& a, const Position& b) const;

    /**
     * @brief Rounds a distance to the nearest multiple of the grid distance when close to it
     */
    double snapToGridDistance(double dist) const;

private:
    double cellsToDistance(DiagonalRule rule, const SortedAxes& axes, AlternatingTracker* tracker) const;

    const IGridProvider& grid;
};

} // namespace GridGeom

#endif // GRIDGEOM_GRID_DISTANCE_HPP
