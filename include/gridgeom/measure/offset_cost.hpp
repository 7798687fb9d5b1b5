/**
 * @file offset_cost.hpp
 * @brief Per-step cost of walking a rasterized path cell by cell
 */

#ifndef GRIDGEOM_OFFSET_COST_HPP
#define GRIDGEOM_OFFSET_COST_HPP

#include <optional>

#include "gridgeom/grid/i_grid_provider.hpp"
#include "gridgeom/measure/alternating_tracker.hpp"
#include "gridgeom/measure/diagonal_rules.hpp"

namespace GridGeom {

/**
 * @brief Kinds of move between two adjacent cells
 */
enum class StepKind {
    NONE,                       ///< Same cell
    STRAIGHT,                   ///< One planar axis
    ELEVATION,                  ///< Elevation only
    DIAGONAL,                   ///< Two planar axes
    DIAGONAL_ELEVATION,         ///< One planar axis (or one hex) plus elevation
    DOUBLE_DIAGONAL_ELEVATION   ///< Two planar axes plus elevation; square grids only
};

/**
 * @class OffsetCostFn
 * @brief Cost function for consecutive cells of a path
 *
 * Each call classifies the move from the previous cell to the current one and
 * returns its cost in grid units under the rule. Alternating rules keep an
 * AlternatingTracker seeded with the parity of the diagonals taken before this
 * function was made. The running diagonal count can be read back to seed the
 * next segment.
 */
class OffsetCostFn {
public:
    /**
     * @param grid Grid the cells belong to
     * @param rule Diagonal rule
     * @param priorDiagonals Diagonals already taken earlier on the path
     */
    OffsetCostFn(const IGridProvider& grid, DiagonalRule rule, int priorDiagonals = 0);

    /**
     * @brief Cost of moving from prevCell to currCell, in grid units
     */
    double operator()(const Position& prevCell, const Position& currCell);

    /** @brief Diagonals taken so far, including the prior ones */
    int diagonals() const { return numDiagonals; }

    DiagonalRule rule() const { return diagonalRule; }

    /**
     * @brief Kind of move between two cells
     */
    StepKind classify(const Position& prevCell, const Position& currCell) const;

    /**
     * @brief Diagonal count of a move
     *
     * Square: the middle of the sorted per-axis offset deltas. Hex: the number of
     * combined hex and elevation moves, min(cube distance, |dk|). Gridless: zero.
     */
    int numDiagonal(const Position& a, const Position& b) const;

private:
    /** @brief Sorted integer per-axis deltas of the move, in cells */
    SortedAxes offsetAxes(const Position& a, const Position& b) const;

    const IGridProvider& grid;
    DiagonalRule diagonalRule;
    int numDiagonals;
    std::optional<AlternatingTracker> tracker;
};

} // namespace GridGeom

#endif // GRIDGEOM_OFFSET_COST_HPP
