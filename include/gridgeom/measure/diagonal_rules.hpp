/**
 * @file diagonal_rules.hpp
 * @brief Catalog of diagonal cost conventions
 *
 * Each rule turns the per-axis deltas of a single move, sorted from largest to
 * smallest and expressed in cells, into a distance in cells. Hex grids pass two
 * values (planar cube distance and elevation, sorted) with a zero third axis.
 */

#ifndef GRIDGEOM_DIAGONAL_RULES_HPP
#define GRIDGEOM_DIAGONAL_RULES_HPP

#include "gridgeom/grid/grid_types.hpp"

namespace GridGeom {

/**
 * @brief Per-axis deltas sorted descending
 */
struct SortedAxes {
    double maxAxis = 0.0;
    double midAxis = 0.0;
    double minAxis = 0.0;
};

/**
 * @brief Sorts three deltas so that maxAxis >= midAxis >= minAxis
 */
SortedAxes sortAxes(double a, double b, double c = 0.0);

/**
 * @brief max + 0.5 * mid + 0.25 * min
 */
double approxGridDistance(double maxAxis, double midAxis = 0.0, double minAxis = 0.0);

/**
 * @brief max + (sqrt2 - 1) * mid + (sqrt3 - sqrt2) * min
 */
double exactGridDistance(double maxAxis, double midAxis = 0.0, double minAxis = 0.0);

/**
 * @brief Distance in cells of a single move under a diagonal rule
 *
 * Alternating rules are measured by a fresh AlternatingTracker, so the move is
 * treated as the first one of its path.
 *
 * @param rule Diagonal rule; values outside the enum throw std::invalid_argument
 * @param maxAxis Largest per-axis delta, in cells
 * @param midAxis Middle per-axis delta, in cells
 * @param minAxis Smallest per-axis delta, in cells
 * @return double Distance in cells
 */
double ruleDistance(DiagonalRule rule, double maxAxis, double midAxis = 0.0, double minAxis = 0.0);

inline double ruleDistance(DiagonalRule rule, const SortedAxes& axes) {
    return ruleDistance(rule, axes.maxAxis, axes.midAxis, axes.minAxis);
}

} // namespace GridGeom

#endif // GRIDGEOM_DIAGONAL_RULES_HPP
