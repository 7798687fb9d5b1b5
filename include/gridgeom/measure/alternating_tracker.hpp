/**
 * @file alternating_tracker.hpp
 * @brief Stateful measurement for the alternating diagonal rules
 *
 * Under ALTERNATING_1 diagonal moves cost 1, 2, 1, 2... along a whole path, and
 * under ALTERNATING_2 they cost 2, 1, 2, 1... The cost of a segment therefore
 * depends on every diagonal already taken. The tracker accumulates the per-axis
 * progress of the path and returns, for each segment, the difference between
 * the cumulative alternating distance after and before it.
 *
 * One tracker belongs to one measurement walk. Sharing it between unrelated
 * paths corrupts the alternation.
 */

#ifndef GRIDGEOM_ALTERNATING_TRACKER_HPP
#define GRIDGEOM_ALTERNATING_TRACKER_HPP

#include "gridgeom/grid/grid_types.hpp"

namespace GridGeom {

/**
 * @brief Cumulative counters of one alternating walk
 */
struct AlternatingState {
    double prevMaxAxis = 0.0;  ///< Summed largest deltas, plus the seed
    double prevMidAxis = 0.0;  ///< Summed middle deltas, plus the seed
    double prevMinAxis = 0.0;  ///< Summed smallest deltas, plus the seed
    double lPrev = 0.0;        ///< Cumulative alternating distance consumed so far
};

class AlternatingTracker {
public:
    /**
     * @brief Starts a fresh walk
     *
     * @param rule ALTERNATING_1 or ALTERNATING_2; anything else throws std::invalid_argument
     */
    explicit AlternatingTracker(DiagonalRule rule);

    /**
     * @brief Continues a walk from a previously captured state
     */
    AlternatingTracker(DiagonalRule rule, const AlternatingState& prior);

    /**
     * @brief Starts a walk after a number of diagonals already taken
     *
     * An odd count flips the parity, so the next diagonal costs what the second
     * diagonal of a fresh walk would.
     */
    static AlternatingTracker fromPriorDiagonals(DiagonalRule rule, int numPriorDiagonals);

    /**
     * @brief Seed state for a rule and a prior diagonal count
     */
    static AlternatingState initialState(DiagonalRule rule, int numPriorDiagonals = 0);

    /**
     * @brief Measures the next segment of the walk
     *
     * @param maxAxis Largest per-axis delta of the segment, in cells
     * @param midAxis Middle per-axis delta, in cells
     * @param minAxis Smallest per-axis delta, in cells
     * @return double Distance of the segment in cells
     */
    double step(double maxAxis, double midAxis = 0.0, double minAxis = 0.0);

    double operator()(double maxAxis, double midAxis = 0.0, double minAxis = 0.0) {
        return step(maxAxis, midAxis, minAxis);
    }

    /** @brief Current counters, for inspection or to continue the walk elsewhere */
    const AlternatingState& state() const { return current; }

    /** @brief Returns to the state the tracker was constructed with */
    void reset() { current = initial; }

    DiagonalRule rule() const { return diagonalRule; }

    /**
     * @brief Alternating distance of a whole move measured in one shot
     *
     * Whole cells are weighted like APPROXIMATE and floored; the fractional part
     * of each axis blends between the breakpoints floor(a), floor(a + 1),
     * floor(a + 1.5) and floor(a + 1.75).
     */
    static double cumulativeDistance(double maxAxis, double midAxis = 0.0, double minAxis = 0.0);

private:
    DiagonalRule diagonalRule;
    AlternatingState initial;
    AlternatingState current;
};

} // namespace GridGeom

#endif // GRIDGEOM_ALTERNATING_TRACKER_HPP
