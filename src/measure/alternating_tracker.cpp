#include "gridgeom/measure/alternating_tracker.hpp"

#include <cmath>
#include <stdexcept>

#include "gridgeom/core/constants.hpp"
#include "gridgeom/measure/diagonal_rules.hpp"

namespace GridGeom {

AlternatingTracker::AlternatingTracker(DiagonalRule rule)
    : AlternatingTracker(rule, initialState(rule)) {}

AlternatingTracker::AlternatingTracker(DiagonalRule rule, const AlternatingState& prior)
    : diagonalRule(rule), initial(prior), current(prior)
{
    if (!GridConstants::isAlternating(rule)) {
        throw std::invalid_argument("AlternatingTracker requires an alternating rule, got "
                                    + GridConstants::getDiagonalRuleName(rule));
    }
}

AlternatingTracker AlternatingTracker::fromPriorDiagonals(DiagonalRule rule, int numPriorDiagonals) {
    return AlternatingTracker(rule, initialState(rule, numPriorDiagonals));
}

AlternatingState AlternatingTracker::initialState(DiagonalRule rule, int numPriorDiagonals) {
    int seed = (rule == DiagonalRule::ALTERNATING_2) ? 1 : 0;
    if (numPriorDiagonals % 2 != 0) {
        seed = 1 - seed;
    }

    AlternatingState s;
    s.lPrev = seed;
    s.prevMaxAxis = seed;
    s.prevMidAxis = seed;
    s.prevMinAxis = seed;
    return s;
}

double AlternatingTracker::step(double maxAxis, double midAxis, double minAxis) {
    current.prevMaxAxis += maxAxis;
    current.prevMidAxis += midAxis;
    current.prevMinAxis += minAxis;
    double const lCurr = cumulativeDistance(current.prevMaxAxis, current.prevMidAxis, current.prevMinAxis);
    double const l = lCurr - current.lPrev;
    current.lPrev = lCurr;
    return l;
}

double AlternatingTracker::cumulativeDistance(double maxAxis, double midAxis, double minAxis) {
    // Whole spaces traversed along each axis
    double const spacesX = std::floor(maxAxis);
    double const spacesY = std::floor(midAxis);
    double const spacesZ = std::floor(minAxis);

    // Partial space past the last whole one
    double const deltaX = maxAxis - spacesX;
    double const deltaY = midAxis - spacesY;
    double const deltaZ = minAxis - spacesZ;

    double const a = approxGridDistance(spacesX, spacesY, spacesZ);
    double const A = std::floor(a);
    double const B = std::floor(a + 1.0);
    double const C = std::floor(a + 1.5);
    double const D = std::floor(a + 1.75);
    return A + ((B - A) * deltaX) + ((C - B) * deltaY) + ((D - C) * deltaZ);
}

} // namespace GridGeom
