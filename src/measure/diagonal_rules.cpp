#include "gridgeom/measure/diagonal_rules.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "gridgeom/core/constants.hpp"
#include "gridgeom/measure/alternating_tracker.hpp"

namespace GridGeom {

SortedAxes sortAxes(double a, double b, double c) {
    if (a < b) std::swap(a, b);
    if (b < c) std::swap(b, c);
    if (a < b) std::swap(a, b);
    return {a, b, c};
}

double approxGridDistance(double maxAxis, double midAxis, double minAxis) {
    return maxAxis + (0.5 * midAxis) + (0.25 * minAxis);
}

double exactGridDistance(double maxAxis, double midAxis, double minAxis) {
    double const a = GridConstants::Sqrt2 - 1.0;
    double const b = GridConstants::Sqrt3 - 1.0;
    return maxAxis + (a * midAxis) + ((b - a) * minAxis);
}

double ruleDistance(DiagonalRule rule, double maxAxis, double midAxis, double minAxis) {
    switch (rule) {
        case DiagonalRule::EQUIDISTANT:
            return maxAxis;
        case DiagonalRule::EXACT:
            return exactGridDistance(maxAxis, midAxis, minAxis);
        case DiagonalRule::EUCLIDEAN:
            return std::sqrt((maxAxis * maxAxis) + (midAxis * midAxis) + (minAxis * minAxis));
        case DiagonalRule::APPROXIMATE:
            return approxGridDistance(maxAxis, midAxis, minAxis);
        case DiagonalRule::ALTERNATING_1:
        case DiagonalRule::ALTERNATING_2: {
            AlternatingTracker tracker(rule);
            return tracker.step(maxAxis, midAxis, minAxis);
        }
        case DiagonalRule::RECTILINEAR:
        case DiagonalRule::ILLEGAL:
            return maxAxis + midAxis + minAxis;
    }
    throw std::invalid_argument("Unknown diagonal rule " + std::to_string(static_cast<int>(rule)));
}

} // namespace GridGeom
