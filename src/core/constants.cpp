#include "gridgeom/core/constants.hpp"

#include <cmath>
#include <stdexcept>

namespace GridConstants {

    using GridGeom::DiagonalRule;
    using GridGeom::GridType;

    const double Pi      = 3.141592653589793;
    const double Sqrt2   = std::sqrt(2.0);
    const double Sqrt3   = std::sqrt(3.0);
    const double Epsilon = 1e-8;

    const double DefaultGridSize     = 100.0;
    const double DefaultGridDistance = 5.0;

    // Display
    const unsigned int ScreenLength = 800;

    std::vector<GridType> getAllGridTypes() {
        return {
            GridType::GRIDLESS,
            GridType::SQUARE,
            GridType::HEX
        };
    }

    std::string getGridTypeName(GridType type) {
        switch (type) {
            case GridType::GRIDLESS: return "GRIDLESS";
            case GridType::SQUARE:   return "SQUARE";
            case GridType::HEX:      return "HEX";
        }
        throw std::invalid_argument("Unknown grid type " + std::to_string(static_cast<int>(type)));
    }

    std::vector<DiagonalRule> getAllDiagonalRules() {
        return {
            DiagonalRule::EQUIDISTANT,
            DiagonalRule::EXACT,
            DiagonalRule::APPROXIMATE,
            DiagonalRule::RECTILINEAR,
            DiagonalRule::ALTERNATING_1,
            DiagonalRule::ALTERNATING_2,
            DiagonalRule::ILLEGAL,
            DiagonalRule::EUCLIDEAN
        };
    }

    std::string getDiagonalRuleName(DiagonalRule rule) {
        switch (rule) {
            case DiagonalRule::EQUIDISTANT:   return "EQUIDISTANT";
            case DiagonalRule::EXACT:         return "EXACT";
            case DiagonalRule::APPROXIMATE:   return "APPROXIMATE";
            case DiagonalRule::RECTILINEAR:   return "RECTILINEAR";
            case DiagonalRule::ALTERNATING_1: return "ALTERNATING_1";
            case DiagonalRule::ALTERNATING_2: return "ALTERNATING_2";
            case DiagonalRule::ILLEGAL:       return "ILLEGAL";
            case DiagonalRule::EUCLIDEAN:     return "EUCLIDEAN";
        }
        throw std::invalid_argument("Unknown diagonal rule " + std::to_string(static_cast<int>(rule)));
    }

    bool isAlternating(DiagonalRule rule) {
        return rule == DiagonalRule::ALTERNATING_1 || rule == DiagonalRule::ALTERNATING_2;
    }

} // namespace GridConstants
