#ifndef GRIDGEOM_CONSTANTS_HPP
#define GRIDGEOM_CONSTANTS_HPP

#include <string>
#include <vector>

#include "gridgeom/grid/grid_types.hpp"

namespace GridConstants {

    // Truly global constants
    extern const double Pi;
    extern const double Sqrt2;
    extern const double Sqrt3;
    extern const double Epsilon;

    // Scene defaults, used when a config leaves a value unset
    extern const double DefaultGridSize;      // pixels per cell
    extern const double DefaultGridDistance;  // grid units per cell

    // Viewer
    extern const unsigned int ScreenLength;

    std::vector<GridGeom::GridType> getAllGridTypes();
    std::string getGridTypeName(GridGeom::GridType type);

    /**
     * @brief Every rule in the catalog, in declaration order.
     */
    std::vector<GridGeom::DiagonalRule> getAllDiagonalRules();
    std::string getDiagonalRuleName(GridGeom::DiagonalRule rule);

    /**
     * @brief True for ALTERNATING_1 and ALTERNATING_2.
     */
    bool isAlternating(GridGeom::DiagonalRule rule);
}

#endif // GRIDGEOM_CONSTANTS_HPP
