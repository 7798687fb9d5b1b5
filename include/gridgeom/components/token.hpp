#ifndef GRIDGEOM_COMPONENTS_TOKEN_HPP
#define GRIDGEOM_COMPONENTS_TOKEN_HPP

#include <string>
#include <vector>

#include "gridgeom/grid/grid_types.hpp"
#include "gridgeom/math/vector_math.hpp"

namespace Components {

    using Position = GridGeom::Position;

    struct Name {
        std::string value;
    };

    // Planned destinations, in travel order. The token's Position is the start.
    struct Waypoints {
        std::vector<GridGeom::Position> points;
    };

    // Rule override for one token; the grid's active rule applies otherwise
    struct MovementRule {
        GridGeom::DiagonalRule rule;
    };

    // Written by MovementMeasureSystem
    struct MovementMeasurement {
        double distance = 0.0;
        double offsetCost = 0.0;
        int diagonals = 0;
    };

    // Cell centres the token crosses, start cell first
    struct PlannedPath {
        std::vector<GridGeom::Position> cells;
    };

    // Grid units the token may move this turn
    struct Speed {
        double value;
    };

} // namespace Components

#endif
