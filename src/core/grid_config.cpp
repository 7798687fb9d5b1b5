#include "gridgeom/core/grid_config.hpp"

#include <stdexcept>
#include <string>

void validateGridConfig(const GridConfig &cfg) {
    if (!(cfg.size > 0.0)) {
        throw std::invalid_argument("Grid size must be positive, got " + std::to_string(cfg.size));
    }
    if (!(cfg.distance > 0.0)) {
        throw std::invalid_argument("Grid distance must be positive, got " + std::to_string(cfg.distance));
    }

    // Both throw on values outside the enums.
    GridConstants::getGridTypeName(cfg.type);
    GridConstants::getDiagonalRuleName(cfg.diagonals);
}
