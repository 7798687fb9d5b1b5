/**
 * @file coordinates.cpp
 * @brief Implementation of unit conversion utilities
 */

#include "gridgeom/core/coordinates.hpp"

#include <cmath>

namespace GridGeom {

Coordinates::Coordinates(const GridConfig& config)
    : size(config.size),
      distance(config.distance)
{
    validateGridConfig(config);
}

double Coordinates::pixelsToGridUnits(double pixels) const {
    return (pixels * distance) / size;
}

double Coordinates::gridUnitsToPixels(double gridUnits) const {
    return (gridUnits * size) / distance;
}

int Coordinates::unitElevation(double elevation) const {
    return static_cast<int>(std::lround(elevation / distance));
}

double Coordinates::elevationForUnit(int k) const {
    return k * distance;
}

void Coordinates::updateConfig(const GridConfig& config) {
    validateGridConfig(config);
    size = config.size;
    distance = config.distance;
}

} // namespace GridGeom
