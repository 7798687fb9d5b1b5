/**
 * @file coordinates.hpp
 * @brief Unit conversion between canvas pixels, grid units and elevation steps
 *
 * Handles conversion between:
 * - Pixels (canvas space, also used for elevation z)
 * - Grid units (gameplay distance, e.g. feet)
 * - Elevation steps k (whole grid layers above or below the scene)
 */
#pragma once

#include "gridgeom/core/grid_config.hpp"

namespace GridGeom {

/**
 * @class Coordinates
 * @brief Handles unit conversions for one grid configuration
 */
class Coordinates {
public:
    /**
     * @brief Construct a new Coordinates converter
     *
     * @param config Grid configuration supplying size and distance
     */
    explicit Coordinates(const GridConfig& config);

    /**
     * @brief Convert a pixel length to grid units
     *
     * @param pixels Length in canvas pixels
     * @return double Length in grid units
     */
    double pixelsToGridUnits(double pixels) const;

    /**
     * @brief Convert grid units to a pixel length
     *
     * @param gridUnits Length in grid units
     * @return double Length in canvas pixels
     */
    double gridUnitsToPixels(double gridUnits) const;

    /**
     * @brief Elevation step count for an elevation in grid units
     *
     * @param elevation Elevation in grid units
     * @return int Nearest whole number of grid layers
     */
    int unitElevation(double elevation) const;

    /**
     * @brief Elevation in grid units for an elevation step count
     *
     * Inverse of unitElevation.
     */
    double elevationForUnit(int k) const;

    /** @brief Elevation step count for a z value in pixels */
    int zToUnit(double z) const { return unitElevation(pixelsToGridUnits(z)); }

    /** @brief z value in pixels for an elevation step count */
    double unitToZ(int k) const { return gridUnitsToPixels(elevationForUnit(k)); }

    double getSize() const { return size; }
    double getDistance() const { return distance; }

    /**
     * @brief Update the configuration
     *
     * @param config New grid configuration
     */
    void updateConfig(const GridConfig& config);

private:
    double size;      ///< Pixels per cell
    double distance;  ///< Grid units per cell
};

} // namespace GridGeom
