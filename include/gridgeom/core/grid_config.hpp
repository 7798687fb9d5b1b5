/**
 * @file grid_config.hpp
 * @brief Configuration for a scene grid.
 */

#pragma once

#include "gridgeom/core/constants.hpp"
#include "gridgeom/grid/grid_types.hpp"

/**
 * @brief Container for the grid parameters of a scene.
 *
 * Holds the grid kind, the pixel size of one cell, the gameplay distance one cell
 * represents, and the diagonal rule used when no rule is passed to a measurement.
 */
struct GridConfig {
    GridGeom::GridType type = GridGeom::GridType::SQUARE;
    double size = GridConstants::DefaultGridSize;          ///< Pixels per cell
    double distance = GridConstants::DefaultGridDistance;  ///< Grid units per cell
    GridGeom::DiagonalRule diagonals = GridGeom::DiagonalRule::EQUIDISTANT;

    // Hex layout: flat-topped hexes in columns when true, pointy-topped rows otherwise.
    bool hexColumns = false;
};

/**
 * @brief Rejects configurations no grid can be built from.
 *
 * Throws std::invalid_argument for a non-positive size or distance, or for a
 * grid type or diagonal rule outside their enums.
 *
 * @param cfg The configuration to check.
 */
void validateGridConfig(const GridConfig &cfg);
