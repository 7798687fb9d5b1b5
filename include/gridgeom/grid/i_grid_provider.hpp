/**
 * @file i_grid_provider.hpp
 * @brief Interface every scene grid implements
 */

#ifndef GRIDGEOM_I_GRID_PROVIDER_HPP
#define GRIDGEOM_I_GRID_PROVIDER_HPP

#include "gridgeom/core/coordinates.hpp"
#include "gridgeom/core/grid_config.hpp"
#include "gridgeom/grid/grid_types.hpp"
#include "gridgeom/math/vector_math.hpp"

namespace GridGeom {

/**
 * @class IGridProvider
 * @brief Grid configuration and coordinate conversions consumed by measurement and rasterization
 *
 * Square and gridless grids implement the offset conversions; hex grids implement
 * both the offset and the cube conversions. Cube methods on a non-hex grid throw
 * std::logic_error.
 */
class IGridProvider {
public:
    virtual ~IGridProvider() = default;

    virtual GridType gridType() const = 0;

    /** @brief World units (pixels) per cell */
    double cellSize() const { return config.size; }

    /** @brief Gameplay distance units per cell */
    double distancePerCell() const { return config.distance; }

    /** @brief Rule used when a measurement is not given one */
    DiagonalRule activeDiagonalRule() const { return config.diagonals; }

    const GridConfig& getConfig() const { return config; }
    const Coordinates& coordinates() const { return coords; }

    bool isGridless() const { return gridType() == GridType::GRIDLESS; }
    bool isHexagonal() const { return gridType() == GridType::HEX; }

    /**
     * @brief Cell containing a canvas point; k is the nearest elevation step of z
     */
    virtual GridOffset3d worldToOffset(const Position& p) const = 0;

    /**
     * @brief Centre of a cell; z is the elevation of k
     */
    virtual Position offsetToWorldCenter(const GridOffset3d& offset) const = 0;

    /** @brief Unrounded cube coordinates of a canvas point (hex only) */
    virtual FractionalCube worldToCube(const Position& p) const;

    /** @brief Centre of a hex on the canvas plane (hex only) */
    virtual Position cubeToWorld(const HexCube& cube) const;

    /**
     * @brief Hex-grid distance between two cube positions
     *
     * (|dq| + |dr| + |ds|) / 2, valid for fractional coordinates too.
     */
    static double cubeDistance(const FractionalCube& a, const FractionalCube& b);
    static int cubeDistance(const HexCube& a, const HexCube& b);

    /**
     * @brief Rounds fractional cube coordinates to the containing hex
     *
     * Each axis is rounded independently, then the axis with the largest rounding
     * residual is recomputed from the other two so that q + r + s == 0.
     */
    static HexCube cubeRound(const FractionalCube& cube);

    /** @brief Elevation step for a z value in pixels */
    int unitElevation(double z) const { return coords.zToUnit(z); }

    /** @brief z value in pixels for an elevation step */
    double elevationForUnit(int k) const { return coords.unitToZ(k); }

protected:
    explicit IGridProvider(const GridConfig& cfg) : config(cfg), coords(cfg) {}

    GridConfig config;
    Coordinates coords;
};

} // namespace GridGeom

#endif // GRIDGEOM_I_GRID_PROVIDER_HPP
