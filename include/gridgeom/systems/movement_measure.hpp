/**
 * @file movement_measure.hpp
 * @brief System for measuring planned token movement
 *
 * This system handles:
 * - Distance and offset cost from a token's position through its waypoints
 * - The rasterized path the token would cross
 *
 * Required components:
 * - Position (to read)
 * - Waypoints (to read)
 *
 * Optional components:
 * - MovementRule (overrides the grid's diagonal rule)
 *
 * Written components:
 * - MovementMeasurement
 * - PlannedPath
 */

#ifndef GRIDGEOM_MOVEMENT_MEASURE_SYSTEM_HPP
#define GRIDGEOM_MOVEMENT_MEASURE_SYSTEM_HPP

#include <entt/entt.hpp>

#include "gridgeom/measure/grid_measurer.hpp"

namespace Systems {

/**
 * @brief Measures the planned movement of every token with waypoints
 *
 * Tokens with no waypoints get a zero measurement and a path holding only
 * their own cell.
 */
class MovementMeasureSystem {
public:
    /**
     * @brief Measures all tokens with Position and Waypoints
     * @param registry EnTT registry containing entities and components
     * @param measurer Measurer bound to the scene grid
     */
    static void update(entt::registry &registry, const GridGeom::GridMeasurer &measurer);

    /**
     * @brief True when the token's measured distance fits within its Speed
     *
     * Tokens without Speed or without a measurement are never in range.
     */
    static bool withinSpeed(const entt::registry &registry, entt::entity token);
};

} // namespace Systems

#endif
