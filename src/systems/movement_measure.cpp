#include "gridgeom/systems/movement_measure.hpp"

#include <vector>

#include "gridgeom/components/token.hpp"
#include "gridgeom/core/constants.hpp"
#include "gridgeom/core/debug.hpp"

namespace Systems {

void MovementMeasureSystem::update(entt::registry &registry, const GridGeom::GridMeasurer &measurer) {
    auto view = registry.view<Components::Position, Components::Waypoints>();

    for (auto [entity, pos, waypoints] : view.each()) {
        GridGeom::DiagonalRule rule = measurer.getGrid().activeDiagonalRule();
        if (const auto* custom = registry.try_get<Components::MovementRule>(entity)) {
            rule = custom->rule;
        }

        std::vector<GridGeom::Position> points;
        points.reserve(waypoints.points.size() + 1);
        points.push_back(pos);
        points.insert(points.end(), waypoints.points.begin(), waypoints.points.end());

        GridGeom::PathMeasurement const measured = measurer.measurePath(points, rule);

        Components::PlannedPath path;
        path.cells.push_back(measurer.gridCenterForPoint(pos));
        for (std::size_t i = 1; i < points.size(); ++i) {
            std::vector<GridGeom::Position> const cells = measurer.rasterizeDirectPath(points[i - 1], points[i]);
            // Each segment starts on the previous segment's last cell.
            path.cells.insert(path.cells.end(), cells.begin() + 1, cells.end());
        }

        registry.emplace_or_replace<Components::MovementMeasurement>(
            entity, measured.totalDistance, measured.totalOffsetCost, measured.diagonalCount);
        registry.emplace_or_replace<Components::PlannedPath>(entity, std::move(path));

        GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_VERBOSE,
            "Token " << static_cast<unsigned>(entt::to_integral(entity)) << " ["
            << GridConstants::getDiagonalRuleName(rule) << "] moves "
            << measured.totalDistance << "\n");
    }
}

bool MovementMeasureSystem::withinSpeed(const entt::registry &registry, entt::entity token) {
    const auto* speed = registry.try_get<Components::Speed>(token);
    const auto* measured = registry.try_get<Components::MovementMeasurement>(token);
    if (speed == nullptr || measured == nullptr) {
        return false;
    }
    return measured->distance <= speed->value + GridConstants::Epsilon;
}

} // namespace Systems
