#include <gtest/gtest.h>
#include <vector>
#include <entt/entt.hpp>
#include "gridgeom/components/token.hpp"
#include "gridgeom/core/grid_preset_manager.hpp"
#include "gridgeom/grid/square_grid.hpp"
#include "gridgeom/systems/movement_measure.hpp"

using namespace Systems;

class MovementMeasureSystemTest : public ::testing::Test {
protected:
    entt::registry registry;
    GridGeom::SquareGrid grid{GridPresetManager::configFor(GridPreset::SQUARE_5FT)};
    GridGeom::GridMeasurer measurer{grid};

    static GridGeom::Position cell(int j, int i, int k = 0) {
        return {(j + 0.5) * 100.0, (i + 0.5) * 100.0, k * 100.0};
    }

    // Helper to create a token with planned waypoints
    entt::entity createToken(const GridGeom::Position& start, std::vector<GridGeom::Position> waypoints) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, start);
        registry.emplace<Components::Waypoints>(entity, std::move(waypoints));
        return entity;
    }
};

TEST_F(MovementMeasureSystemTest, MeasuresPlannedMovement) {
    auto token = createToken(cell(0, 0), {cell(3, 4)});
    MovementMeasureSystem::update(registry, measurer);

    ASSERT_TRUE(registry.all_of<Components::MovementMeasurement>(token));
    const auto& m = registry.get<Components::MovementMeasurement>(token);
    EXPECT_DOUBLE_EQ(m.distance, 20.0);
    EXPECT_DOUBLE_EQ(m.offsetCost, 20.0);
    EXPECT_EQ(m.diagonals, 3);

    const auto& path = registry.get<Components::PlannedPath>(token);
    ASSERT_EQ(path.cells.size(), 5u);
    EXPECT_EQ(path.cells.front(), cell(0, 0));
    EXPECT_EQ(path.cells.back(), cell(3, 4));
}

TEST_F(MovementMeasureSystemTest, MultiSegmentPathHasNoDuplicateCells) {
    auto token = createToken(cell(0, 0), {cell(2, 0), cell(2, 3)});
    MovementMeasureSystem::update(registry, measurer);

    const auto& path = registry.get<Components::PlannedPath>(token);
    ASSERT_EQ(path.cells.size(), 6u);
    for (std::size_t i = 1; i < path.cells.size(); ++i) {
        EXPECT_NE(path.cells[i - 1], path.cells[i]);
    }
    EXPECT_DOUBLE_EQ(registry.get<Components::MovementMeasurement>(token).distance, 25.0);
}

TEST_F(MovementMeasureSystemTest, RuleOverride) {
    auto token = createToken(cell(0, 0), {cell(1, 1), cell(2, 2)});
    registry.emplace<Components::MovementRule>(token, GridGeom::DiagonalRule::ALTERNATING_1);
    MovementMeasureSystem::update(registry, measurer);

    const auto& m = registry.get<Components::MovementMeasurement>(token);
    EXPECT_DOUBLE_EQ(m.distance, 15.0);
    EXPECT_EQ(m.diagonals, 2);
}

TEST_F(MovementMeasureSystemTest, RuleOverrideAppliesOnlyToItsToken) {
    auto plain = createToken(cell(0, 0), {cell(3, 4)});
    auto exact = createToken(cell(0, 0), {cell(3, 4)});
    registry.emplace<Components::MovementRule>(exact, GridGeom::DiagonalRule::EXACT);
    MovementMeasureSystem::update(registry, measurer);

    EXPECT_DOUBLE_EQ(registry.get<Components::MovementMeasurement>(plain).distance, 20.0);
    EXPECT_NEAR(registry.get<Components::MovementMeasurement>(exact).distance, 26.2132034, 1e-6);
}

TEST_F(MovementMeasureSystemTest, NoWaypointsMeasuresZero) {
    auto token = createToken({130.0, 260.0}, {});
    MovementMeasureSystem::update(registry, measurer);

    const auto& m = registry.get<Components::MovementMeasurement>(token);
    EXPECT_DOUBLE_EQ(m.distance, 0.0);
    const auto& path = registry.get<Components::PlannedPath>(token);
    ASSERT_EQ(path.cells.size(), 1u);
    EXPECT_EQ(path.cells[0], GridGeom::Position(150.0, 250.0, 0.0));
}

TEST_F(MovementMeasureSystemTest, RemeasureReplacesResults) {
    auto token = createToken(cell(0, 0), {cell(3, 0)});
    MovementMeasureSystem::update(registry, measurer);
    EXPECT_DOUBLE_EQ(registry.get<Components::MovementMeasurement>(token).distance, 15.0);

    registry.get<Components::Waypoints>(token).points.pop_back();
    MovementMeasureSystem::update(registry, measurer);
    EXPECT_DOUBLE_EQ(registry.get<Components::MovementMeasurement>(token).distance, 0.0);
    EXPECT_EQ(registry.get<Components::PlannedPath>(token).cells.size(), 1u);
}

TEST_F(MovementMeasureSystemTest, WithinSpeed) {
    auto slow = createToken(cell(0, 0), {cell(7, 0)});
    auto fast = createToken(cell(0, 1), {cell(6, 1)});
    auto unlimited = createToken(cell(0, 2), {cell(1, 2)});
    registry.emplace<Components::Speed>(slow, 30.0);
    registry.emplace<Components::Speed>(fast, 30.0);
    MovementMeasureSystem::update(registry, measurer);

    EXPECT_FALSE(MovementMeasureSystem::withinSpeed(registry, slow));
    EXPECT_TRUE(MovementMeasureSystem::withinSpeed(registry, fast));
    EXPECT_FALSE(MovementMeasureSystem::withinSpeed(registry, unlimited));
}

TEST_F(MovementMeasureSystemTest, SkipsEntitiesWithoutWaypoints) {
    auto scenery = registry.create();
    registry.emplace<Components::Position>(scenery, cell(1, 1));
    MovementMeasureSystem::update(registry, measurer);
    EXPECT_FALSE(registry.all_of<Components::MovementMeasurement>(scenery));
}
