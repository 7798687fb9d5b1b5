#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "gridgeom/core/grid_preset_manager.hpp"
#include "gridgeom/grid/hex_grid.hpp"
#include "gridgeom/grid/square_grid.hpp"

using namespace GridGeom;

TEST(SquareGridTest, WorldToOffset) {
    SquareGrid grid(GridPresetManager::configFor(GridPreset::SQUARE_5FT));
    GridOffset3d o = grid.worldToOffset({130.0, 260.0, 0.0});
    EXPECT_EQ(o.i, 2);
    EXPECT_EQ(o.j, 1);
    EXPECT_EQ(o.k, 0);

    GridOffset3d neg = grid.worldToOffset({-10.0, -110.0, -100.0});
    EXPECT_EQ(neg.i, -2);
    EXPECT_EQ(neg.j, -1);
    EXPECT_EQ(neg.k, -1);
}

TEST(SquareGridTest, OffsetToWorldCenter) {
    SquareGrid grid(GridPresetManager::configFor(GridPreset::SQUARE_5FT));
    Position c = grid.offsetToWorldCenter({2, 1, 3});
    EXPECT_DOUBLE_EQ(c.x, 150.0);
    EXPECT_DOUBLE_EQ(c.y, 250.0);
    EXPECT_DOUBLE_EQ(c.z, 300.0);
    EXPECT_EQ(grid.worldToOffset(c), (GridOffset3d{2, 1, 3}));
}

TEST(SquareGridTest, CubeMethodsThrow) {
    SquareGrid grid(GridPresetManager::configFor(GridPreset::SQUARE_5FT));
    EXPECT_THROW(grid.worldToCube({0.0, 0.0}), std::logic_error);
    EXPECT_THROW(grid.cubeToWorld({0, 0, 0}), std::logic_error);
    EXPECT_FALSE(grid.isHexagonal());
    EXPECT_FALSE(grid.isGridless());
}

TEST(SquareGridTest, GridlessReportsItsType) {
    GridlessGrid grid(GridPresetManager::configFor(GridPreset::GRIDLESS));
    EXPECT_EQ(grid.gridType(), GridType::GRIDLESS);
    EXPECT_TRUE(grid.isGridless());
    EXPECT_DOUBLE_EQ(grid.cellSize(), 100.0);
    EXPECT_DOUBLE_EQ(grid.distancePerCell(), 5.0);
}

TEST(HexGridTest, NeighbourCentresAreOneCellApart) {
    for (auto preset : {GridPreset::HEX_ROWS_5FT, GridPreset::HEX_COLUMNS_5FT}) {
        HexGrid grid(GridPresetManager::configFor(preset));
        Position origin = grid.cubeToWorld({0, 0, 0});
        const HexCube neighbours[] = {{1, 0, -1}, {1, -1, 0}, {0, -1, 1}, {-1, 0, 1}, {-1, 1, 0}, {0, 1, -1}};
        for (const auto& n : neighbours) {
            EXPECT_NEAR(distanceBetween(origin, grid.cubeToWorld(n)), 100.0, 1e-9);
        }
    }
}

TEST(HexGridTest, RowAndColumnLayouts) {
    HexGrid rows(GridPresetManager::configFor(GridPreset::HEX_ROWS_5FT));
    Position r = rows.cubeToWorld({1, 0, -1});
    EXPECT_NEAR(r.x, 100.0, 1e-9);
    EXPECT_NEAR(r.y, 0.0, 1e-9);

    HexGrid cols(GridPresetManager::configFor(GridPreset::HEX_COLUMNS_5FT));
    Position c = cols.cubeToWorld({1, 0, -1});
    EXPECT_NEAR(c.x, 50.0 * std::sqrt(3.0), 1e-9);
    EXPECT_NEAR(c.y, 50.0, 1e-9);
    EXPECT_TRUE(cols.columns());
}

TEST(HexGridTest, WorldToCubeRoundTrip) {
    for (auto preset : {GridPreset::HEX_ROWS_5FT, GridPreset::HEX_COLUMNS_5FT}) {
        HexGrid grid(GridPresetManager::configFor(preset));
        for (int q = -3; q <= 3; ++q) {
            for (int r = -3; r <= 3; ++r) {
                HexCube cube{q, r, -q - r};
                EXPECT_EQ(IGridProvider::cubeRound(grid.worldToCube(grid.cubeToWorld(cube))), cube);
            }
        }
    }
}

TEST(HexGridTest, OffsetsHoldAxialCoordinates) {
    HexGrid grid(GridPresetManager::configFor(GridPreset::HEX_ROWS_5FT));
    Position p = grid.cubeToWorld({1, 1, -2});
    p.x += 10.0;
    p.z = 210.0;

    GridOffset3d o = grid.worldToOffset(p);
    EXPECT_EQ(o.i, 1);
    EXPECT_EQ(o.j, 1);
    EXPECT_EQ(o.k, 2);
    EXPECT_EQ(HexGrid::offsetToCube(o), (HexCube{1, 1, -2}));

    Position c = grid.offsetToWorldCenter(o);
    EXPECT_NEAR(c.x, 150.0, 1e-9);
    EXPECT_DOUBLE_EQ(c.z, 200.0);
}

TEST(HexGridTest, CubeRoundKeepsSumZero) {
    FractionalCube f{0.4, 0.4, -0.8};
    HexCube h = IGridProvider::cubeRound(f);
    EXPECT_EQ(h.q + h.r + h.s, 0);
    EXPECT_EQ(h, (HexCube{0, 1, -1}));
}

TEST(HexGridTest, CubeDistance) {
    EXPECT_EQ(IGridProvider::cubeDistance(HexCube{0, 0, 0}, HexCube{2, -1, -1}), 2);
    EXPECT_EQ(IGridProvider::cubeDistance(HexCube{-2, 3, -1}, HexCube{1, 0, -1}), 3);
    EXPECT_DOUBLE_EQ(IGridProvider::cubeDistance(FractionalCube{0.0, 0.0, 0.0}, FractionalCube{0.5, -0.25, -0.25}), 0.5);
}
