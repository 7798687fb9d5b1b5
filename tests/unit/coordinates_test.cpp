#include <gtest/gtest.h>
#include <stdexcept>
#include "gridgeom/core/coordinates.hpp"

using namespace GridGeom;

class CoordinatesTest : public ::testing::Test {
protected:
    GridConfig cfg;
    void SetUp() override {
        cfg.size = 100.0;
        cfg.distance = 5.0;
    }
};

TEST_F(CoordinatesTest, PixelGridUnitConversion) {
    Coordinates coords(cfg);
    EXPECT_DOUBLE_EQ(coords.pixelsToGridUnits(100.0), 5.0);
    EXPECT_DOUBLE_EQ(coords.pixelsToGridUnits(250.0), 12.5);
    EXPECT_DOUBLE_EQ(coords.gridUnitsToPixels(5.0), 100.0);
    EXPECT_DOUBLE_EQ(coords.gridUnitsToPixels(coords.pixelsToGridUnits(37.0)), 37.0);
}

TEST_F(CoordinatesTest, ElevationSteps) {
    Coordinates coords(cfg);
    EXPECT_EQ(coords.unitElevation(10.0), 2);
    EXPECT_EQ(coords.unitElevation(-5.0), -1);
    EXPECT_DOUBLE_EQ(coords.elevationForUnit(3), 15.0);

    // z in pixels rounds to the nearest layer
    EXPECT_EQ(coords.zToUnit(140.0), 1);
    EXPECT_EQ(coords.zToUnit(160.0), 2);
    EXPECT_DOUBLE_EQ(coords.unitToZ(2), 200.0);
}

TEST_F(CoordinatesTest, UpdateConfig) {
    Coordinates coords(cfg);
    GridConfig metric = cfg;
    metric.size = 50.0;
    metric.distance = 1.5;
    coords.updateConfig(metric);

    EXPECT_DOUBLE_EQ(coords.getSize(), 50.0);
    EXPECT_DOUBLE_EQ(coords.getDistance(), 1.5);
    EXPECT_DOUBLE_EQ(coords.pixelsToGridUnits(100.0), 3.0);
}

TEST_F(CoordinatesTest, RejectsInvalidConfig) {
    GridConfig bad = cfg;
    bad.size = 0.0;
    EXPECT_THROW(Coordinates{bad}, std::invalid_argument);

    bad = cfg;
    bad.distance = -5.0;
    EXPECT_THROW(Coordinates{bad}, std::invalid_argument);

    bad = cfg;
    bad.diagonals = static_cast<DiagonalRule>(42);
    EXPECT_THROW(validateGridConfig(bad), std::invalid_argument);

    Coordinates coords(cfg);
    bad = cfg;
    bad.size = -1.0;
    EXPECT_THROW(coords.updateConfig(bad), std::invalid_argument);
    EXPECT_DOUBLE_EQ(coords.getSize(), 100.0);
}
