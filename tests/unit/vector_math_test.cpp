#include <gtest/gtest.h>
#include <cmath>
#include "gridgeom/core/constants.hpp"
#include "gridgeom/math/vector_math.hpp"

using namespace GridGeom;

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);
    EXPECT_DOUBLE_EQ(v1.z, 0.0);

    Vector v2(3.0, 4.0);  // Elevation defaults to zero
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
    EXPECT_DOUBLE_EQ(v2.z, 0.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0, 3.0);
    Vector v2(3.0, 4.0, 5.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);
    EXPECT_DOUBLE_EQ(result.z, 8.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);
    EXPECT_DOUBLE_EQ(v1.z, 8.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.z, 3.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0, -1.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);
    EXPECT_DOUBLE_EQ(mult_result.z, -2.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -2.0);
    EXPECT_DOUBLE_EQ(neg.z, 1.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(Vector(2.0, 3.0, 6.0).length(), 7.0);

    Vector a = Vector(-1.0, 2.0, -3.0).abs();
    EXPECT_DOUBLE_EQ(a.x, 1.0);
    EXPECT_DOUBLE_EQ(a.y, 2.0);
    EXPECT_DOUBLE_EQ(a.z, 3.0);

    EXPECT_DOUBLE_EQ(v.normalized().length(), 1.0);

    // Zero vector normalizes to a default direction
    Vector n = Vector().normalized();
    EXPECT_DOUBLE_EQ(n.x, 1.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
}

TEST(VectorMathTest, Dot) {
    Vector v1(1.0, 2.0, 3.0);
    Vector v2(4.0, 5.0, 6.0);
    EXPECT_DOUBLE_EQ(dot(v1, v2), 32.0);
    EXPECT_DOUBLE_EQ(dot(Vector(1.0, 0.0), Vector(0.0, 1.0)), 0.0);
    EXPECT_DOUBLE_EQ(std::sqrt(dot(v1, v1)), v1.length());
}

TEST(VectorMathTest, RotateByAngle) {
    Vector rotated = rotateByAngle(Vector(1.0, 0.0, 2.0), GridConstants::Pi / 2);
    EXPECT_NEAR(rotated.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated.y, 1.0, EPSILON);
    EXPECT_DOUBLE_EQ(rotated.z, 2.0);  // Elevation is untouched
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0, 1.0);

    Vector d = p2 - p1;
    EXPECT_DOUBLE_EQ(d.x, 2.0);
    EXPECT_DOUBLE_EQ(d.y, 2.0);
    EXPECT_DOUBLE_EQ(d.z, 1.0);

    Position p3 = p1 + d;
    EXPECT_EQ(p3, p2);

    p1 += Vector(1.0, 1.0);
    EXPECT_DOUBLE_EQ(p1.x, 2.0);
    EXPECT_DOUBLE_EQ(p1.y, 3.0);

    EXPECT_DOUBLE_EQ(distanceBetween(Position(0, 0), Position(3, 4)), 5.0);
    EXPECT_DOUBLE_EQ(distanceBetween(Position(0, 0, 0), Position(2, 3, 6)), 7.0);

    Position flat = p2.to2d();
    EXPECT_DOUBLE_EQ(flat.z, 0.0);
    EXPECT_DOUBLE_EQ(flat.x, 3.0);
}

TEST(VectorMathTest, PositionEquality) {
    EXPECT_EQ(Position(1.0, 2.0), Position(1.0, 2.0, 0.0));
    EXPECT_NE(Position(1.0, 2.0), Position(1.0, 2.1));
    EXPECT_NE(Position(1.0, 2.0, 0.0), Position(1.0, 2.0, 1.0));
    EXPECT_TRUE(nearlyEqual(0.1 + 0.2, 0.3));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0, 3.0);
    Vector v = static_cast<Vector>(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);
    EXPECT_DOUBLE_EQ(v.z, 3.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}
