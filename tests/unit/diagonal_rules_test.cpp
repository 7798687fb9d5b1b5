#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "gridgeom/core/constants.hpp"
#include "gridgeom/measure/diagonal_rules.hpp"

using namespace GridGeom;

TEST(DiagonalRulesTest, SortAxesOrdersDescending) {
    SortedAxes s = sortAxes(1.0, 3.0, 2.0);
    EXPECT_DOUBLE_EQ(s.maxAxis, 3.0);
    EXPECT_DOUBLE_EQ(s.midAxis, 2.0);
    EXPECT_DOUBLE_EQ(s.minAxis, 1.0);

    s = sortAxes(0.0, 5.0);
    EXPECT_DOUBLE_EQ(s.maxAxis, 5.0);
    EXPECT_DOUBLE_EQ(s.midAxis, 0.0);
    EXPECT_DOUBLE_EQ(s.minAxis, 0.0);
}

TEST(DiagonalRulesTest, SingleStepWeights) {
    // Straight step
    for (auto rule : GridConstants::getAllDiagonalRules()) {
        EXPECT_DOUBLE_EQ(ruleDistance(rule, 1.0), 1.0) << GridConstants::getDiagonalRuleName(rule);
    }

    // Planar diagonal
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EQUIDISTANT, 1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EXACT, 1.0, 1.0), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EUCLIDEAN, 1.0, 1.0), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::APPROXIMATE, 1.0, 1.0), 1.5);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::RECTILINEAR, 1.0, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::ILLEGAL, 1.0, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::ALTERNATING_1, 1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::ALTERNATING_2, 1.0, 1.0), 2.0);

    // 3D diagonal
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EQUIDISTANT, 1.0, 1.0, 1.0), 1.0);
    EXPECT_NEAR(ruleDistance(DiagonalRule::EXACT, 1.0, 1.0, 1.0), std::sqrt(3.0), 1e-12);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::APPROXIMATE, 1.0, 1.0, 1.0), 1.75);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::RECTILINEAR, 1.0, 1.0, 1.0), 3.0);
}

TEST(DiagonalRulesTest, MultiCellDistances) {
    // 4 cells along one axis, 3 along the other
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EQUIDISTANT, 4.0, 3.0), 4.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EXACT, 4.0, 3.0), 4.0 + (std::sqrt(2.0) - 1.0) * 3.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::EUCLIDEAN, 4.0, 3.0), 5.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::APPROXIMATE, 4.0, 3.0), 5.5);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::RECTILINEAR, 4.0, 3.0), 7.0);

    // One straight plus three diagonals: 1 + (1 + 2 + 1), or 1 + (2 + 1 + 2)
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::ALTERNATING_1, 4.0, 3.0), 5.0);
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::ALTERNATING_2, 4.0, 3.0), 6.0);
}

TEST(DiagonalRulesTest, SortedAxesOverload) {
    EXPECT_DOUBLE_EQ(ruleDistance(DiagonalRule::APPROXIMATE, sortAxes(1.0, 4.0, 2.0)),
                     approxGridDistance(4.0, 2.0, 1.0));
}

TEST(DiagonalRulesTest, UnknownRuleThrows) {
    EXPECT_THROW(ruleDistance(static_cast<DiagonalRule>(99), 1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(GridConstants::getDiagonalRuleName(static_cast<DiagonalRule>(99)), std::invalid_argument);
}

TEST(DiagonalRulesTest, RuleCatalog) {
    auto rules = GridConstants::getAllDiagonalRules();
    ASSERT_EQ(rules.size(), 8u);
    EXPECT_EQ(GridConstants::getDiagonalRuleName(rules.front()), "EQUIDISTANT");
    EXPECT_EQ(GridConstants::getDiagonalRuleName(rules.back()), "EUCLIDEAN");
    EXPECT_TRUE(GridConstants::isAlternating(DiagonalRule::ALTERNATING_1));
    EXPECT_TRUE(GridConstants::isAlternating(DiagonalRule::ALTERNATING_2));
    EXPECT_FALSE(GridConstants::isAlternating(DiagonalRule::EXACT));
}
