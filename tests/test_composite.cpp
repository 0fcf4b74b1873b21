#include <gtest/gtest.h>

#include "validation/composite.hpp"

using namespace trialbench;

TEST(CompositeTest, WeightedSumOfAllAxes) {
    result::Scores scores;
    scores.tests = 0.8;
    scores.static_analysis = 1.0;
    scores.rubric = 0.6;
    EXPECT_NEAR(validation::CompositeScore(scores, {0.5, 0.2, 0.3}), 0.78, 1e-9);
}

TEST(CompositeTest, ZeroWeightsFallBackToDefaults) {
    result::Scores scores;
    scores.tests = 0.8;
    scores.static_analysis = 1.0;
    scores.rubric = 0.6;
    EXPECT_NEAR(validation::CompositeScore(scores, {}), 0.78, 1e-9);
}

TEST(CompositeTest, MissingAxisIsRenormalised) {
    result::Scores scores;
    scores.tests = 0.8;
    scores.static_analysis = 1.0;
    // Rubric absent: (0.5 * 0.8 + 0.2 * 1.0) / 0.7
    EXPECT_NEAR(validation::CompositeScore(scores, {0.5, 0.2, 0.3}), 0.6 / 0.7, 1e-9);
}

TEST(CompositeTest, NoAxesGivesZero) {
    EXPECT_DOUBLE_EQ(validation::CompositeScore(result::Scores{}, {0.5, 0.2, 0.3}), 0.0);
}

TEST(CompositeTest, PresentZeroScoreStillCounts) {
    result::Scores scores;
    scores.tests = 0.0;
    scores.rubric = 1.0;
    EXPECT_NEAR(validation::CompositeScore(scores, {0.5, 0.2, 0.3}), 0.3 / 0.8, 1e-9);
}

TEST(CompositeTest, GreenfieldUsesBuildLintFromStaticAnalysis) {
    result::Scores scores;
    scores.rubric = 1.0;
    scores.hidden_tests = 0.5;
    scores.agent_tests = 1.0;
    scores.static_analysis = 0.0;
    scores.code_metrics = 1.0;
    const double expected = 0.3 * 1.0 + 0.3 * 0.5 + 0.15 * 1.0 + 0.15 * 0.0 + 0.1 * 1.0;
    EXPECT_NEAR(validation::GreenfieldCompositeScore(scores, {}), expected, 1e-9);
}

TEST(CompositeTest, GreenfieldIgnoresStandardTestsAxis) {
    result::Scores scores;
    scores.tests = 0.0;
    scores.hidden_tests = 1.0;
    EXPECT_DOUBLE_EQ(validation::GreenfieldCompositeScore(scores, {}), 1.0);
}
