#include <gtest/gtest.h>

#include "trainer/grading.hpp"

#include <array>
#include <vector>

static constexpr float Epsilon = 1e-5f;

TEST(GradeDecisionTest, BoundariesIncludeLowerEnd) {
    EXPECT_EQ(gradeDecision(1.0f), DecisionGrade::Best);
    EXPECT_EQ(gradeDecision(0.85f), DecisionGrade::Best);
    EXPECT_EQ(gradeDecision(0.849999f), DecisionGrade::Correct);
    EXPECT_EQ(gradeDecision(0.60f), DecisionGrade::Correct);
    EXPECT_EQ(gradeDecision(0.599999f), DecisionGrade::Inaccuracy);
    EXPECT_EQ(gradeDecision(0.30f), DecisionGrade::Inaccuracy);
    EXPECT_EQ(gradeDecision(0.299999f), DecisionGrade::Wrong);
    EXPECT_EQ(gradeDecision(0.10f), DecisionGrade::Wrong);
    EXPECT_EQ(gradeDecision(0.0999f), DecisionGrade::Blunder);
    EXPECT_EQ(gradeDecision(0.0f), DecisionGrade::Blunder);
}

TEST(GradeDecisionTest, GradeNames) {
    EXPECT_EQ(getGradeName(DecisionGrade::Best), "Best Move");
    EXPECT_EQ(getGradeName(DecisionGrade::Correct), "Correct");
    EXPECT_EQ(getGradeName(DecisionGrade::Inaccuracy), "Inaccuracy");
    EXPECT_EQ(getGradeName(DecisionGrade::Wrong), "Wrong");
    EXPECT_EQ(getGradeName(DecisionGrade::Blunder), "Blunder");
}

TEST(SessionScoreTest, MeanOfFrequencies) {
    EXPECT_EQ(computeSessionScore({}), 0.0f);
    EXPECT_NEAR(computeSessionScore({ 1.0f }), 1.0f, Epsilon);

    // The mean of the frequencies, not of the grades
    EXPECT_NEAR(computeSessionScore({ 0.9f, 0.05f, 0.4f }), 0.45f, Epsilon);
}

TEST(SessionScoreTest, CountGrades) {
    std::array<int, NumDecisionGrades> counts = countGrades({ 0.9f, 0.95f, 0.7f, 0.05f, 0.1f });
    std::array<int, NumDecisionGrades> expected = { 2, 1, 0, 1, 1 };
    EXPECT_EQ(counts, expected);
}

TEST(SpotStatsTest, TracksAverageBestAndWorst) {
    SpotStats stats;
    EXPECT_EQ(stats.getSessionCount(), 0);
    EXPECT_EQ(stats.getAverageScore(), 0.0f);

    stats.addSession(0.5f);
    EXPECT_EQ(stats.getSessionCount(), 1);
    EXPECT_NEAR(stats.getBestScore(), 0.5f, Epsilon);
    EXPECT_NEAR(stats.getWorstScore(), 0.5f, Epsilon);

    stats.addSession(0.9f);
    stats.addSession(0.1f);
    EXPECT_EQ(stats.getSessionCount(), 3);
    EXPECT_NEAR(stats.getAverageScore(), 0.5f, Epsilon);
    EXPECT_NEAR(stats.getBestScore(), 0.9f, Epsilon);
    EXPECT_NEAR(stats.getWorstScore(), 0.1f, Epsilon);
}

TEST(SpotStatsTest, IgnoresHandsWithoutScore) {
    SpotStats stats;
    stats.addSession(0.0f);
    EXPECT_EQ(stats.getSessionCount(), 0);

    stats.addSession(0.8f);
    stats.addSession(0.0f);
    EXPECT_EQ(stats.getSessionCount(), 1);
    EXPECT_NEAR(stats.getAverageScore(), 0.8f, Epsilon);
    EXPECT_NEAR(stats.getBestScore(), 0.8f, Epsilon);
    EXPECT_NEAR(stats.getWorstScore(), 0.8f, Epsilon);
}
