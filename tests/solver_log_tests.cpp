#include <gtest/gtest.h>

#include "io/solver_log.hpp"

#include <string>
#include <vector>

TEST(SolverLogTest, PointsUseLatestIteration) {
    std::vector<std::string> lines = {
        "<<<START SOLVING>>>",
        "Iter: 0",
        "Total exploitability 84.2315 precent",
        "-------------------",
        "Iter: 10",
        "time used: 1.2",
        "Total exploitability 3.5e-1 precent",
        "Iter: 20",
        "total EXPLOITABILITY 0.12 PRECENT",
    };

    std::vector<ExploitabilityPoint> points = parseExploitability(lines);
    std::vector<ExploitabilityPoint> expected = {
        { 0, 84.2315f },
        { 10, 0.35f },
        { 20, 0.12f },
    };
    EXPECT_EQ(points, expected);
}

TEST(SolverLogTest, PointBeforeAnyIterationUsesZero) {
    std::vector<ExploitabilityPoint> points = parseExploitability({ "Total exploitability 12.5 precent" });
    ASSERT_EQ(points.size(), 1);
    EXPECT_EQ(points[0].iteration, 0);
}

TEST(SolverLogTest, UnrelatedAndMalformedLinesAreIgnored) {
    std::vector<std::string> lines = {
        "",
        "Iter:",
        "Total exploitability precent",
        "Total exploitability -- precent",
        "Total exploitability 1.5 percent",
        "Iteration: 10",
    };

    EXPECT_TRUE(parseExploitability(lines).empty());
    EXPECT_TRUE(parseExploitability({}).empty());
}

TEST(SolverLogTest, IterationLinesNeverEmitPoints) {
    std::vector<std::string> lines = {
        "Iter: 5 Total exploitability 9.5 precent",
        "Total exploitability 2.5 precent",
    };

    std::vector<ExploitabilityPoint> points = parseExploitability(lines);
    std::vector<ExploitabilityPoint> expected = { { 5, 2.5f } };
    EXPECT_EQ(points, expected);
}

TEST(SolverLogTest, MissingFileIsAnError) {
    EXPECT_TRUE(parseExploitabilityFromFile("this/file/does/not/exist.log").isError());
}
