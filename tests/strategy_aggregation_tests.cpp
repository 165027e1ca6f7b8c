#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/hand_matrix.hpp"
#include "solver/node.hpp"
#include "solver/strategy.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
static constexpr float Epsilon = 1e-5f;

SolverStrategy buildStrategy(const std::vector<std::pair<std::string, std::vector<float>>>& combos) {
    SolverStrategy strategy;
    for (const auto& [combo, frequencies] : combos) {
        strategy.setComboFrequencies(combo, frequencies);
    }
    return strategy;
}

ActionNode buildActionNode(const std::vector<std::string>& childLabels, const SolverStrategy& strategy) {
    ActionNode node;
    for (std::size_t i = 0; i < childLabels.size(); ++i) {
        node.children.push_back({ childLabels[i], i + 1 });
    }
    node.strategy = strategy;
    return node;
}
} // namespace

TEST(ActionEntriesTest, OneToOneMapping) {
    ActionNode node = buildActionNode({ "BET 50", "CHECK" }, buildStrategy({ { "AhKh", { 0.25f, 0.75f } } }));

    Result<std::vector<ActionEntry>> entries = getActionEntries(node);
    ASSERT_TRUE(entries.isValue());
    std::vector<ActionEntry> expected = { { "BET 50", 0 }, { "CHECK", 1 } };
    EXPECT_EQ(entries.getValue(), expected);
}

TEST(ActionEntriesTest, ImplicitFoldAtIndexZero) {
    ActionNode node = buildActionNode({ "CALL", "RAISE 100" }, buildStrategy({ { "AhKh", { 0.1f, 0.6f, 0.3f } } }));

    Result<std::vector<ActionEntry>> entries = getActionEntries(node);
    ASSERT_TRUE(entries.isValue());
    std::vector<ActionEntry> expected = { { "FOLD", 0 }, { "CALL", 1 }, { "RAISE 100", 2 } };
    EXPECT_EQ(entries.getValue(), expected);
}

TEST(ActionEntriesTest, EmptyStrategyMapsChildrenDirectly) {
    ActionNode node = buildActionNode({ "CHECK", "BET 100" }, SolverStrategy{});

    Result<std::vector<ActionEntry>> entries = getActionEntries(node);
    ASSERT_TRUE(entries.isValue());
    std::vector<ActionEntry> expected = { { "CHECK", 0 }, { "BET 100", 1 } };
    EXPECT_EQ(entries.getValue(), expected);
}

TEST(ActionEntriesTest, OtherLengthsAreDataErrors) {
    ActionNode tooLong = buildActionNode({ "CHECK", "BET 100" }, buildStrategy({ { "AhKh", { 0.1f, 0.2f, 0.3f, 0.4f } } }));
    EXPECT_TRUE(getActionEntries(tooLong).isError());

    ActionNode tooShort = buildActionNode({ "CHECK", "BET 50", "BET 100" }, buildStrategy({ { "AhKh", { 1.0f } } }));
    EXPECT_TRUE(getActionEntries(tooShort).isError());
}

TEST(AggregationTest, UniformStrategyAggregates) {
    SolverStrategy strategy = buildStrategy({
        { "AhKh", { 0.7f, 0.3f } },
        { "AdKd", { 0.7f, 0.3f } },
        { "QsQh", { 0.7f, 0.3f } },
        { "7c2d", { 0.7f, 0.3f } },
    });
    ActionNode node = buildActionNode({ "BET", "CHECK" }, strategy);
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    std::vector<ActionAggregate> aggregates = aggregateActions(node, entries);
    ASSERT_EQ(aggregates.size(), 2);
    EXPECT_EQ(aggregates[0].name, "BET");
    EXPECT_NEAR(aggregates[0].frequency, 0.7f, Epsilon);
    EXPECT_EQ(aggregates[1].name, "CHECK");
    EXPECT_NEAR(aggregates[1].frequency, 0.3f, Epsilon);

    StrategyGrid grid = aggregateCells(strategy, 2);
    int populatedCells = 0;
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            if (grid[row][col]) {
                ++populatedCells;
                EXPECT_EQ(grid[row][col]->dominantActionIndex, 0);
            }
        }
    }
    EXPECT_EQ(populatedCells, 3);

    ASSERT_TRUE(grid[0][1].has_value());
    EXPECT_EQ(grid[0][1]->comboCount, 2);
    EXPECT_FALSE(grid[0][0].has_value());
}

TEST(AggregationTest, CellAveragesAndTieBreaking) {
    SolverStrategy strategy = buildStrategy({
        { "AhKh", { 0.2f, 0.8f } },
        { "AdKd", { 0.8f, 0.2f } },
        { "AsKh", { 0.0f, 1.0f } },
    });

    StrategyGrid grid = aggregateCells(strategy, 2);

    ASSERT_TRUE(grid[0][1].has_value());
    EXPECT_NEAR(grid[0][1]->frequencies[0], 0.5f, Epsilon);
    EXPECT_NEAR(grid[0][1]->frequencies[1], 0.5f, Epsilon);
    EXPECT_EQ(grid[0][1]->dominantActionIndex, 0);

    ASSERT_TRUE(grid[1][0].has_value());
    EXPECT_EQ(grid[1][0]->dominantActionIndex, 1);
    EXPECT_EQ(grid[1][0]->comboCount, 1);
}

TEST(AggregationTest, InconsistentAndUnmappableCombosAreSkipped) {
    SolverStrategy strategy = buildStrategy({
        { "AhKh", { 1.0f, 0.0f } },
        { "AdKd", { 0.0f, 0.0f, 1.0f } },
        { "XxYy", { 0.0f, 1.0f } },
    });
    ActionNode node = buildActionNode({ "BET", "CHECK" }, strategy);
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    std::vector<ActionAggregate> aggregates = aggregateActions(node, entries);
    EXPECT_NEAR(aggregates[0].frequency, 0.5f, Epsilon);
    EXPECT_NEAR(aggregates[1].frequency, 0.5f, Epsilon);

    StrategyGrid grid = aggregateCells(strategy, 2);
    ASSERT_TRUE(grid[0][1].has_value());
    EXPECT_EQ(grid[0][1]->comboCount, 1);
    EXPECT_NEAR(grid[0][1]->frequencies[0], 1.0f, Epsilon);
}

TEST(AggregationTest, EmptyStrategyAggregatesToZero) {
    ActionNode node = buildActionNode({ "CHECK", "BET" }, SolverStrategy{});
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    for (const ActionAggregate& aggregate : aggregateActions(node, entries)) {
        EXPECT_EQ(aggregate.frequency, 0.0f);
    }

    StrategyGrid grid = aggregateCells(SolverStrategy{}, 2);
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            EXPECT_FALSE(grid[row][col].has_value());
        }
    }
}

TEST(CombosForCellTest, OnlyPresentCombosAreReturned) {
    SolverStrategy strategy = buildStrategy({
        { "AhKh", { 0.2f, 0.8f } },
        { "AdKd", { 0.8f, 0.2f } },
        { "AsKh", { 0.0f, 1.0f } },
    });

    std::vector<ComboDetail> suited = combosForCell(strategy, 0, 1);
    ASSERT_EQ(suited.size(), 2);
    EXPECT_EQ(suited[0].combo, "AhKh");
    EXPECT_EQ(suited[1].combo, "AdKd");

    std::vector<ComboDetail> offsuit = combosForCell(strategy, Cell{ 1, 0 });
    ASSERT_EQ(offsuit.size(), 1);
    EXPECT_EQ(offsuit[0].combo, "AsKh");

    EXPECT_TRUE(combosForCell(strategy, 0, 0).empty());
}

TEST(ComboLookupTest, IsomorphicComboIsFound) {
    SolverStrategy strategy = buildStrategy({ { "AhKh", { 0.2f, 0.8f } } });

    EXPECT_EQ(findIsomorphicCombo(strategy, "AhKh"), "AhKh");
    EXPECT_EQ(findIsomorphicCombo(strategy, "AsKs"), "AhKh");
    EXPECT_EQ(findIsomorphicCombo(strategy, "AsKd"), std::nullopt);
    EXPECT_EQ(findIsomorphicCombo(strategy, "QsQh"), std::nullopt);
}

TEST(ComboLookupTest, AbsentComboIsNeverSynthesized) {
    ActionNode node = buildActionNode({ "BET", "CHECK" }, buildStrategy({ { "AhKh", { 0.2f, 0.8f } } }));
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    EXPECT_EQ(findComboActionFrequency(node, entries, "QsQh", "BET"), std::nullopt);
    EXPECT_EQ(findComboActionFrequency(node, entries, "AhKh", "RAISE"), std::nullopt);

    std::optional<float> frequency = findComboActionFrequency(node, entries, "AhKh", "CHECK");
    ASSERT_TRUE(frequency.has_value());
    EXPECT_NEAR(*frequency, 0.8f, Epsilon);
}

TEST(DecisionFrequencyTest, FallbackOrder) {
    ActionNode node = buildActionNode({ "CALL", "RAISE" }, buildStrategy({
        { "AhKh", { 0.0f, 0.25f, 0.75f } },
        { "7c2d", { 1.0f, 0.0f, 0.0f } },
    }));
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    // Exact and isomorphic combos use their own frequency
    EXPECT_NEAR(getDecisionFrequency(node, entries, "AhKh", "RAISE"), 0.75f, Epsilon);
    EXPECT_NEAR(getDecisionFrequency(node, entries, "AcKc", "CALL"), 0.25f, Epsilon);

    // Missing combos use the range-wide frequency
    EXPECT_NEAR(getDecisionFrequency(node, entries, "QsQh", "FOLD"), 0.5f, Epsilon);

    // Unknown actions score nothing
    EXPECT_EQ(getDecisionFrequency(node, entries, "AhKh", "BET"), 0.0f);

    ActionNode unsolved = buildActionNode({ "CHECK", "BET 50", "BET 100", "ALLIN" }, SolverStrategy{});
    std::vector<ActionEntry> unsolvedEntries = getActionEntries(unsolved).getValue();
    EXPECT_NEAR(getDecisionFrequency(unsolved, unsolvedEntries, "AhKh", "CHECK"), 0.25f, Epsilon);
}

TEST(DecisionFrequencyTest, ComboActionFrequenciesFollowEntries) {
    ActionNode node = buildActionNode({ "CALL", "RAISE" }, buildStrategy({ { "AhKh", { 0.1f, 0.2f, 0.7f } } }));
    std::vector<ActionEntry> entries = getActionEntries(node).getValue();

    std::vector<ActionAggregate> frequencies = getComboActionFrequencies(node, entries, "AhKh");
    ASSERT_EQ(frequencies.size(), 3);
    EXPECT_EQ(frequencies[0].name, "FOLD");
    EXPECT_NEAR(frequencies[0].frequency, 0.1f, Epsilon);
    EXPECT_EQ(frequencies[2].name, "RAISE");
    EXPECT_EQ(frequencies[2].index, 2);
    EXPECT_NEAR(frequencies[2].frequency, 0.7f, Epsilon);
}
