#include <gtest/gtest.h>

#include "io/output.hpp"
#include "io/tree_loader.hpp"
#include "solver/navigator.hpp"
#include "solver/node.hpp"
#include "solver/tree.hpp"
#include "util/result.hpp"

#include "test_trees.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {
static constexpr float Epsilon = 1e-5f;

const ActionNode& getActionNodeAt(const StrategyTree& tree, const std::vector<std::string>& labels) {
    std::optional<std::size_t> nodeIndex = navigateTree(tree, labels);
    EXPECT_TRUE(nodeIndex.has_value());
    return tree.getNode(nodeIndex.value_or(tree.getRootNodeIndex())).getActionNode();
}
} // namespace

TEST(NodeSummaryTest, SummarizesRootNode) {
    StrategyTree tree = buildStrategyTreeFromString(getTestTreeJSON()).getValue();

    Result<nlohmann::ordered_json> summaryResult = buildNodeSummaryJSON(tree.getRootNode().getActionNode());
    ASSERT_TRUE(summaryResult.isValue()) << summaryResult.getError();

    const nlohmann::ordered_json& summary = summaryResult.getValue();
    EXPECT_EQ(summary["Player"], "oop");
    EXPECT_EQ(summary["Actions"], nlohmann::ordered_json::array({ "CHECK", "BET 50" }));
    EXPECT_NEAR(summary["Range Frequencies"]["CHECK"].get<float>(), (0.8f + 0.8f + 0.1f) / 3.0f, Epsilon);

    const nlohmann::ordered_json& cells = summary["Cells"];
    EXPECT_EQ(cells.size(), 2);
    EXPECT_EQ(cells["AKs"]["Dominant Action"], "CHECK");
    EXPECT_EQ(cells["AKs"]["Combos"], 2);
    EXPECT_EQ(cells["72o"]["Dominant Action"], "BET 50");
    EXPECT_NEAR(cells["72o"]["Frequencies"]["BET 50"].get<float>(), 0.9f, Epsilon);
}

TEST(NodeSummaryTest, IncludesImplicitFold) {
    StrategyTree tree = buildStrategyTreeFromString(getTestTreeJSON()).getValue();
    const ActionNode& node = getActionNodeAt(tree, { "BET 50" });

    Result<nlohmann::ordered_json> summaryResult = buildNodeSummaryJSON(node);
    ASSERT_TRUE(summaryResult.isValue()) << summaryResult.getError();
    EXPECT_EQ(summaryResult.getValue()["Actions"], nlohmann::ordered_json::array({ "FOLD", "CALL", "RAISE 150" }));
    EXPECT_EQ(summaryResult.getValue()["Cells"]["QQ"]["Dominant Action"], "CALL");
}

TEST(NodeSummaryTest, InconsistentNodeIsAnError) {
    ActionNode node;
    node.children = { { "CHECK", 0 } };
    node.strategy.setComboFrequencies("AhKh", { 0.2f, 0.3f, 0.5f });

    EXPECT_TRUE(buildNodeSummaryJSON(node).isError());
    EXPECT_TRUE(outputNodeSummaryToJSON(node, "unused.json").isError());
}

TEST(NodeSummaryTest, WritesFile) {
    StrategyTree tree = buildStrategyTreeFromString(getTestTreeJSON()).getValue();
    std::filesystem::path filePath = std::filesystem::temp_directory_path() / "gto_trainer_node_summary_test.json";

    Result<void> outputResult = outputNodeSummaryToJSON(tree.getRootNode().getActionNode(), filePath.string());
    ASSERT_TRUE(outputResult.isValue()) << outputResult.getError();

    std::ifstream file(filePath);
    ASSERT_TRUE(file.is_open());
    nlohmann::ordered_json written = nlohmann::ordered_json::parse(file);
    EXPECT_EQ(written, buildNodeSummaryJSON(tree.getRootNode().getActionNode()).getValue());

    file.close();
    std::filesystem::remove(filePath);
}
