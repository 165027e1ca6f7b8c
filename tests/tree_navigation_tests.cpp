#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "io/tree_loader.hpp"
#include "solver/navigator.hpp"
#include "solver/node.hpp"
#include "solver/tree.hpp"

#include "test_trees.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
class TreeNavigationTest : public ::testing::Test {
protected:
    static inline std::shared_ptr<const StrategyTree> testTree;

    static void SetUpTestSuite() {
        testTree = std::make_shared<const StrategyTree>(buildStrategyTreeFromString(getTestTreeJSON()).getValue());
    }

    static void TearDownTestSuite() {
        testTree.reset();
    }
};

std::shared_ptr<const StrategyTree> buildSingleNodeTree() {
    StrategyTree tree;
    std::size_t rootIndex = tree.addNode(SolverNode{ ActionNode{} });
    tree.setRootNodeIndex(rootIndex);
    return std::make_shared<const StrategyTree>(std::move(tree));
}
} // namespace

TEST_F(TreeNavigationTest, StartsAtRoot) {
    TreeNavigator navigator(testTree);
    EXPECT_EQ(navigator.getDepth(), 0);
    EXPECT_EQ(navigator.getCurrentNodeIndex(), testTree->getRootNodeIndex());
    EXPECT_TRUE(navigator.getPathLabels().empty());
    EXPECT_FALSE(navigator.moveBack());
}

TEST_F(TreeNavigationTest, MovesThroughActionsAndCards) {
    TreeNavigator navigator(testTree);
    EXPECT_TRUE(navigator.moveToChild("CHECK"));
    EXPECT_TRUE(navigator.moveToChild("CHECK"));
    EXPECT_EQ(navigator.getCurrentNode().getNodeType(), NodeType::Chance);

    EXPECT_TRUE(navigator.moveToChild("2c"));
    EXPECT_EQ(navigator.getCurrentNode().getNodeType(), NodeType::Action);
    EXPECT_EQ(navigator.getPathLabels(), (std::vector<std::string>{ "CHECK", "CHECK", "2c" }));
    EXPECT_EQ(navigator.getCurrentNodeIndex(), navigateTree(*testTree, { "CHECK", "CHECK", "2c" }));

    EXPECT_FALSE(navigator.moveToChild("3d"));
    EXPECT_EQ(navigator.getDepth(), 3);
}

TEST_F(TreeNavigationTest, JumpTruncatesPath) {
    TreeNavigator navigator(testTree);
    for (const std::string& label : { "CHECK", "CHECK", "2c", "BET 100" }) {
        ASSERT_TRUE(navigator.moveToChild(label));
    }

    std::size_t chanceIndex = navigator.getPath()[1].nodeIndex;
    EXPECT_TRUE(navigator.jumpTo(2));
    EXPECT_EQ(navigator.getDepth(), 2);
    EXPECT_EQ(navigator.getCurrentNodeIndex(), chanceIndex);

    EXPECT_FALSE(navigator.jumpTo(5));
    EXPECT_EQ(navigator.getDepth(), 2);

    EXPECT_TRUE(navigator.moveBack());
    EXPECT_EQ(navigator.getPathLabels(), (std::vector<std::string>{ "CHECK" }));

    EXPECT_TRUE(navigator.jumpTo(0));
    EXPECT_EQ(navigator.getCurrentNodeIndex(), testTree->getRootNodeIndex());
}

TEST_F(TreeNavigationTest, ResetTreeClearsPath) {
    TreeNavigator navigator(testTree);
    ASSERT_TRUE(navigator.moveToChild("BET 50"));

    std::shared_ptr<const StrategyTree> otherTree = buildSingleNodeTree();
    navigator.resetTree(otherTree);
    EXPECT_EQ(navigator.getDepth(), 0);
    EXPECT_EQ(&navigator.getTree(), otherTree.get());
    EXPECT_EQ(navigator.getCurrentNodeIndex(), 0);
}

TEST_F(TreeNavigationTest, IndependentNavigatorsShareTree) {
    TreeNavigator first(testTree);
    TreeNavigator second(testTree);

    ASSERT_TRUE(first.moveToChild("CHECK"));
    ASSERT_TRUE(second.moveToChild("BET 50"));
    EXPECT_NE(first.getCurrentNodeIndex(), second.getCurrentNodeIndex());
    EXPECT_EQ(first.getSharedTree(), second.getSharedTree());
}

TEST_F(TreeNavigationTest, NavigateTreeFollowsLabels) {
    EXPECT_EQ(navigateTree(*testTree, {}), testTree->getRootNodeIndex());
    EXPECT_TRUE(navigateTree(*testTree, { "BET 50", "RAISE 150" }).has_value());
    EXPECT_EQ(navigateTree(*testTree, { "BET 50", "FOLD" }), std::nullopt);
    EXPECT_EQ(navigateTree(StrategyTree{}, {}), std::nullopt);
}

TEST(NodeChildrenTest, ChanceNodeMergesActionChildren) {
    ChanceNode chanceNode = {
        .dealCards = { { "Ah", 1 }, { "Kd", 2 }, { "CHECK", 3 } },
        .children = { { "CHECK", 7 }, { "BET 50", 8 } },
        .dealNumber = 1
    };

    std::vector<NodeChild> children = nodeChildren(SolverNode{ chanceNode });
    std::vector<NodeChild> expected = { { "Ah", 1 }, { "Kd", 2 }, { "CHECK", 7 }, { "BET 50", 8 } };
    EXPECT_EQ(children, expected);

    EXPECT_EQ(findChild(SolverNode{ chanceNode }, "CHECK"), 7);
    EXPECT_EQ(findChild(SolverNode{ chanceNode }, "Qs"), std::nullopt);
}

TEST(NodeChildrenTest, ActionNodeReturnsChildrenInOrder) {
    ActionNode actionNode;
    actionNode.children = { { "FOLD", 4 }, { "CALL", 5 } };

    std::vector<NodeChild> expected = { { "FOLD", 4 }, { "CALL", 5 } };
    EXPECT_EQ(nodeChildren(SolverNode{ actionNode }), expected);
}

TEST(StreetFromPathTest, DealtCardsAdvanceStreet) {
    EXPECT_EQ(getStreetFromPath({}), Street::Flop);
    EXPECT_EQ(getStreetFromPath({ "CHECK", "BET 50" }), Street::Flop);
    EXPECT_EQ(getStreetFromPath({ "CHECK", "CHECK", "2c" }), Street::Turn);
    EXPECT_EQ(getStreetFromPath({ "CHECK", "CHECK", "2c", "BET 100", "CALL", "3d" }), Street::River);
}
