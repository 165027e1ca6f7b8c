#include "solver/navigator.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "solver/node.hpp"
#include "solver/tree.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

std::vector<NodeChild> nodeChildren(const SolverNode& node) {
    switch (node.getNodeType()) {
        case NodeType::Action:
            return node.getActionNode().children;
        case NodeType::Chance: {
            const ChanceNode& chanceNode = node.getChanceNode();
            std::vector<NodeChild> children = chanceNode.dealCards;
            for (const NodeChild& actionChild : chanceNode.children) {
                auto it = std::find_if(children.begin(), children.end(), [&actionChild](const NodeChild& child) {
                    return child.label == actionChild.label;
                });

                if (it != children.end()) {
                    it->nodeIndex = actionChild.nodeIndex;
                }
                else {
                    children.push_back(actionChild);
                }
            }
            return children;
        }
        default:
            assert(false);
            return {};
    }
}

std::optional<std::size_t> findChild(const SolverNode& node, const std::string& label) {
    for (const NodeChild& child : nodeChildren(node)) {
        if (child.label == label) {
            return child.nodeIndex;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> navigateTree(const StrategyTree& tree, const std::vector<std::string>& labels) {
    if (tree.isEmpty()) {
        return std::nullopt;
    }

    std::size_t nodeIndex = tree.getRootNodeIndex();
    for (const std::string& label : labels) {
        std::optional<std::size_t> childIndex = findChild(tree.getNode(nodeIndex), label);
        if (!childIndex) {
            return std::nullopt;
        }
        nodeIndex = *childIndex;
    }
    return nodeIndex;
}

Street getStreetFromPath(const std::vector<std::string>& labels) {
    int dealtCards = static_cast<int>(std::count_if(labels.begin(), labels.end(), [](const std::string& label) {
        return isCardName(label);
    }));

    if (dealtCards == 0) {
        return Street::Flop;
    }
    else if (dealtCards == 1) {
        return Street::Turn;
    }
    else {
        return Street::River;
    }
}

TreeNavigator::TreeNavigator(std::shared_ptr<const StrategyTree> tree) : m_tree{ std::move(tree) } {
    assert(m_tree != nullptr && !m_tree->isEmpty());
}

void TreeNavigator::resetTree(std::shared_ptr<const StrategyTree> tree) {
    assert(tree != nullptr && !tree->isEmpty());
    m_tree = std::move(tree);
    m_path.clear();
}

const StrategyTree& TreeNavigator::getTree() const {
    return *m_tree;
}

std::shared_ptr<const StrategyTree> TreeNavigator::getSharedTree() const {
    return m_tree;
}

std::size_t TreeNavigator::getCurrentNodeIndex() const {
    return m_path.empty() ? m_tree->getRootNodeIndex() : m_path.back().nodeIndex;
}

const SolverNode& TreeNavigator::getCurrentNode() const {
    return m_tree->getNode(getCurrentNodeIndex());
}

const std::vector<NavigationStep>& TreeNavigator::getPath() const {
    return m_path;
}

std::vector<std::string> TreeNavigator::getPathLabels() const {
    std::vector<std::string> labels;
    for (const NavigationStep& step : m_path) {
        labels.push_back(step.label);
    }
    return labels;
}

std::size_t TreeNavigator::getDepth() const {
    return m_path.size();
}

bool TreeNavigator::moveToChild(const std::string& label) {
    std::optional<std::size_t> childIndex = findChild(getCurrentNode(), label);
    if (!childIndex) {
        return false;
    }

    m_path.push_back({ label, *childIndex });
    return true;
}

bool TreeNavigator::jumpTo(std::size_t depth) {
    if (depth > m_path.size()) {
        return false;
    }

    m_path.resize(depth);
    return true;
}

bool TreeNavigator::moveBack() {
    if (m_path.empty()) {
        return false;
    }

    m_path.pop_back();
    return true;
}
