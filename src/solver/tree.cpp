#include "solver/tree.hpp"

#include "solver/node.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <utility>
#include <vector>

StrategyTree::StrategyTree() : m_rootNodeIndex{ 0 } {}

std::size_t StrategyTree::addNode(SolverNode&& node) {
    m_allNodes.push_back(std::move(node));
    return m_allNodes.size() - 1;
}

void StrategyTree::setRootNodeIndex(std::size_t rootNodeIndex) {
    assert(rootNodeIndex < m_allNodes.size());
    m_rootNodeIndex = rootNodeIndex;
}

bool StrategyTree::isEmpty() const {
    return m_allNodes.empty();
}

std::size_t StrategyTree::getRootNodeIndex() const {
    assert(!isEmpty());
    return m_rootNodeIndex;
}

const SolverNode& StrategyTree::getRootNode() const {
    return getNode(getRootNodeIndex());
}

const SolverNode& StrategyTree::getNode(std::size_t nodeIndex) const {
    assert(nodeIndex < m_allNodes.size());
    return m_allNodes[nodeIndex];
}

std::size_t StrategyTree::getNumberOfNodes() const {
    return m_allNodes.size();
}

std::size_t StrategyTree::getNumberOfActionNodes() const {
    return static_cast<std::size_t>(std::count_if(m_allNodes.begin(), m_allNodes.end(), [](const SolverNode& node) {
        return node.getNodeType() == NodeType::Action;
    }));
}

std::size_t StrategyTree::getNumberOfChanceNodes() const {
    return getNumberOfNodes() - getNumberOfActionNodes();
}
