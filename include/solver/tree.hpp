#ifndef TREE_HPP
#define TREE_HPP

#include "solver/node.hpp"

#include <cstddef>
#include <vector>

// Immutable once built. Children refer to other nodes by index into allNodes.
class StrategyTree {
public:
    StrategyTree();

    std::size_t addNode(SolverNode&& node);
    void setRootNodeIndex(std::size_t rootNodeIndex);

    bool isEmpty() const;
    std::size_t getRootNodeIndex() const;
    const SolverNode& getRootNode() const;
    const SolverNode& getNode(std::size_t nodeIndex) const;
    std::size_t getNumberOfNodes() const;
    std::size_t getNumberOfActionNodes() const;
    std::size_t getNumberOfChanceNodes() const;

private:
    std::vector<SolverNode> m_allNodes;
    std::size_t m_rootNodeIndex;
};

#endif // TREE_HPP
