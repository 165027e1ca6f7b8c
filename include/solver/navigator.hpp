#ifndef NAVIGATOR_HPP
#define NAVIGATOR_HPP

#include "game/game_types.hpp"
#include "solver/node.hpp"
#include "solver/tree.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct NavigationStep {
    std::string label;
    std::size_t nodeIndex;

    bool operator==(const NavigationStep&) const = default;
};

// Children of either node variant. For chance nodes the dealt cards come first;
// an action child with the same label as a dealt card replaces it in place.
std::vector<NodeChild> nodeChildren(const SolverNode& node);
std::optional<std::size_t> findChild(const SolverNode& node, const std::string& label);

// Follows labels from the root, returns the node index or nothing if a label is missing
std::optional<std::size_t> navigateTree(const StrategyTree& tree, const std::vector<std::string>& labels);

// Every dealt-card label in the path moves the hand one street past the flop
Street getStreetFromPath(const std::vector<std::string>& labels);

// Breadcrumb navigation over a shared, read-only tree.
// The path holds the steps taken below the root; an empty path means the root is current.
class TreeNavigator {
public:
    explicit TreeNavigator(std::shared_ptr<const StrategyTree> tree);

    // Swaps the tree first, then clears the path
    void resetTree(std::shared_ptr<const StrategyTree> tree);

    const StrategyTree& getTree() const;
    std::shared_ptr<const StrategyTree> getSharedTree() const;

    std::size_t getCurrentNodeIndex() const;
    const SolverNode& getCurrentNode() const;
    const std::vector<NavigationStep>& getPath() const;
    std::vector<std::string> getPathLabels() const;
    std::size_t getDepth() const;

    bool moveToChild(const std::string& label);

    // Truncates the path to its first depth steps, 0 returns to the root
    bool jumpTo(std::size_t depth);
    bool moveBack();

private:
    std::shared_ptr<const StrategyTree> m_tree;
    std::vector<NavigationStep> m_path;
};

#endif // NAVIGATOR_HPP
