#ifndef NODE_HPP
#define NODE_HPP

#include "game/game_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

enum class NodeType : std::uint8_t {
    Action,
    Chance
};

struct NodeChild {
    // Action name for action children, card name for dealt cards
    std::string label;

    // Index into StrategyTree's node storage
    std::size_t nodeIndex;

    bool operator==(const NodeChild&) const = default;
};

struct ComboStrategy {
    std::string combo;
    std::vector<float> frequencies;
};

// Combo -> action frequencies at one node, in the order the solver wrote them
class SolverStrategy {
public:
    void setComboFrequencies(const std::string& combo, const std::vector<float>& frequencies);

    const std::vector<ComboStrategy>& getCombos() const;
    const std::vector<float>* findCombo(const std::string& combo) const;
    bool containsCombo(const std::string& combo) const;

    // Length of the first combo's frequency vector, 0 if there are no combos
    std::size_t getFirstVectorLength() const;

    std::size_t size() const;
    bool empty() const;

private:
    std::vector<ComboStrategy> m_combos;
    std::unordered_map<std::string, std::size_t> m_comboIndices;
};

struct ActionNode {
    // Children in declaration order. The order defines the action indices.
    std::vector<NodeChild> children;

    // Strategy of the player acting at this node
    SolverStrategy strategy;

    // Acting player if the solver recorded it
    std::optional<Position> player;
};

struct ChanceNode {
    // Possible run-out cards
    std::vector<NodeChild> dealCards;

    // Forced actions some encodings attach directly to a chance node
    std::vector<NodeChild> children;

    int dealNumber;
};

class SolverNode {
public:
    SolverNode(const ActionNode& actionNode) : m_data{ actionNode } {}
    SolverNode(ActionNode&& actionNode) : m_data{ std::move(actionNode) } {}
    SolverNode(const ChanceNode& chanceNode) : m_data{ chanceNode } {}
    SolverNode(ChanceNode&& chanceNode) : m_data{ std::move(chanceNode) } {}

    NodeType getNodeType() const {
        return std::holds_alternative<ActionNode>(m_data) ? NodeType::Action : NodeType::Chance;
    }

    const ActionNode& getActionNode() const {
        return std::get<ActionNode>(m_data);
    }

    const ChanceNode& getChanceNode() const {
        return std::get<ChanceNode>(m_data);
    }

private:
    std::variant<ActionNode, ChanceNode> m_data;
};

#endif // NODE_HPP
