#ifndef STRATEGY_HPP
#define STRATEGY_HPP

#include "game/game_types.hpp"
#include "solver/node.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

// An action name paired with its position in the combo frequency vectors
struct ActionEntry {
    std::string name;
    int index;

    bool operator==(const ActionEntry&) const = default;
};

struct CellAggregate {
    // Average frequency per action index
    std::vector<float> frequencies;

    // Index of the highest average frequency, lowest index on ties
    int dominantActionIndex;

    // Number of combos that contributed to this cell
    int comboCount;
};

using StrategyGrid = MatrixArray<std::optional<CellAggregate>>;

struct ActionAggregate {
    std::string name;

    // Average frequency 0-1 across all valid combos
    float frequency;

    int index;
};

struct ComboDetail {
    std::string combo;
    std::vector<float> frequencies;
};

// Resolves the action names for each slot of the frequency vectors.
// The solver leaves fold out of the children, so a vector one longer than the child list
// has fold at index 0. Any other length mismatch is a data error.
Result<std::vector<ActionEntry>> getActionEntries(const ActionNode& node);

// Combos whose vector length differs from actionCount are skipped
StrategyGrid aggregateCells(const SolverStrategy& strategy, int actionCount);
std::vector<ActionAggregate> aggregateActions(const ActionNode& node, const std::vector<ActionEntry>& entries);
std::vector<ComboDetail> combosForCell(const SolverStrategy& strategy, Cell cell);
std::vector<ComboDetail> combosForCell(const SolverStrategy& strategy, int row, int col);

std::optional<std::string> findIsomorphicCombo(const SolverStrategy& strategy, const std::string& combo);
std::optional<float> findComboActionFrequency(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo, const std::string& actionName);
float getDecisionFrequency(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo, const std::string& actionName);
std::vector<ActionAggregate> getComboActionFrequencies(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo);

#endif // STRATEGY_HPP
