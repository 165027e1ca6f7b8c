#include "solver/strategy.hpp"

#include "game/game_types.hpp"
#include "game/hand_matrix.hpp"
#include "solver/node.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <numeric>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
const std::string SuitChars = "shdc";

std::optional<ActionEntry> findActionEntry(const std::vector<ActionEntry>& entries, const std::string& actionName) {
    auto it = std::find_if(entries.begin(), entries.end(), [&actionName](const ActionEntry& entry) {
        return entry.name == actionName;
    });
    if (it == entries.end()) {
        return std::nullopt;
    }
    return *it;
}
} // namespace

Result<std::vector<ActionEntry>> getActionEntries(const ActionNode& node) {
    std::size_t childCount = node.children.size();
    std::size_t strategyLength = node.strategy.getFirstVectorLength();

    std::vector<ActionEntry> entries;

    if (!node.strategy.empty() && strategyLength == childCount + 1) {
        entries.push_back({ "FOLD", 0 });
        for (std::size_t i = 0; i < childCount; ++i) {
            entries.push_back({ node.children[i].label, static_cast<int>(i + 1) });
        }
        return entries;
    }

    // A node without strategy data has nothing to disagree with its children
    if (node.strategy.empty() || strategyLength == childCount) {
        for (std::size_t i = 0; i < childCount; ++i) {
            entries.push_back({ node.children[i].label, static_cast<int>(i) });
        }
        return entries;
    }

    return "Error resolving actions: Node has " + std::to_string(childCount) + " children but strategy vectors of length "
        + std::to_string(strategyLength) + ".";
}

StrategyGrid aggregateCells(const SolverStrategy& strategy, int actionCount) {
    struct CellSum {
        std::vector<double> sums;
        int count;
    };

    StrategyGrid grid{};
    if (actionCount <= 0) {
        return grid;
    }

    MatrixArray<std::optional<CellSum>> sumGrid{};
    for (const ComboStrategy& comboStrategy : strategy.getCombos()) {
        if (static_cast<int>(comboStrategy.frequencies.size()) != actionCount) continue;

        std::optional<Cell> cell = comboToCell(comboStrategy.combo);
        if (!cell) continue;

        std::optional<CellSum>& cellSum = sumGrid[cell->row][cell->col];
        if (!cellSum) {
            cellSum = CellSum{ std::vector<double>(actionCount, 0.0), 0 };
        }

        for (int i = 0; i < actionCount; ++i) {
            cellSum->sums[i] += comboStrategy.frequencies[i];
        }
        ++cellSum->count;
    }

    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            const std::optional<CellSum>& cellSum = sumGrid[row][col];
            if (!cellSum || cellSum->count == 0) continue;

            CellAggregate aggregate{ std::vector<float>(actionCount), 0, cellSum->count };
            for (int i = 0; i < actionCount; ++i) {
                aggregate.frequencies[i] = static_cast<float>(cellSum->sums[i] / cellSum->count);
            }

            for (int i = 1; i < actionCount; ++i) {
                if (aggregate.frequencies[i] > aggregate.frequencies[aggregate.dominantActionIndex]) {
                    aggregate.dominantActionIndex = i;
                }
            }

            grid[row][col] = std::move(aggregate);
        }
    }

    return grid;
}

std::vector<ActionAggregate> aggregateActions(const ActionNode& node, const std::vector<ActionEntry>& entries) {
    std::vector<double> sums(entries.size(), 0.0);
    int total = 0;

    for (const ComboStrategy& comboStrategy : node.strategy.getCombos()) {
        if (comboStrategy.frequencies.size() != entries.size()) continue;

        for (std::size_t i = 0; i < entries.size(); ++i) {
            sums[i] += comboStrategy.frequencies[i];
        }
        ++total;
    }

    std::vector<ActionAggregate> aggregates;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        float frequency = (total > 0) ? static_cast<float>(sums[i] / total) : 0.0f;
        aggregates.push_back({ entries[i].name, frequency, entries[i].index });
    }
    return aggregates;
}

std::vector<ComboDetail> combosForCell(const SolverStrategy& strategy, Cell cell) {
    std::vector<ComboDetail> details;
    for (const ComboStrategy& comboStrategy : strategy.getCombos()) {
        std::optional<Cell> comboCell = comboToCell(comboStrategy.combo);
        if (comboCell && *comboCell == cell) {
            details.push_back({ comboStrategy.combo, comboStrategy.frequencies });
        }
    }
    return details;
}

std::vector<ComboDetail> combosForCell(const SolverStrategy& strategy, int row, int col) {
    return combosForCell(strategy, Cell{ row, col });
}

std::optional<std::string> findIsomorphicCombo(const SolverStrategy& strategy, const std::string& combo) {
    if (strategy.containsCombo(combo)) {
        return combo;
    }

    if (combo.size() != 4) {
        return std::nullopt;
    }

    std::size_t suit0 = SuitChars.find(combo[1]);
    std::size_t suit1 = SuitChars.find(combo[3]);
    if (suit0 == std::string::npos || suit1 == std::string::npos) {
        return std::nullopt;
    }

    // Identity first, then the remaining relabellings in lexicographic order
    std::array<int, NumSuits> permutation;
    std::iota(permutation.begin(), permutation.end(), 0);
    do {
        std::string candidate = { combo[0], SuitChars[permutation[suit0]], combo[2], SuitChars[permutation[suit1]] };
        if (strategy.containsCombo(candidate)) {
            return candidate;
        }
    } while (std::next_permutation(permutation.begin(), permutation.end()));

    return std::nullopt;
}

std::optional<float> findComboActionFrequency(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo, const std::string& actionName) {
    std::optional<ActionEntry> entry = findActionEntry(entries, actionName);
    if (!entry) {
        return std::nullopt;
    }

    std::optional<std::string> strategyCombo = findIsomorphicCombo(node.strategy, combo);
    if (!strategyCombo) {
        return std::nullopt;
    }

    const std::vector<float>* frequencies = node.strategy.findCombo(*strategyCombo);
    if (frequencies == nullptr || entry->index >= static_cast<int>(frequencies->size())) {
        return std::nullopt;
    }

    return (*frequencies)[entry->index];
}

float getDecisionFrequency(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo, const std::string& actionName) {
    if (node.strategy.empty()) {
        return 1.0f / static_cast<float>(std::max<std::size_t>(entries.size(), 1));
    }

    std::optional<ActionEntry> entry = findActionEntry(entries, actionName);
    if (!entry) {
        return 0.0f;
    }

    std::optional<float> comboFrequency = findComboActionFrequency(node, entries, combo, actionName);
    if (comboFrequency) {
        return *comboFrequency;
    }

    // Hand not in the solved range, fall back to the range-wide frequency
    for (const ActionAggregate& aggregate : aggregateActions(node, entries)) {
        if (aggregate.index == entry->index) {
            return aggregate.frequency;
        }
    }
    return 0.0f;
}

std::vector<ActionAggregate> getComboActionFrequencies(const ActionNode& node, const std::vector<ActionEntry>& entries, const std::string& combo) {
    std::vector<ActionAggregate> frequencies;
    for (const ActionEntry& entry : entries) {
        frequencies.push_back({ entry.name, getDecisionFrequency(node, entries, combo, entry.name), entry.index });
    }
    return frequencies;
}
