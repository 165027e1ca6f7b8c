#include "io/output.hpp"

#include "game/game_types.hpp"
#include "game/hand_matrix.hpp"
#include "solver/node.hpp"
#include "solver/strategy.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

namespace {
json buildJSONCell(const CellAggregate& aggregate, const std::vector<ActionEntry>& entries) {
    json j;
    j["Dominant Action"] = entries[aggregate.dominantActionIndex].name;
    j["Combos"] = aggregate.comboCount;

    auto& frequencies = j["Frequencies"];
    for (const ActionEntry& entry : entries) {
        frequencies[entry.name] = aggregate.frequencies[entry.index];
    }
    return j;
}
} // namespace

Result<json> buildNodeSummaryJSON(const ActionNode& node) {
    Result<std::vector<ActionEntry>> entriesResult = getActionEntries(node);
    if (entriesResult.isError()) {
        return entriesResult.getError();
    }
    const std::vector<ActionEntry>& entries = entriesResult.getValue();

    json j;
    if (node.player) {
        j["Player"] = (*node.player == Position::OOP) ? "oop" : "ip";
    }

    j["Actions"] = json::array();
    for (const ActionEntry& entry : entries) {
        j["Actions"].push_back(entry.name);
    }

    auto& rangeFrequencies = j["Range Frequencies"];
    rangeFrequencies = json::object();
    for (const ActionAggregate& aggregate : aggregateActions(node, entries)) {
        rangeFrequencies[aggregate.name] = aggregate.frequency;
    }

    auto& cells = j["Cells"];
    cells = json::object();
    StrategyGrid grid = aggregateCells(node.strategy, static_cast<int>(entries.size()));
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            const std::optional<CellAggregate>& aggregate = grid[row][col];
            if (aggregate) {
                cells[getCellName(row, col)] = buildJSONCell(*aggregate, entries);
            }
        }
    }

    return j;
}

Result<void> outputNodeSummaryToJSON(const ActionNode& node, const std::string& filePath) {
    Result<json> summaryResult = buildNodeSummaryJSON(node);
    if (summaryResult.isError()) {
        return summaryResult.getError();
    }

    std::ofstream file(filePath);
    if (!file.is_open()) {
        return "Error exporting node: Could not open \"" + filePath + "\" for writing.";
    }

    file << summaryResult.getValue().dump(4) << std::endl;
    return {};
}
