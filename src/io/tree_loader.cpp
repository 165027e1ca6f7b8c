#include "io/tree_loader.hpp"

#include "game/game_types.hpp"
#include "solver/node.hpp"
#include "solver/tree.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
using json = nlohmann::ordered_json;

Result<std::size_t> buildNode(const json& j, const std::string& path, StrategyTree& tree);

std::string describePath(const std::string& path) {
    return path.empty() ? "<root>" : path;
}

Result<std::vector<NodeChild>> buildChildren(const json& j, const std::string& key, const std::string& path, StrategyTree& tree) {
    std::vector<NodeChild> children;

    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return children;
    }

    if (!it->is_object()) {
        return "Error loading tree: \"" + key + "\" at " + describePath(path) + " is not an object.";
    }

    for (const auto& [label, child] : it->items()) {
        Result<std::size_t> childIndex = buildNode(child, path + "/" + label, tree);
        if (childIndex.isError()) {
            return childIndex.getError();
        }
        children.push_back({ label, childIndex.getValue() });
    }

    return children;
}

Result<SolverStrategy> buildStrategy(const json& j, const std::string& path) {
    SolverStrategy strategy;

    auto wrapper = j.find("strategy");
    if (wrapper == j.end() || wrapper->is_null()) {
        return strategy;
    }

    auto combos = wrapper->find("strategy");
    if (combos == wrapper->end() || combos->is_null()) {
        return strategy;
    }

    if (!combos->is_object()) {
        return "Error loading tree: Strategy at " + describePath(path) + " is not an object.";
    }

    for (const auto& [combo, frequencies] : combos->items()) {
        if (!frequencies.is_array()) {
            return "Error loading tree: Strategy for " + combo + " at " + describePath(path) + " is not an array.";
        }

        std::vector<float> comboFrequencies;
        for (const json& frequency : frequencies) {
            if (!frequency.is_number()) {
                return "Error loading tree: Strategy for " + combo + " at " + describePath(path) + " contains a non-numeric frequency.";
            }
            comboFrequencies.push_back(frequency.get<float>());
        }

        strategy.setComboFrequencies(combo, comboFrequencies);
    }

    return strategy;
}

Result<std::size_t> buildActionNode(const json& j, const std::string& path, StrategyTree& tree) {
    Result<std::vector<NodeChild>> children = buildChildren(j, "childrens", path, tree);
    if (children.isError()) {
        return children.getError();
    }

    Result<SolverStrategy> strategy = buildStrategy(j, path);
    if (strategy.isError()) {
        return strategy.getError();
    }

    std::optional<Position> player;
    auto playerIt = j.find("player");
    if (playerIt != j.end() && playerIt->is_number_integer()) {
        player = (playerIt->get<int>() == 0) ? Position::OOP : Position::IP;
    }

    ActionNode actionNode = {
        .children = std::move(children.getValue()),
        .strategy = std::move(strategy.getValue()),
        .player = player
    };
    return tree.addNode(SolverNode{ std::move(actionNode) });
}

Result<std::size_t> buildChanceNode(const json& j, const std::string& path, StrategyTree& tree) {
    // Both spellings appear in solver dumps
    std::string dealCardsKey = j.contains("dealcards") ? "dealcards" : "deal_cards";
    Result<std::vector<NodeChild>> dealCards = buildChildren(j, dealCardsKey, path, tree);
    if (dealCards.isError()) {
        return dealCards.getError();
    }

    Result<std::vector<NodeChild>> children = buildChildren(j, "childrens", path, tree);
    if (children.isError()) {
        return children.getError();
    }

    int dealNumber = 0;
    auto dealNumberIt = j.find("deal_number");
    if (dealNumberIt != j.end() && dealNumberIt->is_number_integer()) {
        dealNumber = dealNumberIt->get<int>();
    }

    ChanceNode chanceNode = {
        .dealCards = std::move(dealCards.getValue()),
        .children = std::move(children.getValue()),
        .dealNumber = dealNumber
    };
    return tree.addNode(SolverNode{ std::move(chanceNode) });
}

// Children are added before their parent, so the root ends up last
Result<std::size_t> buildNode(const json& j, const std::string& path, StrategyTree& tree) {
    if (!j.is_object()) {
        return "Error loading tree: Node at " + describePath(path) + " is not an object.";
    }

    auto nodeTypeIt = j.find("node_type");
    if (nodeTypeIt == j.end() || !nodeTypeIt->is_string()) {
        return "Error loading tree: Node at " + describePath(path) + " has no node_type.";
    }

    const std::string nodeType = nodeTypeIt->get<std::string>();
    if (nodeType == "action_node") {
        return buildActionNode(j, path, tree);
    }
    else if (nodeType == "chance_node") {
        return buildChanceNode(j, path, tree);
    }

    return "Error loading tree: Node at " + describePath(path) + " has unknown node_type \"" + nodeType + "\".";
}
} // namespace

Result<StrategyTree> buildStrategyTreeFromJSON(const json& root) {
    StrategyTree tree;

    Result<std::size_t> rootIndex = buildNode(root, "", tree);
    if (rootIndex.isError()) {
        return rootIndex.getError();
    }

    tree.setRootNodeIndex(rootIndex.getValue());
    return tree;
}

Result<StrategyTree> buildStrategyTreeFromString(const std::string& jsonText) {
    json root;
    try {
        root = json::parse(jsonText);
    }
    catch (const json::parse_error& e) {
        return std::string{ "Error loading tree: Could not parse JSON. " } + e.what();
    }

    return buildStrategyTreeFromJSON(root);
}

Result<StrategyTree> loadStrategyTreeFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return "Error loading tree: Could not open \"" + filePath + "\".";
    }

    json root;
    try {
        root = json::parse(file);
    }
    catch (const json::parse_error& e) {
        return std::string{ "Error loading tree: Could not parse JSON. " } + e.what();
    }

    return buildStrategyTreeFromJSON(root);
}
