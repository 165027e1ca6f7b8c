#ifndef TREE_LOADER_HPP
#define TREE_LOADER_HPP

#include "solver/tree.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Key order must survive parsing: it defines the action indices of every node
Result<StrategyTree> buildStrategyTreeFromJSON(const nlohmann::ordered_json& root);
Result<StrategyTree> buildStrategyTreeFromString(const std::string& jsonText);
Result<StrategyTree> loadStrategyTreeFromFile(const std::string& filePath);

#endif // TREE_LOADER_HPP
