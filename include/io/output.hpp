#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "solver/node.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Action entries, range-wide frequencies and the 13x13 dominant-action grid of one action node
Result<nlohmann::ordered_json> buildNodeSummaryJSON(const ActionNode& node);
Result<void> outputNodeSummaryToJSON(const ActionNode& node, const std::string& filePath);

#endif // OUTPUT_HPP
