#ifndef RANGE_PARSER_HPP
#define RANGE_PARSER_HPP

#include "game/game_types.hpp"
#include "game/hand_matrix.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

struct WeightedCombo {
    std::string combo;
    float weight;

    bool operator==(const WeightedCombo&) const = default;
};

// Malformed tokens are skipped rather than reported.
// Later tokens overwrite earlier tokens for the same cell.
RangeMatrix parseRange(const std::string& rangeString);
std::string serializeRange(const RangeMatrix& matrix);

Result<std::vector<Card>> buildBoardFromString(const std::string& boardString);
std::vector<WeightedCombo> getRangeCombos(const RangeMatrix& matrix, const std::vector<Card>& deadCards);
bool isComboInRange(const std::string& combo, const RangeMatrix& matrix);
std::string estimateRangeFromPercent(float percent);

#endif // RANGE_PARSER_HPP
