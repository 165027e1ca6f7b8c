#include "game/range_parser.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/hand_matrix.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace {
std::optional<int> getRankIndexFromChar(char c) {
    std::optional<Rank> rank = getRankFromChar(c);
    if (!rank) {
        return std::nullopt;
    }
    return getRankIndex(*rank);
}

// AA-99
bool applyPairRange(const std::string& hand, float frequency, RangeMatrix& matrix) {
    if (hand.size() != 5 || hand[2] != '-') {
        return false;
    }

    std::optional<int> from = getRankIndexFromChar(hand[0]);
    std::optional<int> to = getRankIndexFromChar(hand[3]);
    if (!from || !to || !getRankIndexFromChar(hand[1]) || !getRankIndexFromChar(hand[4])) {
        return false;
    }

    if (hand[0] != hand[1] || hand[3] != hand[4]) {
        return false;
    }

    for (int i = std::min(*from, *to); i <= std::max(*from, *to); ++i) {
        matrix.set(i, i, frequency);
    }
    return true;
}

// 87s-54s: walks the diagonal from the first hand's row to the second hand's row,
// keeping the rank gap of the first hand
bool applySuitedRange(const std::string& hand, float frequency, RangeMatrix& matrix) {
    if (hand.size() != 7 || hand[2] != 's' || hand[3] != '-' || hand[6] != 's') {
        return false;
    }

    std::optional<int> startRow = getRankIndexFromChar(hand[0]);
    std::optional<int> startCol = getRankIndexFromChar(hand[1]);
    std::optional<int> endRow = getRankIndexFromChar(hand[4]);
    if (!startRow || !startCol || !endRow || !getRankIndexFromChar(hand[5])) {
        return false;
    }

    int step = (*startRow < *endRow) ? 1 : -1;
    int offset = *startCol - *startRow;
    for (int row = *startRow; row != *endRow + step; row += step) {
        int col = row + offset;
        if (col >= 0 && col < NumRanks && row < col) {
            matrix.set(row, col, frequency);
        }
    }
    return true;
}

// AKs or AKo, higher rank first
bool applySuitedOrOffsuit(const std::string& hand, float frequency, RangeMatrix& matrix) {
    if (hand.size() != 3 || (hand[2] != 's' && hand[2] != 'o')) {
        return false;
    }

    std::optional<int> high = getRankIndexFromChar(hand[0]);
    std::optional<int> low = getRankIndexFromChar(hand[1]);
    if (!high || !low) {
        return false;
    }

    if (*high < *low) {
        if (hand[2] == 's') {
            matrix.set(*high, *low, frequency);
        }
        else {
            matrix.set(*low, *high, frequency);
        }
    }
    return true;
}

// AA, or AK for both the suited and offsuit cell
bool applyTwoRankHand(const std::string& hand, float frequency, RangeMatrix& matrix) {
    if (hand.size() != 2) {
        return false;
    }

    std::optional<int> rank0 = getRankIndexFromChar(hand[0]);
    std::optional<int> rank1 = getRankIndexFromChar(hand[1]);
    if (!rank0 || !rank1) {
        return false;
    }

    if (*rank0 == *rank1) {
        matrix.set(*rank0, *rank0, frequency);
        return true;
    }

    int high = std::min(*rank0, *rank1);
    int low = std::max(*rank0, *rank1);
    matrix.set(high, low, frequency);
    matrix.set(low, high, frequency);
    return true;
}

struct RangeTier {
    float percent;
    const char* hands;
};

// Cumulative tiers of a top-N% opening range
constexpr std::array<RangeTier, 12> RangeTiers = { {
    { 5.0f, "AA,KK,QQ,AKs,AKo" },
    { 8.0f, "JJ,AQs,AQo" },
    { 10.0f, "TT,AJs,KQs" },
    { 13.0f, "99,ATs,KJs,QJs,AJo" },
    { 16.0f, "88,A9s,KTs,QTs,JTs,KQo" },
    { 20.0f, "77,A8s,A7s,A6s,A5s,K9s,Q9s,J9s,T9s,ATo" },
    { 25.0f, "66,A4s,A3s,A2s,K8s,Q8s,J8s,T8s,98s,KJo" },
    { 30.0f, "55,K7s,K6s,Q7s,J7s,97s,87s,76s,AJo" },
    { 35.0f, "44,K5s,K4s,Q6s,J6s,86s,75s,65s,QJo" },
    { 40.0f, "33,K3s,K2s,Q5s,96s,85s,74s,64s,54s,KTo" },
    { 45.0f, "22,Q4s,Q3s,Q2s,95s,84s,73s,63s,53s,43s,QTo" },
    { 50.0f, "J5s,J4s,J3s,94s,83s,72s,62s,52s,42s,JTo,KJo:0.5" },
} };
} // namespace

RangeMatrix parseRange(const std::string& rangeString) {
    RangeMatrix matrix;

    for (const std::string& token : parseTokens(rangeString, ',')) {
        std::string hand = token;
        float frequency = 1.0f;

        std::size_t colonLoc = token.find(':');
        if (colonLoc != std::string::npos) {
            hand = token.substr(0, colonLoc);
            std::optional<float> frequencyOption = parseFloat(token.substr(colonLoc + 1));
            if (!frequencyOption) {
                continue;
            }
            frequency = *frequencyOption;
        }

        // First matching shape wins
        if (applyPairRange(hand, frequency, matrix)) continue;
        if (applySuitedRange(hand, frequency, matrix)) continue;
        if (applySuitedOrOffsuit(hand, frequency, matrix)) continue;
        applyTwoRankHand(hand, frequency, matrix);
    }

    return matrix;
}

std::string serializeRange(const RangeMatrix& matrix) {
    std::vector<std::string> parts;

    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            float frequency = matrix.get(row, col);
            if (frequency == 0.0f) {
                continue;
            }

            std::string name = getCellName(row, col);
            if (frequency == 1.0f) {
                parts.push_back(name);
            }
            else {
                parts.push_back(name + ":" + formatFixedPoint(frequency, 2));
            }
        }
    }

    return join(parts, ",");
}

Result<std::vector<Card>> buildBoardFromString(const std::string& boardString) {
    std::vector<Card> board;

    for (const std::string& cardString : parseTokens(boardString, ',')) {
        Result<Card> cardResult = getCardFromName(cardString);
        if (cardResult.isError()) {
            return "Error building board: " + cardResult.getError();
        }

        const Card& card = cardResult.getValue();
        if (std::find(board.begin(), board.end(), card) != board.end()) {
            return "Error building board: \"" + cardString + "\" appears more than once.";
        }

        board.push_back(card);
    }

    if (board.size() < 3 || board.size() > 5) {
        return "Error building board: Size must be 3, 4, or 5 (flop, turn, or river).";
    }

    return board;
}

std::vector<WeightedCombo> getRangeCombos(const RangeMatrix& matrix, const std::vector<Card>& deadCards) {
    std::vector<WeightedCombo> combos;

    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            float frequency = matrix.get(row, col);
            if (frequency == 0.0f) {
                continue;
            }

            for (const std::string& comboName : getCellCombos({ row, col })) {
                Combo combo = getComboFromName(comboName).getValue();
                bool isBlocked = std::any_of(deadCards.begin(), deadCards.end(), [&combo](const Card& card) {
                    return comboContainsCard(combo, card);
                });

                if (!isBlocked) {
                    combos.push_back({ comboName, frequency });
                }
            }
        }
    }

    return combos;
}

bool isComboInRange(const std::string& combo, const RangeMatrix& matrix) {
    std::optional<Cell> cell = comboToCell(combo);
    if (!cell) {
        return false;
    }
    return matrix.get(*cell) > 0.0f;
}

std::string estimateRangeFromPercent(float percent) {
    std::vector<std::string> parts;
    for (const RangeTier& tier : RangeTiers) {
        parts.push_back(tier.hands);
        if (percent <= tier.percent) {
            break;
        }
    }
    return join(parts, ",");
}
