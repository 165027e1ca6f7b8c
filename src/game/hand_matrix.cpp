#include "game/hand_matrix.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
bool isValidIndex(int index) {
    return index >= 0 && index < NumRanks;
}
} // namespace

RangeMatrix::RangeMatrix() : m_frequencies{} {}

float RangeMatrix::get(int row, int col) const {
    assert(isValidIndex(row) && isValidIndex(col));
    return m_frequencies[row][col];
}

float RangeMatrix::get(Cell cell) const {
    return get(cell.row, cell.col);
}

void RangeMatrix::set(int row, int col, float frequency) {
    assert(isValidIndex(row) && isValidIndex(col));
    m_frequencies[row][col] = frequency;
}

void RangeMatrix::set(Cell cell, float frequency) {
    set(cell.row, cell.col, frequency);
}

void RangeMatrix::clear() {
    for (auto& row : m_frequencies) {
        row.fill(0.0f);
    }
}

bool RangeMatrix::isEmpty() const {
    return getNumberOfPlayedCells() == 0;
}

int RangeMatrix::getNumberOfPlayedCells() const {
    int count = 0;
    for (const auto& row : m_frequencies) {
        count += static_cast<int>(std::count_if(row.begin(), row.end(), [](float frequency) { return frequency != 0.0f; }));
    }
    return count;
}

double RangeMatrix::getWeightedComboCount() const {
    double total = 0.0;
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            total += static_cast<double>(m_frequencies[row][col]) * getCellComboCount({ row, col });
        }
    }
    return total;
}

std::optional<Cell> comboToCell(const std::string& combo) {
    if (combo.size() != 4) {
        return std::nullopt;
    }

    std::optional<Rank> rank0 = getRankFromChar(combo[0]);
    std::optional<Rank> rank1 = getRankFromChar(combo[2]);
    if (!rank0 || !rank1) {
        return std::nullopt;
    }

    int index0 = getRankIndex(*rank0);
    int index1 = getRankIndex(*rank1);
    if (index0 == index1) {
        return Cell{ index0, index1 };
    }

    // Smaller index is the higher rank
    int high = std::min(index0, index1);
    int low = std::max(index0, index1);

    bool isSuited = (combo[1] == combo[3]);
    if (isSuited) {
        return Cell{ high, low };
    }
    return Cell{ low, high };
}

std::string getCellName(int row, int col) {
    assert(isValidIndex(row) && isValidIndex(col));

    char rowRank = getRankChar(getRankFromIndex(row));
    char colRank = getRankChar(getRankFromIndex(col));

    if (row == col) {
        return { rowRank, colRank };
    }
    else if (row < col) {
        return { rowRank, colRank, 's' };
    }
    else {
        // Higher rank first
        return { colRank, rowRank, 'o' };
    }
}

std::string getCellName(Cell cell) {
    return getCellName(cell.row, cell.col);
}

std::optional<Cell> getCellFromName(const std::string& cellName) {
    if (cellName.size() != 2 && cellName.size() != 3) {
        return std::nullopt;
    }

    std::optional<Rank> rank0 = getRankFromChar(cellName[0]);
    std::optional<Rank> rank1 = getRankFromChar(cellName[1]);
    if (!rank0 || !rank1) {
        return std::nullopt;
    }

    int high = getRankIndex(*rank0);
    int low = getRankIndex(*rank1);

    if (cellName.size() == 2) {
        if (high != low) {
            return std::nullopt;
        }
        return Cell{ high, low };
    }

    if (high >= low) {
        return std::nullopt;
    }

    switch (cellName[2]) {
        case 's':
            return Cell{ high, low };
        case 'o':
            return Cell{ low, high };
        default:
            return std::nullopt;
    }
}

HandClass getCellHandClass(Cell cell) {
    assert(isValidIndex(cell.row) && isValidIndex(cell.col));

    if (cell.row == cell.col) {
        return HandClass::Pair;
    }
    return (cell.row < cell.col) ? HandClass::Suited : HandClass::Offsuit;
}

int getCellComboCount(Cell cell) {
    switch (getCellHandClass(cell)) {
        case HandClass::Pair:
            return 6;
        case HandClass::Suited:
            return 4;
        case HandClass::Offsuit:
            return 12;
        default:
            assert(false);
            return 0;
    }
}

std::vector<std::string> getCellCombos(Cell cell) {
    HandClass handClass = getCellHandClass(cell);

    Rank highRank = getRankFromIndex(std::min(cell.row, cell.col));
    Rank lowRank = getRankFromIndex(std::max(cell.row, cell.col));

    std::vector<std::string> combos;
    for (int suit0 = 0; suit0 < NumSuits; ++suit0) {
        for (int suit1 = 0; suit1 < NumSuits; ++suit1) {
            if ((handClass == HandClass::Pair) && (suit0 >= suit1)) continue;
            if ((handClass == HandClass::Suited) && (suit0 != suit1)) continue;
            if ((handClass == HandClass::Offsuit) && (suit0 == suit1)) continue;

            Combo combo = {
                Card{ highRank, static_cast<Suit>(suit0) },
                Card{ lowRank, static_cast<Suit>(suit1) }
            };
            combos.push_back(getNameFromCombo(combo));
        }
    }

    assert(static_cast<int>(combos.size()) == getCellComboCount(cell));
    return combos;
}
