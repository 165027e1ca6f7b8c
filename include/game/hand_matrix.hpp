#ifndef HAND_MATRIX_HPP
#define HAND_MATRIX_HPP

#include "game/game_types.hpp"

#include <optional>
#include <string>
#include <vector>

// 13x13 play frequencies indexed by rank index (0 = Ace).
// Frequencies are not clamped; consumers decide how to treat values outside [0, 1].
class RangeMatrix {
public:
    RangeMatrix();

    float get(int row, int col) const;
    float get(Cell cell) const;
    void set(int row, int col, float frequency);
    void set(Cell cell, float frequency);
    void clear();

    bool isEmpty() const;
    int getNumberOfPlayedCells() const;

    // Number of concrete combos, each weighted by its cell frequency
    double getWeightedComboCount() const;

    bool operator==(const RangeMatrix&) const = default;

private:
    MatrixArray<float> m_frequencies;
};

// Matrix/cell bijection
std::optional<Cell> comboToCell(const std::string& combo);
std::string getCellName(int row, int col);
std::string getCellName(Cell cell);
std::optional<Cell> getCellFromName(const std::string& cellName);

HandClass getCellHandClass(Cell cell);
int getCellComboCount(Cell cell);
std::vector<std::string> getCellCombos(Cell cell);

#endif // HAND_MATRIX_HPP
