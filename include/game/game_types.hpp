#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include <array>
#include <cstdint>

constexpr int NumRanks = 13;
constexpr int NumSuits = 4;
constexpr int NumStartingHands = 1326;

// Descending order, so the rank index of an Ace is 0
enum class Rank : std::uint8_t {
    Ace,
    King,
    Queen,
    Jack,
    Ten,
    Nine,
    Eight,
    Seven,
    Six,
    Five,
    Four,
    Three,
    Two
};

// Suits are only compared for equality
enum class Suit : std::uint8_t {
    Spades,
    Hearts,
    Diamonds,
    Clubs
};

enum class HandClass : std::uint8_t {
    Pair,
    Suited,
    Offsuit
};

enum class Street : std::uint8_t {
    Flop,
    Turn,
    River
};

// Solver player 0 is out of position, player 1 is in position
enum class Position : std::uint8_t {
    OOP,
    IP
};

struct Card {
    Rank rank;
    Suit suit;

    bool operator==(const Card&) const = default;
};

// Two distinct cards. Equality ignores the order of the cards.
struct Combo {
    Card first;
    Card second;

    bool operator==(const Combo& other) const {
        return (first == other.first && second == other.second) || (first == other.second && second == other.first);
    }
};

// Position in the 13x13 hand matrix.
// row == col: pocket pair, row < col: suited, row > col: offsuit
struct Cell {
    int row;
    int col;

    bool operator==(const Cell&) const = default;
};

template <typename T>
using MatrixArray = std::array<std::array<T, NumRanks>, NumRanks>;

#endif // GAME_TYPES_HPP
