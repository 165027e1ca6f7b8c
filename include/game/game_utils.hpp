#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

// Rank functions
std::optional<Rank> getRankFromChar(char c);
char getRankChar(Rank rank);
int getRankIndex(Rank rank);
Rank getRankFromIndex(int rankIndex);

// Suit functions
std::optional<Suit> getSuitFromChar(char c);
char getSuitChar(Suit suit);

// Card functions
Result<Card> getCardFromName(const std::string& cardName);
std::string getNameFromCard(const Card& card);
bool isCardName(const std::string& name);

// Combo functions
Result<Combo> getComboFromName(const std::string& comboName);
std::string getNameFromCombo(const Combo& combo);
bool comboContainsCard(const Combo& combo, const Card& card);

// Street functions
std::string getStreetName(Street street);

// Position functions
Position getOpposingPosition(Position position);
std::string getPositionName(Position position);
std::optional<Position> getPositionFromName(const std::string& positionName);

#endif // GAME_UTILS_HPP
