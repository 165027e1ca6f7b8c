#include "game/game_utils.hpp"

#include "game/game_types.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>

namespace {
const std::string RankNames = "AKQJT98765432";
const std::string SuitNames = "shdc";
} // namespace

std::optional<Rank> getRankFromChar(char c) {
    std::size_t rankIndex = RankNames.find(c);
    if (rankIndex == std::string::npos) {
        return std::nullopt;
    }
    return static_cast<Rank>(rankIndex);
}

char getRankChar(Rank rank) {
    return RankNames[getRankIndex(rank)];
}

int getRankIndex(Rank rank) {
    int rankIndex = static_cast<int>(rank);
    assert(rankIndex >= 0 && rankIndex < NumRanks);
    return rankIndex;
}

Rank getRankFromIndex(int rankIndex) {
    assert(rankIndex >= 0 && rankIndex < NumRanks);
    return static_cast<Rank>(rankIndex);
}

std::optional<Suit> getSuitFromChar(char c) {
    std::size_t suitIndex = SuitNames.find(c);
    if (suitIndex == std::string::npos) {
        return std::nullopt;
    }
    return static_cast<Suit>(suitIndex);
}

char getSuitChar(Suit suit) {
    int suitIndex = static_cast<int>(suit);
    assert(suitIndex >= 0 && suitIndex < NumSuits);
    return SuitNames[suitIndex];
}

Result<Card> getCardFromName(const std::string& cardName) {
    static const std::string ErrorPrefix = "Error parsing card name: ";

    if (cardName.size() != 2) {
        return ErrorPrefix + "\"" + cardName + "\" is not two characters long.";
    }

    std::optional<Rank> rank = getRankFromChar(cardName[0]);
    if (!rank) {
        return ErrorPrefix + "\"" + cardName + "\" does not start with a valid rank.";
    }

    std::optional<Suit> suit = getSuitFromChar(cardName[1]);
    if (!suit) {
        return ErrorPrefix + "\"" + cardName + "\" does not end with a valid suit.";
    }

    return Card{ *rank, *suit };
}

std::string getNameFromCard(const Card& card) {
    return { getRankChar(card.rank), getSuitChar(card.suit) };
}

bool isCardName(const std::string& name) {
    return getCardFromName(name).isValue();
}

Result<Combo> getComboFromName(const std::string& comboName) {
    static const std::string ErrorPrefix = "Error parsing combo: ";

    if (comboName.size() != 4) {
        return ErrorPrefix + "\"" + comboName + "\" is not four characters long.";
    }

    Result<Card> firstCard = getCardFromName(comboName.substr(0, 2));
    if (firstCard.isError()) {
        return ErrorPrefix + firstCard.getError();
    }

    Result<Card> secondCard = getCardFromName(comboName.substr(2, 2));
    if (secondCard.isError()) {
        return ErrorPrefix + secondCard.getError();
    }

    if (firstCard.getValue() == secondCard.getValue()) {
        return ErrorPrefix + "\"" + comboName + "\" uses the same card twice.";
    }

    return Combo{ firstCard.getValue(), secondCard.getValue() };
}

std::string getNameFromCombo(const Combo& combo) {
    return getNameFromCard(combo.first) + getNameFromCard(combo.second);
}

bool comboContainsCard(const Combo& combo, const Card& card) {
    return combo.first == card || combo.second == card;
}

std::string getStreetName(Street street) {
    switch (street) {
        case Street::Flop:
            return "flop";
        case Street::Turn:
            return "turn";
        case Street::River:
            return "river";
        default:
            assert(false);
            return "";
    }
}

Position getOpposingPosition(Position position) {
    assert(position == Position::OOP || position == Position::IP);
    return (position == Position::OOP) ? Position::IP : Position::OOP;
}

std::string getPositionName(Position position) {
    return (position == Position::OOP) ? "oop" : "ip";
}

std::optional<Position> getPositionFromName(const std::string& positionName) {
    if (positionName == "oop") {
        return Position::OOP;
    }
    else if (positionName == "ip") {
        return Position::IP;
    }
    return std::nullopt;
}
