#ifndef SESSION_HPP
#define SESSION_HPP

#include "game/game_types.hpp"
#include "solver/navigator.hpp"
#include "solver/strategy.hpp"
#include "solver/tree.hpp"
#include "trainer/grading.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

struct DecisionRecord {
    std::vector<std::string> nodePath;
    std::string chosenAction;
    float frequency;
    std::vector<ActionAggregate> allActions;
    float potWeight;
    Street street;
    DecisionGrade grade;
};

// Plays one hand of a solved spot as the hero. Chance nodes and villain nodes are
// resolved automatically; the hero is graded against the solved frequency of their combo.
class TrainingSession {
public:
    TrainingSession(std::shared_ptr<const StrategyTree> tree, const std::string& heroCombo, Position heroPosition, int initialPot, std::uint32_t seed);

    // Advances from the root to the hero's first decision
    Result<void> start();
    Result<DecisionRecord> submitAction(const std::string& actionName, int potAtDecision);

    bool isFinished() const;
    Result<std::vector<ActionAggregate>> getAvailableActions() const;

    const std::string& getHeroCombo() const;
    Position getHeroPosition() const;
    const TreeNavigator& getNavigator() const;
    const std::vector<DecisionRecord>& getDecisions() const;
    const std::vector<std::string>& getActionHistory() const;
    const std::vector<std::string>& getDealtCards() const;
    Street getStreet() const;
    float getScore() const;

private:
    Result<void> advanceToHero();
    std::vector<std::string> getDealableCards(const ChanceNode& node) const;
    bool isVillainNode(const ActionNode& node) const;
    std::string sampleVillainAction(const ActionNode& node, const std::vector<ActionEntry>& entries);

    TreeNavigator m_navigator;
    std::string m_heroCombo;
    Position m_heroPosition;
    int m_initialPot;
    std::mt19937 m_rng;
    bool m_isFinished;
    std::vector<DecisionRecord> m_decisions;
    std::vector<std::string> m_actionHistory;
    std::vector<std::string> m_dealtCards;
};

#endif // SESSION_HPP
