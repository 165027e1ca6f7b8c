#include "trainer/session.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "solver/navigator.hpp"
#include "solver/node.hpp"
#include "solver/strategy.hpp"
#include "solver/tree.hpp"
#include "trainer/grading.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

TrainingSession::TrainingSession(std::shared_ptr<const StrategyTree> tree, const std::string& heroCombo, Position heroPosition, int initialPot, std::uint32_t seed)
    : m_navigator{ std::move(tree) }, m_heroCombo{ heroCombo }, m_heroPosition{ heroPosition }, m_initialPot{ initialPot }, m_rng{ seed }, m_isFinished{ false } {}

Result<void> TrainingSession::start() {
    m_navigator.jumpTo(0);
    m_isFinished = false;
    m_decisions.clear();
    m_actionHistory.clear();
    m_dealtCards.clear();
    return advanceToHero();
}

Result<DecisionRecord> TrainingSession::submitAction(const std::string& actionName, int potAtDecision) {
    if (m_isFinished) {
        return "Error submitting action: The hand is already finished.";
    }

    const SolverNode& node = m_navigator.getCurrentNode();
    if (node.getNodeType() != NodeType::Action) {
        return "Error submitting action: The current node is not a decision.";
    }

    const ActionNode& actionNode = node.getActionNode();
    Result<std::vector<ActionEntry>> entriesResult = getActionEntries(actionNode);
    if (entriesResult.isError()) {
        return entriesResult.getError();
    }

    const std::vector<ActionEntry>& entries = entriesResult.getValue();
    bool isValidAction = std::any_of(entries.begin(), entries.end(), [&actionName](const ActionEntry& entry) {
        return entry.name == actionName;
    });
    if (!isValidAction) {
        return "Error submitting action: \"" + actionName + "\" is not available at this node.";
    }

    std::vector<std::string> nodePath = m_navigator.getPathLabels();
    float frequency = getDecisionFrequency(actionNode, entries, m_heroCombo, actionName);

    DecisionRecord record = {
        .nodePath = nodePath,
        .chosenAction = actionName,
        .frequency = frequency,
        .allActions = getComboActionFrequencies(actionNode, entries, m_heroCombo),
        .potWeight = static_cast<float>(potAtDecision) / static_cast<float>(std::max(m_initialPot, 1)),
        .street = getStreetFromPath(nodePath),
        .grade = gradeDecision(frequency)
    };
    m_decisions.push_back(record);
    m_actionHistory.push_back("H:" + actionName);

    // Actions without a subtree (fold, or the end of the dumped tree) finish the hand
    if (!m_navigator.moveToChild(actionName)) {
        m_isFinished = true;
        return record;
    }

    Result<void> advanceResult = advanceToHero();
    if (advanceResult.isError()) {
        return advanceResult.getError();
    }

    return record;
}

bool TrainingSession::isFinished() const {
    return m_isFinished;
}

Result<std::vector<ActionAggregate>> TrainingSession::getAvailableActions() const {
    const SolverNode& node = m_navigator.getCurrentNode();
    if (m_isFinished || node.getNodeType() != NodeType::Action) {
        return std::vector<ActionAggregate>{};
    }

    const ActionNode& actionNode = node.getActionNode();
    Result<std::vector<ActionEntry>> entriesResult = getActionEntries(actionNode);
    if (entriesResult.isError()) {
        return entriesResult.getError();
    }

    return getComboActionFrequencies(actionNode, entriesResult.getValue(), m_heroCombo);
}

const std::string& TrainingSession::getHeroCombo() const {
    return m_heroCombo;
}

Position TrainingSession::getHeroPosition() const {
    return m_heroPosition;
}

const TreeNavigator& TrainingSession::getNavigator() const {
    return m_navigator;
}

const std::vector<DecisionRecord>& TrainingSession::getDecisions() const {
    return m_decisions;
}

const std::vector<std::string>& TrainingSession::getActionHistory() const {
    return m_actionHistory;
}

const std::vector<std::string>& TrainingSession::getDealtCards() const {
    return m_dealtCards;
}

Street TrainingSession::getStreet() const {
    return getStreetFromPath(m_navigator.getPathLabels());
}

float TrainingSession::getScore() const {
    std::vector<float> frequencies;
    for (const DecisionRecord& decision : m_decisions) {
        frequencies.push_back(decision.frequency);
    }
    return computeSessionScore(frequencies);
}

Result<void> TrainingSession::advanceToHero() {
    while (!m_isFinished) {
        const SolverNode& node = m_navigator.getCurrentNode();

        if (node.getNodeType() == NodeType::Chance) {
            std::vector<std::string> dealCards = getDealableCards(node.getChanceNode());
            if (dealCards.empty()) {
                m_isFinished = true;
                break;
            }

            std::uniform_int_distribution<std::size_t> cardDistribution(0, dealCards.size() - 1);
            std::string card = dealCards[cardDistribution(m_rng)];
            m_navigator.moveToChild(card);
            m_dealtCards.push_back(card);
            m_actionHistory.push_back("[" + card + "]");
            continue;
        }

        const ActionNode& actionNode = node.getActionNode();
        Result<std::vector<ActionEntry>> entriesResult = getActionEntries(actionNode);
        if (entriesResult.isError()) {
            return entriesResult.getError();
        }

        const std::vector<ActionEntry>& entries = entriesResult.getValue();
        if (entries.empty()) {
            m_isFinished = true;
            break;
        }

        if (!isVillainNode(actionNode)) {
            break;
        }

        std::string villainAction = sampleVillainAction(actionNode, entries);
        m_actionHistory.push_back("V:" + villainAction);
        if (!m_navigator.moveToChild(villainAction)) {
            m_isFinished = true;
        }
    }

    return {};
}

// The solver lists every card left in the deck, including the hero's hole cards
std::vector<std::string> TrainingSession::getDealableCards(const ChanceNode& node) const {
    Result<Combo> heroCombo = getComboFromName(m_heroCombo);

    std::vector<std::string> cards;
    for (const NodeChild& child : node.dealCards) {
        Result<Card> card = getCardFromName(child.label);
        if (heroCombo.isValue() && card.isValue() && comboContainsCard(heroCombo.getValue(), card.getValue())) {
            continue;
        }
        cards.push_back(child.label);
    }
    return cards;
}

bool TrainingSession::isVillainNode(const ActionNode& node) const {
    if (node.player) {
        return *node.player != m_heroPosition;
    }

    if (node.strategy.empty()) {
        return false;
    }

    // Exact lookup only. An isomorphic match could come from the villain's range.
    return !node.strategy.containsCombo(m_heroCombo);
}

std::string TrainingSession::sampleVillainAction(const ActionNode& node, const std::vector<ActionEntry>& entries) {
    std::vector<ActionAggregate> aggregates = aggregateActions(node, entries);

    std::uniform_real_distribution<float> distribution(0.0f, 1.0f);
    float sample = distribution(m_rng);

    float cumulative = 0.0f;
    for (const ActionAggregate& aggregate : aggregates) {
        cumulative += aggregate.frequency;
        if (sample < cumulative) {
            return aggregate.name;
        }
    }
    return aggregates.back().name;
}
