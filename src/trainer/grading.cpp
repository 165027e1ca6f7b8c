#include "trainer/grading.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <string>
#include <vector>

DecisionGrade gradeDecision(float frequency) {
    if (frequency >= 0.85f) return DecisionGrade::Best;
    if (frequency >= 0.60f) return DecisionGrade::Correct;
    if (frequency >= 0.30f) return DecisionGrade::Inaccuracy;
    if (frequency >= 0.10f) return DecisionGrade::Wrong;
    return DecisionGrade::Blunder;
}

std::string getGradeName(DecisionGrade grade) {
    switch (grade) {
        case DecisionGrade::Best:
            return "Best Move";
        case DecisionGrade::Correct:
            return "Correct";
        case DecisionGrade::Inaccuracy:
            return "Inaccuracy";
        case DecisionGrade::Wrong:
            return "Wrong";
        case DecisionGrade::Blunder:
            return "Blunder";
        default:
            assert(false);
            return "";
    }
}

float computeSessionScore(const std::vector<float>& frequencies) {
    if (frequencies.empty()) {
        return 0.0f;
    }

    double total = 0.0;
    for (float frequency : frequencies) {
        total += frequency;
    }
    return static_cast<float>(total / frequencies.size());
}

std::array<int, NumDecisionGrades> countGrades(const std::vector<float>& frequencies) {
    std::array<int, NumDecisionGrades> counts{};
    for (float frequency : frequencies) {
        ++counts[static_cast<int>(gradeDecision(frequency))];
    }
    return counts;
}

SpotStats::SpotStats() : m_sessionCount{ 0 }, m_averageScore{ 0.0f }, m_bestScore{ 0.0f }, m_worstScore{ 0.0f } {}

void SpotStats::addSession(float score) {
    // Hands that end before the hero acts score 0 and are not counted
    if (score <= 0.0f) {
        return;
    }

    if (m_sessionCount == 0) {
        m_bestScore = score;
        m_worstScore = score;
    }
    else {
        m_bestScore = std::max(m_bestScore, score);
        m_worstScore = std::min(m_worstScore, score);
    }

    m_averageScore = (m_averageScore * m_sessionCount + score) / (m_sessionCount + 1);
    ++m_sessionCount;
}

int SpotStats::getSessionCount() const {
    return m_sessionCount;
}

float SpotStats::getAverageScore() const {
    return m_averageScore;
}

float SpotStats::getBestScore() const {
    return m_bestScore;
}

float SpotStats::getWorstScore() const {
    return m_worstScore;
}
