#ifndef GRADING_HPP
#define GRADING_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class DecisionGrade : std::uint8_t {
    Best,
    Correct,
    Inaccuracy,
    Wrong,
    Blunder
};

constexpr int NumDecisionGrades = 5;

// Each band includes its lower bound
DecisionGrade gradeDecision(float frequency);
std::string getGradeName(DecisionGrade grade);

// Mean of the observed frequencies, not of the grades. 0 for an empty session.
float computeSessionScore(const std::vector<float>& frequencies);
std::array<int, NumDecisionGrades> countGrades(const std::vector<float>& frequencies);

// Running score statistics for one spot across sessions
class SpotStats {
public:
    SpotStats();

    // Scores of 0 or less are ignored
    void addSession(float score);

    int getSessionCount() const;
    float getAverageScore() const;
    float getBestScore() const;
    float getWorstScore() const;

private:
    int m_sessionCount;
    float m_averageScore;
    float m_bestScore;
    float m_worstScore;
};

#endif // GRADING_HPP
