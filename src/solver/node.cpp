#include "solver/node.hpp"

#include <cstddef>
#include <string>
#include <vector>

void SolverStrategy::setComboFrequencies(const std::string& combo, const std::vector<float>& frequencies) {
    auto it = m_comboIndices.find(combo);
    if (it != m_comboIndices.end()) {
        m_combos[it->second].frequencies = frequencies;
        return;
    }

    m_comboIndices.insert({ combo, m_combos.size() });
    m_combos.push_back({ combo, frequencies });
}

const std::vector<ComboStrategy>& SolverStrategy::getCombos() const {
    return m_combos;
}

const std::vector<float>* SolverStrategy::findCombo(const std::string& combo) const {
    auto it = m_comboIndices.find(combo);
    if (it == m_comboIndices.end()) {
        return nullptr;
    }
    return &m_combos[it->second].frequencies;
}

bool SolverStrategy::containsCombo(const std::string& combo) const {
    return m_comboIndices.find(combo) != m_comboIndices.end();
}

std::size_t SolverStrategy::getFirstVectorLength() const {
    return m_combos.empty() ? 0 : m_combos.front().frequencies.size();
}

std::size_t SolverStrategy::size() const {
    return m_combos.size();
}

bool SolverStrategy::empty() const {
    return m_combos.empty();
}
