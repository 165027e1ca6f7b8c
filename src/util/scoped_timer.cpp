#include "util/scoped_timer.hpp"

#include "util/string_utils.hpp"

#include <chrono>
#include <iostream>
#include <ostream>
#include <string>

ScopedTimer::ScopedTimer(const std::string& startMessage, const std::string& endMessage, std::ostream& output) : m_endMessage{ endMessage }, m_output{ output } {
    if (!startMessage.empty()) {
        m_output << startMessage << "\n" << std::flush;
    }

    m_startTime = std::chrono::steady_clock::now();
}

ScopedTimer::ScopedTimer(const std::string& startMessage, const std::string& endMessage) : ScopedTimer(startMessage, endMessage, std::cout) {}

ScopedTimer::~ScopedTimer() {
    auto endTime = std::chrono::steady_clock::now();
    double secondsElapsed = std::chrono::duration<double>(endTime - m_startTime).count();
    m_output << m_endMessage << " in " << formatFixedPoint(secondsElapsed, 3) << "s.\n";
}
