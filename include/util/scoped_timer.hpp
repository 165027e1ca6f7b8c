#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <ostream>
#include <string>

// Prints startMessage on construction and "<endMessage> in <seconds>s." on destruction
class ScopedTimer {
public:
    ScopedTimer(const std::string& startMessage, const std::string& endMessage, std::ostream& output);
    ScopedTimer(const std::string& startMessage, const std::string& endMessage);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::chrono::steady_clock::time_point m_startTime;
    std::string m_endMessage;
    std::ostream& m_output;
};

#endif // SCOPED_TIMER_HPP
