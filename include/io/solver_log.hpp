#ifndef SOLVER_LOG_HPP
#define SOLVER_LOG_HPP

#include "util/result.hpp"

#include <string>
#include <vector>

struct ExploitabilityPoint {
    int iteration;
    float exploitability;

    bool operator==(const ExploitabilityPoint&) const = default;
};

// "Iter: <n>" lines set the current iteration, "Total exploitability <x> precent" lines emit a point.
// Points reported before any iteration line use iteration 0.
std::vector<ExploitabilityPoint> parseExploitability(const std::vector<std::string>& lines);
Result<std::vector<ExploitabilityPoint>> parseExploitabilityFromFile(const std::string& filePath);

#endif // SOLVER_LOG_HPP
