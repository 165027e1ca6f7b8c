#include "io/solver_log.hpp"

#include "util/result.hpp"

#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

std::vector<ExploitabilityPoint> parseExploitability(const std::vector<std::string>& lines) {
    static const std::regex IterationPattern(R"(Iter:\s*(\d+))");
    static const std::regex ExploitabilityPattern(R"(Total exploitability\s+([\d.eE+\-]+)\s+precent)", std::regex::icase);

    std::vector<ExploitabilityPoint> points;
    int currentIteration = 0;

    for (const std::string& line : lines) {
        std::smatch match;
        if (std::regex_search(line, match, IterationPattern)) {
            try {
                currentIteration = std::stoi(match[1].str());
            }
            catch (const std::out_of_range&) {
                // Keeps the previous iteration
            }
            continue;
        }

        if (std::regex_search(line, match, ExploitabilityPattern)) {
            try {
                points.push_back({ currentIteration, std::stof(match[1].str()) });
            }
            catch (const std::logic_error&) {
                // Matched characters that do not form a number, e.g. "--"
            }
        }
    }

    return points;
}

Result<std::vector<ExploitabilityPoint>> parseExploitabilityFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return "Error reading solver log: Could not open \"" + filePath + "\".";
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    return parseExploitability(lines);
}
