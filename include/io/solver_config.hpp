#ifndef SOLVER_CONFIG_HPP
#define SOLVER_CONFIG_HPP

#include "util/result.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

struct BetSizeConfig {
    std::string position;
    std::string street;
    std::string action;

    // Percentages of the pot. Ignored for allin.
    std::vector<int> sizes;
};

struct SolveRequest {
    int pot;
    int effectiveStack;
    std::string board;
    std::string rangeIP;
    std::string rangeOOP;
    std::vector<BetSizeConfig> betSizes;
    float allinThreshold;
    int threadNum;
    float accuracy;
    int maxIteration;
    int printInterval;
    bool useIsomorphism;
    int dumpRounds;
};

Result<SolveRequest> loadSolveRequest(const YAML::Node& root);
Result<SolveRequest> loadSolveRequestFromFile(const std::string& filePath);

// Console script for the external solver, one command per line
std::string renderSolverConfig(const SolveRequest& request, const std::string& outputPath);
Result<void> writeSolverConfig(const SolveRequest& request, const std::string& configPath, const std::string& outputPath);

#endif // SOLVER_CONFIG_HPP
