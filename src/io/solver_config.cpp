#include "io/solver_config.hpp"

#include "game/game_types.hpp"
#include "game/range_parser.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {
const std::vector<std::string> ValidPositions = { "ip", "oop" };
const std::vector<std::string> ValidStreets = { "flop", "turn", "river" };
const std::vector<std::string> ValidActions = { "bet", "raise", "donk", "allin" };

template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            return true;
        }
        catch (const YAML::Exception&) {
            return false;
        }
    }

    if (!node.IsMap()) {
        return false;
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
Result<void> loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    if (!loadField(field, root, indices, 0)) {
        return "Error loading solve request: Could not load field " + join(indices, "::") + ".";
    }
    return {};
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    if (!loadField(field, root, indices, 0)) {
        field = defaultValue;
    }
}

bool isOneOf(const std::string& value, const std::vector<std::string>& options) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

Result<BetSizeConfig> loadBetSizeConfig(const YAML::Node& node, std::size_t index) {
    const std::string fieldPrefix = "bet-sizes[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return "Error loading solve request: " + fieldPrefix + " is not a map.";
    }

    BetSizeConfig config;
    if (!loadField(config.position, node, { "position" }, 0)) {
        return "Error loading solve request: Could not load field " + fieldPrefix + "::position.";
    }
    if (!loadField(config.street, node, { "street" }, 0)) {
        return "Error loading solve request: Could not load field " + fieldPrefix + "::street.";
    }
    if (!loadField(config.action, node, { "action" }, 0)) {
        return "Error loading solve request: Could not load field " + fieldPrefix + "::action.";
    }
    config.position = toLowerCase(config.position);
    config.street = toLowerCase(config.street);
    config.action = toLowerCase(config.action);
    loadFieldOptional(config.sizes, node, { "sizes" }, {});

    if (!isOneOf(config.position, ValidPositions)) {
        return "Error loading solve request: " + fieldPrefix + " position must be ip or oop.";
    }
    if (!isOneOf(config.street, ValidStreets)) {
        return "Error loading solve request: " + fieldPrefix + " street must be flop, turn, or river.";
    }
    if (!isOneOf(config.action, ValidActions)) {
        return "Error loading solve request: " + fieldPrefix + " action must be bet, raise, donk, or allin.";
    }
    for (int size : config.sizes) {
        if (size <= 0) {
            return "Error loading solve request: " + fieldPrefix + " sizes must be positive.";
        }
    }

    return config;
}

std::string formatNumber(float value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
}
} // namespace

Result<SolveRequest> loadSolveRequest(const YAML::Node& root) {
    SolveRequest request;

    Result<void> fieldResult = loadFieldRequired(request.pot, root, { "pot" });
    if (fieldResult.isValue()) fieldResult = loadFieldRequired(request.effectiveStack, root, { "effective-stack" });
    if (fieldResult.isValue()) fieldResult = loadFieldRequired(request.board, root, { "board" });
    if (fieldResult.isValue()) fieldResult = loadFieldRequired(request.rangeIP, root, { "ranges", "ip" });
    if (fieldResult.isValue()) fieldResult = loadFieldRequired(request.rangeOOP, root, { "ranges", "oop" });
    if (fieldResult.isError()) {
        return fieldResult.getError();
    }

    if (request.pot <= 0) {
        return "Error loading solve request: Pot must be positive.";
    }
    if (request.effectiveStack <= 0) {
        return "Error loading solve request: Effective stack must be positive.";
    }

    Result<std::vector<Card>> boardResult = buildBoardFromString(request.board);
    if (boardResult.isError()) {
        return boardResult.getError();
    }

    if (trim(request.rangeIP).empty() || trim(request.rangeOOP).empty()) {
        return "Error loading solve request: Ranges must not be empty.";
    }

    const YAML::Node betSizes = root["bet-sizes"];
    if (betSizes.IsDefined() && !betSizes.IsNull()) {
        if (!betSizes.IsSequence()) {
            return "Error loading solve request: bet-sizes must be a list.";
        }

        for (std::size_t i = 0; i < betSizes.size(); ++i) {
            Result<BetSizeConfig> configResult = loadBetSizeConfig(betSizes[i], i);
            if (configResult.isError()) {
                return configResult.getError();
            }
            request.betSizes.push_back(configResult.getValue());
        }
    }

    loadFieldOptional(request.allinThreshold, root, { "allin-threshold" }, 0.67f);
    loadFieldOptional(request.threadNum, root, { "thread-num" }, 4);
    loadFieldOptional(request.accuracy, root, { "accuracy" }, 0.5f);
    loadFieldOptional(request.maxIteration, root, { "max-iteration" }, 200);
    loadFieldOptional(request.printInterval, root, { "print-interval" }, 10);
    loadFieldOptional(request.useIsomorphism, root, { "use-isomorphism" }, true);
    loadFieldOptional(request.dumpRounds, root, { "dump-rounds" }, 2);

    if (request.allinThreshold < 0.0f || request.allinThreshold > 1.0f) {
        return "Error loading solve request: All-in threshold must be between 0 and 1.";
    }
    if (request.threadNum < 1 || request.threadNum > 32) {
        return "Error loading solve request: Thread count must be between 1 and 32.";
    }
    if (request.accuracy <= 0.0f) {
        return "Error loading solve request: Accuracy must be positive.";
    }
    if (request.maxIteration < 1) {
        return "Error loading solve request: Maximum iterations must be at least 1.";
    }
    if (request.printInterval < 1) {
        return "Error loading solve request: Print interval must be at least 1.";
    }
    if (request.dumpRounds < 0 || request.dumpRounds > 3) {
        return "Error loading solve request: Dump rounds must be between 0 and 3.";
    }

    return request;
}

Result<SolveRequest> loadSolveRequestFromFile(const std::string& filePath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return std::string{ "Error loading solve request: Could not load settings file. " } + e.what();
    }

    return loadSolveRequest(root);
}

std::string renderSolverConfig(const SolveRequest& request, const std::string& outputPath) {
    std::ostringstream config;

    config << "set_pot " << request.pot << "\n";
    config << "set_effective_stack " << request.effectiveStack << "\n";
    config << "set_board " << request.board << "\n";
    config << "set_range_ip " << request.rangeIP << "\n";
    config << "set_range_oop " << request.rangeOOP << "\n";

    for (const BetSizeConfig& betSize : request.betSizes) {
        config << "set_bet_sizes " << betSize.position << "," << betSize.street << "," << betSize.action;
        if (betSize.action != "allin") {
            for (int size : betSize.sizes) {
                config << "," << size;
            }
        }
        config << "\n";
    }

    config << "set_allin_threshold " << formatNumber(request.allinThreshold) << "\n";
    config << "build_tree\n";
    config << "set_thread_num " << request.threadNum << "\n";
    config << "set_accuracy " << formatNumber(request.accuracy) << "\n";
    config << "set_max_iteration " << request.maxIteration << "\n";
    config << "set_print_interval " << request.printInterval << "\n";
    config << "set_use_isomorphism " << (request.useIsomorphism ? 1 : 0) << "\n";
    config << "start_solve\n";
    config << "set_dump_rounds " << request.dumpRounds << "\n";
    config << "dump_result " << outputPath << "\n";

    return config.str();
}

Result<void> writeSolverConfig(const SolveRequest& request, const std::string& configPath, const std::string& outputPath) {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        return "Error writing solver config: Could not open \"" + configPath + "\" for writing.";
    }

    file << renderSolverConfig(request, outputPath);
    return {};
}
