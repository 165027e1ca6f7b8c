#include "cli/trainer_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/hand_matrix.hpp"
#include "game/range_parser.hpp"
#include "io/output.hpp"
#include "io/solver_config.hpp"
#include "io/solver_log.hpp"
#include "io/tree_loader.hpp"
#include "solver/navigator.hpp"
#include "solver/node.hpp"
#include "solver/strategy.hpp"
#include "solver/tree.hpp"
#include "trainer/grading.hpp"
#include "trainer/session.hpp"
#include "util/result.hpp"
#include "util/scoped_timer.hpp"
#include "util/string_utils.hpp"

#include <array>
#include <cassert>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
bool isTreeLoaded(const TrainerContext& context) {
    return context.navigator != nullptr;
}

void printTreeNotLoadedError() {
    std::cerr << "Error: No solved tree loaded. Please run \"load <file>\" first.\n";
}

void printSessionNotStartedError() {
    std::cerr << "Error: No training hand in progress. Please run \"train <combo> <position> <pot>\" first.\n";
}

// Returns the current node's action entries, or prints why there are none
std::optional<std::vector<ActionEntry>> getCurrentActionEntries(const TrainerContext& context) {
    const SolverNode& node = context.navigator->getCurrentNode();
    if (node.getNodeType() != NodeType::Action) {
        std::cerr << "Error: The current node is a chance node. Use \"children\" to list the cards that can be dealt.\n";
        return std::nullopt;
    }

    Result<std::vector<ActionEntry>> entriesResult = getActionEntries(node.getActionNode());
    if (entriesResult.isError()) {
        std::cerr << entriesResult.getError() << "\n";
        return std::nullopt;
    }

    return entriesResult.getValue();
}

std::string formatPercent(float frequency) {
    return formatFixedPoint(frequency * 100.0, 1) + "%";
}

void printPath(const TreeNavigator& navigator) {
    std::vector<std::string> labels = navigator.getPathLabels();
    std::cout << "Path: " << (labels.empty() ? "<root>" : join(labels, " > "))
        << " (" << getStreetName(getStreetFromPath(labels)) << ")\n";
}

void printAvailableActions(const std::vector<ActionAggregate>& actions) {
    for (const ActionAggregate& action : actions) {
        std::cout << "  " << std::left << std::setw(12) << action.name << std::right << formatPercent(action.frequency) << "\n";
    }
}

bool handleLoad(TrainerContext& context, const std::string& argument) {
    Result<StrategyTree> treeResult = [&argument]() {
        ScopedTimer timer("Loading solved tree from " + argument + "...", "Finished loading tree");
        return loadStrategyTreeFromFile(argument);
    }();

    if (treeResult.isError()) {
        std::cerr << treeResult.getError() << "\n";
        return false;
    }

    if (treeResult.getValue().isEmpty()) {
        std::cerr << "Error: The solved tree is empty.\n";
        return false;
    }

    context.tree = std::make_shared<const StrategyTree>(std::move(treeResult.getValue()));
    if (context.navigator) {
        context.navigator->resetTree(context.tree);
    }
    else {
        context.navigator = std::make_unique<TreeNavigator>(context.tree);
    }
    context.session.reset();
    context.stats = SpotStats{};

    std::cout << "Loaded " << context.tree->getNumberOfNodes() << " nodes.\n";
    return true;
}

bool handleTreeInfo(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    std::cout << "Total number of nodes: " << context.tree->getNumberOfNodes() << "\n";
    std::cout << "Number of action nodes: " << context.tree->getNumberOfActionNodes() << "\n";
    std::cout << "Number of chance nodes: " << context.tree->getNumberOfChanceNodes() << "\n";
    return true;
}

bool handleChildren(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    printPath(*context.navigator);

    std::vector<NodeChild> children = nodeChildren(context.navigator->getCurrentNode());
    if (children.empty()) {
        std::cout << "No children, this is a terminal node of the dumped tree.\n";
        return true;
    }

    std::vector<std::string> labels;
    for (const NodeChild& child : children) {
        labels.push_back(child.label);
    }
    std::cout << "Children: " << join(labels, ", ") << "\n";
    return true;
}

bool handleGo(TrainerContext& context, const std::string& argument) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    if (!context.navigator->moveToChild(argument)) {
        std::cerr << "Error: The current node has no child \"" << argument << "\".\n";
        return false;
    }

    printPath(*context.navigator);
    return true;
}

bool handleBack(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    if (!context.navigator->moveBack()) {
        std::cerr << "Error: Already at the root.\n";
        return false;
    }

    printPath(*context.navigator);
    return true;
}

bool handleJump(TrainerContext& context, const std::string& argument) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    std::optional<int> depthOption = parseInt(argument);
    if (!depthOption || *depthOption < 0) {
        std::cerr << "Error: Depth must be a non-negative integer.\n";
        return false;
    }

    if (!context.navigator->jumpTo(static_cast<std::size_t>(*depthOption))) {
        std::cerr << "Error: Depth " << *depthOption << " is deeper than the current path (" << context.navigator->getDepth() << ").\n";
        return false;
    }

    printPath(*context.navigator);
    return true;
}

bool handlePath(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    printPath(*context.navigator);
    return true;
}

bool handleMatrix(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    std::optional<std::vector<ActionEntry>> entries = getCurrentActionEntries(context);
    if (!entries) {
        return false;
    }

    const ActionNode& node = context.navigator->getCurrentNode().getActionNode();
    StrategyGrid grid = aggregateCells(node.strategy, static_cast<int>(entries->size()));

    static constexpr int ColumnWidth = 9;
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            const std::optional<CellAggregate>& aggregate = grid[row][col];
            std::string cellText = getCellName(row, col) + ":";
            if (aggregate) {
                cellText += (*entries)[aggregate->dominantActionIndex].name.substr(0, 4);
            }
            else {
                cellText += "-";
            }
            std::cout << std::left << std::setw(ColumnWidth) << cellText;
        }
        std::cout << std::right << "\n";
    }
    return true;
}

bool handleActions(TrainerContext& context) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    std::optional<std::vector<ActionEntry>> entries = getCurrentActionEntries(context);
    if (!entries) {
        return false;
    }

    const ActionNode& node = context.navigator->getCurrentNode().getActionNode();
    if (node.player) {
        std::cout << "Acting player: " << getPositionName(*node.player) << "\n";
    }
    std::cout << "Range-wide frequencies over " << node.strategy.size() << " combos:\n";
    printAvailableActions(aggregateActions(node, *entries));
    return true;
}

bool handleCell(TrainerContext& context, const std::string& argument) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    std::optional<Cell> cell = getCellFromName(argument);
    if (!cell) {
        std::cerr << "Error: Invalid hand class \"" << argument << "\". Expected e.g. AA, AKs or AKo.\n";
        return false;
    }

    std::optional<std::vector<ActionEntry>> entries = getCurrentActionEntries(context);
    if (!entries) {
        return false;
    }

    const ActionNode& node = context.navigator->getCurrentNode().getActionNode();
    std::vector<ComboDetail> details = combosForCell(node.strategy, *cell);
    if (details.empty()) {
        std::cout << getCellName(*cell) << " is not in the acting player's range.\n";
        return true;
    }

    for (const ComboDetail& detail : details) {
        std::cout << detail.combo << ":";
        for (const ActionEntry& entry : *entries) {
            if (entry.index < static_cast<int>(detail.frequencies.size())) {
                std::cout << " " << entry.name << "=" << formatPercent(detail.frequencies[entry.index]);
            }
        }
        std::cout << "\n";
    }
    return true;
}

bool handleExport(TrainerContext& context, const std::string& argument) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    const SolverNode& node = context.navigator->getCurrentNode();
    if (node.getNodeType() != NodeType::Action) {
        std::cerr << "Error: Only action nodes can be exported.\n";
        return false;
    }

    Result<void> outputResult = outputNodeSummaryToJSON(node.getActionNode(), argument);
    if (outputResult.isError()) {
        std::cerr << outputResult.getError() << "\n";
        return false;
    }

    std::cout << "Wrote node summary to " << argument << ".\n";
    return true;
}

void printRange(const RangeMatrix& range) {
    for (int row = 0; row < NumRanks; ++row) {
        for (int col = 0; col < NumRanks; ++col) {
            float frequency = range.get(row, col);
            std::cout << std::setw(5) << (frequency == 0.0f ? std::string{ "." } : formatFixedPoint(frequency, 2));
        }
        std::cout << "\n";
    }
    std::cout << "Cells: " << range.getNumberOfPlayedCells() << ", combos: " << formatFixedPoint(range.getWeightedComboCount(), 1) << "\n";
    std::cout << "Notation: " << serializeRange(range) << "\n";
}

bool handleRange(TrainerContext& context, const std::string& argument) {
    context.range = parseRange(argument);
    if (context.range.isEmpty()) {
        std::cerr << "Error: No valid hands in \"" << argument << "\".\n";
        return false;
    }

    printRange(context.range);
    return true;
}

bool handleCombos(TrainerContext& context, const std::string& argument) {
    if (context.range.isEmpty()) {
        std::cerr << "Error: No range set. Please run \"range <notation>\" or \"estimate <percent>\" first.\n";
        return false;
    }

    Result<std::vector<Card>> boardResult = buildBoardFromString(argument);
    if (boardResult.isError()) {
        std::cerr << boardResult.getError() << "\n";
        return false;
    }

    std::vector<WeightedCombo> combos = getRangeCombos(context.range, boardResult.getValue());
    double totalWeight = 0.0;
    std::vector<std::string> comboNames;
    for (const WeightedCombo& combo : combos) {
        totalWeight += combo.weight;
        comboNames.push_back(combo.weight == 1.0f ? combo.combo : combo.combo + ":" + formatFixedPoint(combo.weight, 2));
    }

    std::cout << join(comboNames, ",") << "\n";
    std::cout << combos.size() << " combos remain on " << argument << " (weighted " << formatFixedPoint(totalWeight, 1) << ").\n";
    return true;
}

bool handleEstimate(TrainerContext& context, const std::string& argument) {
    std::optional<float> percentOption = parseFloat(argument);
    if (!percentOption || *percentOption < 0.0f || *percentOption > 100.0f) {
        std::cerr << "Error: Percent must be a number between 0 and 100.\n";
        return false;
    }

    context.range = parseRange(estimateRangeFromPercent(*percentOption));
    printRange(context.range);
    return true;
}

bool handleGrade(const std::string& argument) {
    std::optional<float> frequencyOption = parseFloat(argument);
    if (!frequencyOption) {
        std::cerr << "Error: Frequency must be a number.\n";
        return false;
    }

    std::cout << getGradeName(gradeDecision(*frequencyOption)) << "\n";
    return true;
}

void printSessionState(const TrainingSession& session) {
    std::cout << "History: " << (session.getActionHistory().empty() ? "-" : join(session.getActionHistory(), " ")) << "\n";

    if (session.isFinished()) {
        std::cout << "Hand finished. Score: " << formatPercent(session.getScore()) << "\n";
        return;
    }

    Result<std::vector<ActionAggregate>> actionsResult = session.getAvailableActions();
    if (actionsResult.isError()) {
        std::cerr << actionsResult.getError() << "\n";
        return;
    }

    std::cout << getStreetName(session.getStreet()) << ", " << session.getHeroCombo() << " to act. Options:";
    for (const ActionAggregate& action : actionsResult.getValue()) {
        std::cout << " " << action.name;
    }
    std::cout << "\n";
}

bool finishSession(TrainerContext& context) {
    assert(context.session != nullptr);
    if (context.session->isFinished()) {
        context.stats.addSession(context.session->getScore());
        std::cout << "Sessions: " << context.stats.getSessionCount()
            << ", average " << formatPercent(context.stats.getAverageScore())
            << ", best " << formatPercent(context.stats.getBestScore())
            << ", worst " << formatPercent(context.stats.getWorstScore()) << "\n";
    }
    return true;
}

bool handleTrain(TrainerContext& context, const std::vector<std::string>& arguments) {
    if (!isTreeLoaded(context)) {
        printTreeNotLoadedError();
        return false;
    }

    Result<Combo> comboResult = getComboFromName(arguments[0]);
    if (comboResult.isError()) {
        std::cerr << comboResult.getError() << "\n";
        return false;
    }

    std::optional<Position> heroPosition = getPositionFromName(toLowerCase(arguments[1]));
    if (!heroPosition) {
        std::cerr << "Error: Position must be oop or ip.\n";
        return false;
    }

    std::optional<int> potOption = parseInt(arguments[2]);
    if (!potOption || *potOption <= 0) {
        std::cerr << "Error: Pot must be a positive integer.\n";
        return false;
    }

    context.sessionPot = *potOption;
    context.session = std::make_unique<TrainingSession>(context.tree, getNameFromCombo(comboResult.getValue()), *heroPosition, context.sessionPot, context.nextSeed++);

    Result<void> startResult = context.session->start();
    if (startResult.isError()) {
        std::cerr << startResult.getError() << "\n";
        context.session.reset();
        return false;
    }

    std::cout << "Playing " << context.session->getHeroCombo() << " as " << getPositionName(*heroPosition)
        << " against " << getPositionName(getOpposingPosition(*heroPosition)) << ".\n";
    printSessionState(*context.session);
    return finishSession(context);
}

bool handleAct(TrainerContext& context, const std::string& argument) {
    if (context.session == nullptr || context.session->isFinished()) {
        printSessionNotStartedError();
        return false;
    }

    // Bets are not tracked, every decision is weighted by the starting pot
    Result<DecisionRecord> recordResult = context.session->submitAction(argument, context.sessionPot);
    if (recordResult.isError()) {
        std::cerr << recordResult.getError() << "\n";
        return false;
    }

    const DecisionRecord& record = recordResult.getValue();
    std::cout << getGradeName(record.grade) << ": the solver plays " << record.chosenAction << " " << formatPercent(record.frequency) << " of the time.\n";
    printAvailableActions(record.allActions);

    printSessionState(*context.session);
    return finishSession(context);
}

bool handleSession(TrainerContext& context) {
    if (context.session == nullptr) {
        printSessionNotStartedError();
        return false;
    }

    const TrainingSession& session = *context.session;
    std::cout << "Hero: " << session.getHeroCombo() << " (" << getPositionName(session.getHeroPosition()) << ")\n";
    if (!session.getDealtCards().empty()) {
        std::cout << "Dealt: " << join(session.getDealtCards(), " ") << "\n";
    }

    std::vector<float> frequencies;
    for (const DecisionRecord& decision : session.getDecisions()) {
        frequencies.push_back(decision.frequency);
        std::cout << "  " << getStreetName(decision.street) << " " << decision.chosenAction
            << " " << formatPercent(decision.frequency) << " " << getGradeName(decision.grade) << "\n";
    }

    std::array<int, NumDecisionGrades> gradeCounts = countGrades(frequencies);
    for (int i = 0; i < NumDecisionGrades; ++i) {
        if (gradeCounts[i] > 0) {
            std::cout << getGradeName(static_cast<DecisionGrade>(i)) << ": " << gradeCounts[i] << "\n";
        }
    }

    printPath(session.getNavigator());
    printSessionState(session);
    return true;
}

bool handleConfig(const std::vector<std::string>& arguments) {
    Result<SolveRequest> requestResult = loadSolveRequestFromFile(arguments[0]);
    if (requestResult.isError()) {
        std::cerr << requestResult.getError() << "\n";
        return false;
    }

    const std::string& scriptPath = arguments[1];
    const std::string& dumpPath = arguments[2];
    Result<void> writeResult = writeSolverConfig(requestResult.getValue(), scriptPath, dumpPath);
    if (writeResult.isError()) {
        std::cerr << writeResult.getError() << "\n";
        return false;
    }

    std::cout << renderSolverConfig(requestResult.getValue(), dumpPath);
    std::cout << "Wrote solver script to " << scriptPath << ".\n";
    return true;
}

bool handleLog(const std::string& argument) {
    Result<std::vector<ExploitabilityPoint>> pointsResult = parseExploitabilityFromFile(argument);
    if (pointsResult.isError()) {
        std::cerr << pointsResult.getError() << "\n";
        return false;
    }

    const std::vector<ExploitabilityPoint>& points = pointsResult.getValue();
    if (points.empty()) {
        std::cout << "No exploitability reports found.\n";
        return true;
    }

    for (const ExploitabilityPoint& point : points) {
        std::cout << "Iteration " << point.iteration << ": " << point.exploitability << "%\n";
    }
    return true;
}

} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, TrainerContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "load",
        "file",
        "Loads a solved game tree from a solver JSON dump.",
        [&context](const std::string& argument) { return handleLoad(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "tree",
        "Prints the number of nodes in the loaded tree.",
        [&context]() { return handleTreeInfo(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "children",
        "Lists the actions or cards that lead out of the current node.",
        [&context]() { return handleChildren(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "go",
        "label",
        "Moves to the child with the given action or card label.",
        [&context](const std::string& argument) { return handleGo(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "back",
        "Moves back to the parent node.",
        [&context]() { return handleBack(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "jump",
        "depth",
        "Truncates the current path to the given depth. 0 returns to the root.",
        [&context](const std::string& argument) { return handleJump(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "path",
        "Prints the path from the root to the current node.",
        [&context]() { return handlePath(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "matrix",
        "Prints the dominant action of every hand class at the current node.",
        [&context]() { return handleMatrix(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "actions",
        "Prints the range-wide frequency of every action at the current node.",
        [&context]() { return handleActions(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "cell",
        "hand",
        "Prints the strategy of every combo in a hand class (e.g. AKs) at the current node.",
        [&context](const std::string& argument) { return handleCell(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "export",
        "file",
        "Writes a JSON summary of the current action node.",
        [&context](const std::string& argument) { return handleExport(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "range",
        "notation",
        "Sets the working range from comma-separated range notation (e.g. QQ-AA,AKs,AJo:0.5).",
        [&context](const std::string& argument) { return handleRange(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "combos",
        "board",
        "Lists the combos of the working range that do not conflict with a board (e.g. Qs,Jh,2h).",
        [&context](const std::string& argument) { return handleCombos(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "estimate",
        "percent",
        "Sets the working range to a typical opening range for a VPIP percentage.",
        [&context](const std::string& argument) { return handleEstimate(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "grade",
        "frequency",
        "Prints the grade for a decision the solver takes with the given frequency (0-1).",
        [](const std::string& argument) { return handleGrade(argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "train",
        std::vector<std::string>{ "combo", "position", "pot" },
        "Starts a training hand with a hero combo (e.g. AsKd) in position oop or ip.",
        [&context](const std::vector<std::string>& arguments) { return handleTrain(context, arguments); }
    );

    allSuccess &= dispatcher.registerCommand(
        "act",
        "action",
        "Submits the hero's action in the current training hand.",
        [&context](const std::string& argument) { return handleAct(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "session",
        "Prints the decisions and grades of the current training hand.",
        [&context]() { return handleSession(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "config",
        std::vector<std::string>{ "request.yml", "script-path", "dump-path" },
        "Writes a YAML solve request as a solver console script that dumps its result to dump-path.",
        [](const std::vector<std::string>& arguments) { return handleConfig(arguments); }
    );

    allSuccess &= dispatcher.registerCommand(
        "log",
        "file",
        "Prints the exploitability reported at each iteration of a solver log.",
        [](const std::string& argument) { return handleLog(argument); }
    );

    return allSuccess;
}
