#ifndef TRAINER_COMMANDS_HPP
#define TRAINER_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "game/hand_matrix.hpp"
#include "solver/navigator.hpp"
#include "solver/tree.hpp"
#include "trainer/grading.hpp"
#include "trainer/session.hpp"

#include <cstdint>
#include <memory>

struct TrainerContext {
    std::shared_ptr<const StrategyTree> tree;
    std::unique_ptr<TreeNavigator> navigator;
    std::unique_ptr<TrainingSession> session;
    RangeMatrix range;
    SpotStats stats;
    int sessionPot;
    std::uint32_t nextSeed;
};

bool registerAllCommands(CliDispatcher& dispatcher, TrainerContext& context);

#endif // TRAINER_COMMANDS_HPP
