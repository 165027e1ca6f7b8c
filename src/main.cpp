#include "cli/cli_dispatcher.hpp"
#include "cli/trainer_commands.hpp"

#include <random>

int main() {
    CliDispatcher dispatcher("GtoTrainer", Version{ .major = 1, .minor = 0, .patch = 0 });
    TrainerContext context{ .sessionPot = 0, .nextSeed = std::random_device{}() };
    registerAllCommands(dispatcher, context);

    dispatcher.run();

    return 0;
}
