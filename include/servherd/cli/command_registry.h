#pragma once

#include <memory>
#include <servherd/cli/command.h>

namespace servherd::cli {

class ServherdCLI;

std::unique_ptr<ICommand> createStartCommand();
std::unique_ptr<ICommand> createStopCommand();
std::unique_ptr<ICommand> createRestartCommand();
std::unique_ptr<ICommand> createRemoveCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createInfoCommand();
std::unique_ptr<ICommand> createLogsCommand();
std::unique_ptr<ICommand> createRefreshCommand();
std::unique_ptr<ICommand> createConfigCommand();

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(ServherdCLI* cli);
};

} // namespace servherd::cli
