#include <servherd/cli/command_registry.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

void CommandRegistry::registerAllCommands(ServherdCLI* cli) {
    cli->registerCommand(createStartCommand());
    cli->registerCommand(createStopCommand());
    cli->registerCommand(createRestartCommand());
    cli->registerCommand(createRemoveCommand());
    cli->registerCommand(createListCommand());
    cli->registerCommand(createInfoCommand());
    cli->registerCommand(createLogsCommand());
    cli->registerCommand(createRefreshCommand());
    cli->registerCommand(createConfigCommand());
}

} // namespace servherd::cli
