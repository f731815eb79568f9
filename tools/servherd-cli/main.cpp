#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <servherd/cli/servherd_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Diagnostics go to stderr so --json output stays parseable
        auto logger = spdlog::stderr_logger_mt("servherd");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        servherd::cli::ServherdCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
