#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <thread>

namespace servherd::process {

/**
 * @brief Copies a child's output pipe into a log file, one "<ISO-8601>: <text>" line per line
 *
 * When a forward descriptor is given each line is also written there as "[prefix] <text>".
 * The pump owns the read end of the pipe and closes it on destruction.
 */
class OutputPump {
public:
    struct Options {
        int readFd{-1};
        std::filesystem::path logPath;
        std::optional<int> forwardFd;
        std::string prefix;
    };

    explicit OutputPump(Options options);
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    /// Joins the reader thread after draining what the pipe already holds
    void stop();

    const std::filesystem::path& logPath() const { return options_.logPath; }

private:
    void run(std::stop_token token);
    void emitLine(const std::string& line);

    Options options_;
    int logFd_{-1};
    std::jthread thread_;
};

} // namespace servherd::process
