#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace servherd::process {

/// All transitive children of `root`, breadth first (parents before their children)
std::vector<pid_t> listDescendants(pid_t root);

/**
 * Signals every descendant deepest first, then the root. ESRCH is ignored; other failures
 * are logged and the sweep continues.
 */
void killProcessTree(pid_t root, int signal);

bool isProcessAlive(pid_t pid);

/// Polls `exited` until it returns true or the timeout elapses
using ExitWaiter = std::function<bool(std::chrono::milliseconds)>;

/**
 * SIGTERM to the whole tree, up to `grace` for the root to exit, then SIGKILL to whatever
 * is left. Returns true when the root exited within the grace period.
 */
bool terminateProcessTree(pid_t root, std::chrono::milliseconds grace, const ExitWaiter& waiter);

/// Waiter for processes that the caller does not reap itself
bool waitUntilGone(pid_t pid, std::chrono::milliseconds timeout);

struct ProcessStats {
    double cpuPercent{0.0};
    std::uint64_t memoryBytes{0};
};

/// Reads /proc/<pid>; cpu is the lifetime average since the process started
std::optional<ProcessStats> readProcessStats(pid_t pid);

} // namespace servherd::process
