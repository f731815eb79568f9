#pragma once

#include <sys/types.h>

#include <servherd/core/types.h>
#include <servherd/process/process_backend.h>

namespace servherd::process {

struct SpawnedChild {
    pid_t pid{-1};
    int stdoutFd{-1}; ///< read end, owned by the caller
    int stderrFd{-1};
};

/**
 * fork/exec of `spec.script` with `spec.args` in `spec.cwd`. The child inherits the caller's
 * environment overlaid with `spec.env`, gets a default signal mask, and when `newSession`
 * is set leads its own session so that it outlives the caller's terminal.
 *
 * exec failures are reported back through a close-on-exec pipe as BackendStartFailed.
 */
Result<SpawnedChild> spawnChild(const StartSpec& spec, bool newSession);

/// Converts a waitpid() status into an exit code; signals map to 128 + signo
int exitCodeFromStatus(int status);

} // namespace servherd::process
