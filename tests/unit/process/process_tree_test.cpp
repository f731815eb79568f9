/**
 * Tests for process tree handling against real children spawned through /bin/sh.
 */

#include <gtest/gtest.h>
#include <servherd/process/process_tree.h>
#include <servherd/process/spawn.h>

#include "temp_dir_scope.hpp"

#include <chrono>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace servherd;
using namespace servherd::process;
using namespace std::chrono_literals;
using servherd::test_support::TempDirScope;

namespace {

process::StartSpec shell(const std::string& script, const std::string& cwd) {
    process::StartSpec spec;
    spec.name = "servherd-test";
    spec.script = "sh";
    spec.args = {"-c", script};
    spec.cwd = cwd;
    return spec;
}

// Waits until `root` has at least one descendant
std::vector<pid_t> waitForDescendants(pid_t root) {
    for (int i = 0; i < 200; ++i) {
        auto d = listDescendants(root);
        if (!d.empty())
            return d;
        std::this_thread::sleep_for(10ms);
    }
    return {};
}

ExitWaiter reaper(pid_t pid) {
    return [pid](std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        do {
            int status = 0;
            if (::waitpid(pid, &status, WNOHANG) == pid)
                return true;
            std::this_thread::sleep_for(10ms);
        } while (std::chrono::steady_clock::now() < deadline);
        return false;
    };
}

void closeFds(const SpawnedChild& c) {
    ::close(c.stdoutFd);
    ::close(c.stderrFd);
}

} // namespace

TEST(ProcessTreeTest, SpawnReportsMissingExecutable) {
    auto tmp = TempDirScope::unique_under("servherd-tree");
    process::StartSpec spec;
    spec.name = "servherd-missing";
    spec.script = "servherd-definitely-not-a-command";
    spec.cwd = tmp.path().string();
    auto r = spawnChild(spec, false);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BackendStartFailed);
}

TEST(ProcessTreeTest, SpawnReportsMissingDirectory) {
    auto r = spawnChild(shell("true", "/nonexistent/servherd/dir"), false);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BackendStartFailed);
}

TEST(ProcessTreeTest, ExitCodeFromStatus) {
    auto tmp = TempDirScope::unique_under("servherd-tree");
    auto spawned = spawnChild(shell("exit 3", tmp.path().string()), false);
    ASSERT_TRUE(spawned) << spawned.error().message;
    int status = 0;
    ASSERT_EQ(::waitpid(spawned.value().pid, &status, 0), spawned.value().pid);
    EXPECT_EQ(exitCodeFromStatus(status), 3);
    closeFds(spawned.value());
}

TEST(ProcessTreeTest, ListsGrandchildren) {
    auto tmp = TempDirScope::unique_under("servherd-tree");
    auto spawned = spawnChild(shell("sleep 30 & wait", tmp.path().string()), false);
    ASSERT_TRUE(spawned) << spawned.error().message;
    const pid_t root = spawned.value().pid;

    auto descendants = waitForDescendants(root);
    ASSERT_FALSE(descendants.empty());
    for (pid_t pid : descendants) {
        EXPECT_TRUE(isProcessAlive(pid));
    }

    terminateProcessTree(root, 2s, reaper(root));
    closeFds(spawned.value());
}

TEST(ProcessTreeTest, TerminateKillsWholeTree) {
    auto tmp = TempDirScope::unique_under("servherd-tree");
    auto spawned = spawnChild(shell("sleep 30 & sleep 30 & wait", tmp.path().string()), false);
    ASSERT_TRUE(spawned) << spawned.error().message;
    const pid_t root = spawned.value().pid;

    auto descendants = waitForDescendants(root);
    ASSERT_FALSE(descendants.empty());

    terminateProcessTree(root, 2s, reaper(root));
    for (pid_t pid : descendants) {
        EXPECT_TRUE(waitUntilGone(pid, 2s)) << "descendant " << pid << " survived";
    }
    closeFds(spawned.value());
}

TEST(ProcessTreeTest, StubbornRootGetsKilled) {
    auto tmp = TempDirScope::unique_under("servherd-tree");
    auto spawned =
        spawnChild(shell("trap '' TERM; while true; do sleep 0.1; done", tmp.path().string()),
                   false);
    ASSERT_TRUE(spawned) << spawned.error().message;
    const pid_t root = spawned.value().pid;
    std::this_thread::sleep_for(100ms);

    EXPECT_FALSE(terminateProcessTree(root, 300ms, reaper(root)));
    EXPECT_TRUE(waitUntilGone(root, 2s));
    closeFds(spawned.value());
}

TEST(ProcessTreeTest, DeadPidIsNotAlive) {
    EXPECT_FALSE(isProcessAlive(-1));
    EXPECT_FALSE(isProcessAlive(0));
    EXPECT_TRUE(isProcessAlive(::getpid()));
}

TEST(ProcessTreeTest, StatsForSelf) {
    auto stats = readProcessStats(::getpid());
    ASSERT_TRUE(stats.has_value());
    EXPECT_GT(stats->memoryBytes, 0u);
}
