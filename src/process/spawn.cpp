#include <servherd/process/spawn.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace servherd::process {

namespace {

void closePair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Runs in the forked child; never returns
[[noreturn]] void execChild(const StartSpec& spec, bool newSession, int outFd, int errFd,
                            int statusFd, char* const* argv) {
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (newSession) {
        (void)::setsid();
    }

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        if (devnull > STDERR_FILENO)
            ::close(devnull);
    }
    ::dup2(outFd, STDOUT_FILENO);
    ::dup2(errFd, STDERR_FILENO);
    ::close(outFd);
    ::close(errFd);

    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) < 0) {
        int e = errno;
        (void)::write(statusFd, &e, sizeof(e));
        ::_exit(127);
    }

    execvp(argv[0], argv);

    int e = errno;
    (void)::write(statusFd, &e, sizeof(e));
    ::_exit(127);
}

} // namespace

int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

Result<SpawnedChild> spawnChild(const StartSpec& spec, bool newSession) {
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};

    if (::pipe2(outPipe, O_CLOEXEC) < 0 || ::pipe2(errPipe, O_CLOEXEC) < 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) < 0) {
        int e = errno;
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        return Error{ErrorCode::BackendStartFailed,
                     std::string{"Failed to create pipes: "} + std::strerror(e)};
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argStore;
    argStore.reserve(spec.args.size() + 1);
    argStore.push_back(spec.script);
    argStore.insert(argStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        return Error{ErrorCode::BackendStartFailed,
                     std::string{"fork() failed: "} + std::strerror(e)};
    }

    if (pid == 0) {
        for (const auto& [key, value] : spec.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        ::close(statusPipe[0]);
        execChild(spec, newSession, outPipe[1], errPipe[1], statusPipe[1], argv.data());
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(statusPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        (void)::waitpid(pid, &status, 0);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        return Error{ErrorCode::BackendStartFailed,
                     "Failed to launch \"" + spec.script + "\" in " + spec.cwd + ": " +
                         std::strerror(childErrno)};
    }

    spdlog::info("Spawned {} (pid={}) for {}", spec.script, pid, spec.name);
    return SpawnedChild{pid, outPipe[0], errPipe[0]};
}

} // namespace servherd::process
