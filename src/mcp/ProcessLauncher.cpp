#include "mcp/ProcessLauncher.h"
#include "mcp/CommandResolver.h"
#include "mcp/MCPError.h"
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

Environment mergedEnvironment(const Environment& overlay) {
    Environment merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv = *entry;
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overlay) {
        merged[key] = value;
    }
    return merged;
}

std::string errnoText(int err) {
    return std::strerror(err);
}
} // namespace

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : childPid(pid), inFd(stdinFd), outFd(stdoutFd), errFd(stderrFd) {}

ChildProcess::~ChildProcess() {
    terminate(std::chrono::milliseconds(200));
    closeStreams();
}

bool ChildProcess::tryReapLocked() {
    if (childPid <= 0 || reaped) return true;
    int st = 0;
    pid_t r = waitpid(childPid, &st, WNOHANG);
    if (r == childPid) {
        reaped = true;
        status = st;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        reaped = true;
        return true;
    }
    return false;
}

bool ChildProcess::isRunning() {
    std::lock_guard<std::mutex> lock(mtx);
    if (childPid <= 0) return false;
    return !tryReapLocked();
}

std::optional<int> ChildProcess::exitStatus() {
    std::lock_guard<std::mutex> lock(mtx);
    tryReapLocked();
    return status;
}

void ChildProcess::closeStdin() {
    std::lock_guard<std::mutex> lock(mtx);
    closeFd(inFd);
}

void ChildProcess::closeStreams() {
    std::lock_guard<std::mutex> lock(mtx);
    closeFd(inFd);
    closeFd(outFd);
    closeFd(errFd);
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mtx);
    if (tryReapLocked()) return;

    if (kill(-childPid, SIGTERM) != 0) {
        kill(childPid, SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (tryReapLocked()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (kill(-childPid, SIGKILL) != 0) {
        kill(childPid, SIGKILL);
    }
    int st = 0;
    pid_t r;
    do {
        r = waitpid(childPid, &st, 0);
    } while (r < 0 && errno == EINTR);
    reaped = true;
    if (r == childPid) status = st;
}

std::unique_ptr<ChildProcess> PosixProcessLauncher::launch(const std::string& executable,
                                                           const std::vector<std::string>& args,
                                                           const Environment& env) {
    ignoreSigpipe();

    Environment childEnv = mergedEnvironment(env);
    std::string path = executable;
    if (executable.find('/') == std::string::npos) {
        auto it = childEnv.find("PATH");
        auto found = CommandResolver::findInPath(executable, it != childEnv.end() ? it->second : "");
        if (!found) {
            throw MCPError(MCPErrorKind::SpawnFailed, "executable not found in PATH: " + executable);
        }
        path = *found;
    }

    // Everything the child needs is built before fork; only async-signal-safe calls after it
    std::vector<std::string> argvStorage;
    argvStorage.reserve(args.size() + 1);
    argvStorage.push_back(executable);
    argvStorage.insert(argvStorage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argvStorage) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStorage;
    envStorage.reserve(childEnv.size());
    for (const auto& [key, value] : childEnv) envStorage.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& e : envStorage) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw MCPError(MCPErrorKind::SpawnFailed, "pipe: " + errnoText(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw MCPError(MCPErrorKind::SpawnFailed, "fork: " + errnoText(err));
    }

    if (pid == 0) { // Child
        setpgid(0, 0);
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &dfl, nullptr);

        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execve(path.c_str(), argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // execPipe closes on successful exec (CLOEXEC); otherwise the child reports errno
    int childErr = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n > 0) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        closeAll();
        throw MCPError(MCPErrorKind::SpawnFailed, path + ": " + errnoText(childErr));
    }

    return std::make_unique<ChildProcess>(pid, inPipe[1], outPipe[0], errPipe[0]);
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction ign;
        std::memset(&ign, 0, sizeof(ign));
        ign.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &ign, nullptr);
    });
}
