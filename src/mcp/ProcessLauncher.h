#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

// Variables overlaid on the host environment for a child process
using Environment = std::map<std::string, std::string>;

/**
 * A spawned child and the parent's ends of its three standard-stream pipes.
 * pid -1 means there is no real process behind the streams (in-process peers).
 */
class ChildProcess {
public:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return childPid; }
    int stdinFd() const { return inFd; }
    int stdoutFd() const { return outFd; }
    int stderrFd() const { return errFd; }

    bool isRunning();
    // Raw waitpid status once the child has been reaped
    std::optional<int> exitStatus();

    void closeStdin();
    void closeStreams();

    // SIGTERM to the child's process group, SIGKILL after grace, then reap. Idempotent.
    void terminate(std::chrono::milliseconds grace);

private:
    std::mutex mtx;
    pid_t childPid;
    int inFd;
    int outFd;
    int errFd;
    bool reaped = false;
    std::optional<int> status;

    bool tryReapLocked();
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    // Throws MCPError(SpawnFailed)
    virtual std::unique_ptr<ChildProcess> launch(const std::string& executable,
                                                 const std::vector<std::string>& args,
                                                 const Environment& env) = 0;
};

class PosixProcessLauncher : public IProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const std::string& executable,
                                         const std::vector<std::string>& args,
                                         const Environment& env) override;
};

// Writes to a dead child must fail with EPIPE instead of killing the host
void ignoreSigpipe();
