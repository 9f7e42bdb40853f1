#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace shellguard {

/// Cooperative stop signal shared between a caller and a running process.
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_ { false };
};

struct ProcessRequest {
    std::string                        command;
    std::filesystem::path              cwd;
    std::string                        shell = "/bin/sh";
    std::map<std::string, std::string> env;       // added to the inherited environment
    std::chrono::milliseconds          timeout { 30000 };
};

struct ProcessOutcome {
    std::string               stdout_data;
    std::string               stderr_data;
    int                       exit_code = 0;
    std::chrono::milliseconds duration { 0 };
    bool                      timed_out = false;
    bool                      cancelled = false;
};

/**
 * ProcessRunner
 *
 * The single point where a command turns into a process. The toolkit only
 * reaches it after the policy engine has allowed the command, so tests can
 * substitute a counting runner to prove that blocked commands never spawn.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Runs `shell -c command` in `request.cwd`. A non-zero exit is data,
    /// not an error. Failure to start throws ExecutionError{SpawnFailed};
    /// death by an unexpected signal throws ExecutionError{Crashed}.
    virtual ProcessOutcome run(const ProcessRequest& request, const CancellationToken& token) = 0;
};

/**
 * PosixProcessRunner
 *
 * fork/exec with stdout and stderr captured through pipes. The child leads
 * its own process group; on timeout or cancellation the whole group is
 * killed with SIGKILL, and the partial output is still returned.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessOutcome run(const ProcessRequest& request, const CancellationToken& token) override;
};

} // namespace shellguard
