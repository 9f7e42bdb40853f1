#include "shellguard/process.hpp"
#include "shellguard/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace shellguard {

namespace {

/// Closes both ends on scope exit unless released.
struct Pipe {
    int fds[2] = { -1, -1 };

    void open() {
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            throw ExecutionError(ExecutionError::Kind::SpawnFailed,
                                 std::string("pipe failed: ") + std::strerror(errno));
        }
    }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { close_fd(fds[0]); }
    void close_write() { close_fd(fds[1]); }

    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

std::vector<std::string> build_environment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && extra.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& kv : extra) env.push_back(kv.first + "=" + kv.second);
    return env;
}

std::vector<char*> c_strings(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(&s[0]);
    out.push_back(nullptr);
    return out;
}

void drain(int fd, std::string& sink) {
    char buf[4096];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        sink.append(buf, static_cast<std::size_t>(n));
    }
}

} // namespace

ProcessOutcome PosixProcessRunner::run(const ProcessRequest& request, const CancellationToken& token) {
    ProcessOutcome outcome;
    auto start = std::chrono::steady_clock::now();

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage { request.shell, "-c", request.command };
    auto env_storage = build_environment(request.env);
    auto argv = c_strings(argv_storage);
    auto envp = c_strings(env_storage);
    std::string cwd = request.cwd.string();

    Pipe out, err, exec_status;
    out.open();
    err.open();
    exec_status.open();

    pid_t child = ::fork();
    if (child < 0) {
        throw ExecutionError(ExecutionError::Kind::SpawnFailed,
                             std::string("fork failed: ") + std::strerror(errno));
    }

    if (child == 0) {
        // === child ===
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.write_end(), STDOUT_FILENO);
        ::dup2(err.write_end(), STDERR_FILENO);

        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
            int code = errno;
            (void)!::write(exec_status.write_end(), &code, sizeof(code));
            ::_exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());
        int code = errno;
        (void)!::write(exec_status.write_end(), &code, sizeof(code));
        ::_exit(127);
    }

    // === parent ===
    ::setpgid(child, child);   // races the child's own call; either one wins
    out.close_write();
    err.close_write();
    exec_status.close_write();

    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_status.read_end(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(child, nullptr, 0);
        throw ExecutionError(ExecutionError::Kind::SpawnFailed,
                             "cannot start " + request.shell + ": " + std::strerror(child_errno));
    }

    // Drain concurrently so a chatty child never blocks on a full pipe.
    std::thread stdout_reader([fd = out.read_end(), &outcome]() { drain(fd, outcome.stdout_data); });
    std::thread stderr_reader([fd = err.read_end(), &outcome]() { drain(fd, outcome.stderr_data); });

    auto deadline = start + request.timeout;
    int status = 0;
    bool killed = false;
    for (;;) {
        pid_t reaped = ::waitpid(child, &status, WNOHANG);
        if (reaped == child) break;
        if (reaped < 0 && errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", child, std::strerror(errno));
            break;
        }
        if (!killed) {
            if (token.cancelled()) {
                outcome.cancelled = true;
            } else if (std::chrono::steady_clock::now() >= deadline) {
                outcome.timed_out = true;
            }
            if (outcome.cancelled || outcome.timed_out) {
                spdlog::warn("killing process group {} ({})", child,
                             outcome.timed_out ? "timeout" : "cancelled");
                ::kill(-child, SIGKILL);
                killed = true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Background jobs left in the group would keep the pipes open.
    ::kill(-child, SIGKILL);
    stdout_reader.join();
    stderr_reader.join();

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
        if (!killed) {
            throw ExecutionError(ExecutionError::Kind::Crashed,
                                 "command terminated by signal " + std::to_string(WTERMSIG(status)));
        }
    }
    return outcome;
}

} // namespace shellguard
