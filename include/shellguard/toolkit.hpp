#pragma once

#include "shellguard/overlay.hpp"
#include "shellguard/policy_engine.hpp"
#include "shellguard/process.hpp"
#include "shellguard/rules.hpp"
#include "shellguard/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shellguard {

struct ToolkitConfig {
    std::filesystem::path              source;        // empty: current directory
    SecurityLevel                      level = SecurityLevel::Standard;
    std::optional<Allowlist>           allowlist;
    Severity                           block_threshold = Severity::High;
    std::vector<Rule>                  extra_rules;
    std::chrono::milliseconds          timeout { 30000 };
    std::size_t                        max_output_bytes = 30000;
    std::string                        shell = "/bin/sh";
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> files;         // written into the overlay at open
    std::string                        extra_instructions;
    std::string                        log_level = "warn";
};

/// Immutable outcome of one executed command. Blocked commands never get one.
class CommandResult {
public:
    CommandResult(std::string stdout_text, std::string stderr_text, int exit_code,
                  std::chrono::milliseconds duration, PolicyDecision decision, bool truncated)
        : stdout_(std::move(stdout_text))
        , stderr_(std::move(stderr_text))
        , exit_code_(exit_code)
        , duration_(duration)
        , decision_(std::move(decision))
        , truncated_(truncated) {}

    const std::string&        stdout_text() const { return stdout_; }
    const std::string&        stderr_text() const { return stderr_; }
    int                       exit_code() const { return exit_code_; }
    std::chrono::milliseconds duration() const { return duration_; }
    const PolicyDecision&     decision() const { return decision_; }
    bool                      truncated() const { return truncated_; }

    bool success() const { return exit_code_ == 0; }

    /// Throws CommandError when the exit code is non-zero.
    void raise_for_status() const;

private:
    std::string               stdout_;
    std::string               stderr_;
    int                       exit_code_;
    std::chrono::milliseconds duration_;
    PolicyDecision            decision_;
    bool                      truncated_;
};

/**
 * Toolkit
 *
 * One sandboxed shell session: a security policy, an overlay over the
 * source directory, and a process runner. Lifecycle is
 * Created -> Open -> Closed, one way only.
 *
 *   bash(cmd)
 *     1. policy evaluation on the caller's thread; Block throws
 *        SecurityViolation and nothing is spawned
 *     2. the overlay stages a private working directory
 *     3. the runner executes `shell -c cmd` there
 *     4. file changes are absorbed back into the overlay
 *
 * File operations on the toolkit go through the overlay and never modify
 * the source directory. Commands are confined by their working directory
 * only: there is no kernel isolation, so a command that writes to an
 * absolute path under the source root modifies the real file.
 */
class Toolkit {
public:
    explicit Toolkit(ToolkitConfig config, std::shared_ptr<ProcessRunner> runner = nullptr);
    ~Toolkit();

    Toolkit(const Toolkit&) = delete;
    Toolkit& operator=(const Toolkit&) = delete;

    void open();
    void close();

    CommandResult bash(const std::string& command,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::future<CommandResult> bash_async(const std::string& command,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Policy verdict and trace for `command`, without running it.
    EvaluationResult explain(const std::string& command) const;

    std::string read_file(const std::string& path);
    void write_file(const std::string& path, const std::string& content);
    void remove(const std::string& path);
    std::vector<DirEntry> list_directory(const std::string& path = ".");
    std::vector<Change> diff();

    const std::set<std::string>& available_tools() const { return tools_; }
    const std::string&           tool_prompt() const { return tool_prompt_; }
    LifecycleState               state() const { return state_; }
    const ToolkitConfig&         config() const { return config_; }

private:
    /// Counts an operation as in flight so close() waits for it.
    class Operation {
    public:
        explicit Operation(Toolkit* owner) : owner_(owner) {}
        Operation(Operation&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;
        ~Operation();

        /// Hands the in-flight count over to someone who will call leave().
        void release() { owner_ = nullptr; }

    private:
        Toolkit* owner_;
    };

    Operation begin(const char* operation);
    void leave();
    void finish(const std::shared_ptr<CancellationToken>& token);
    PolicyDecision screen(const std::string& command) const;
    CommandResult execute(const std::string& command, const PolicyDecision& decision,
                          std::chrono::milliseconds timeout, const CancellationToken& token);
    std::vector<std::string> project_files();

    ToolkitConfig                       config_;
    std::shared_ptr<ProcessRunner>      runner_;
    std::optional<SecurityPolicy>       policy_;
    std::shared_ptr<const PolicyEngine> engine_;
    std::unique_ptr<OverlayManager>     overlay_;
    std::set<std::string>               tools_;
    std::string                         tool_prompt_;

    std::atomic<LifecycleState>         state_ { LifecycleState::Created };
    std::mutex                          inflight_mutex_;
    std::condition_variable             inflight_done_;
    std::size_t                         inflight_ = 0;
    std::set<std::shared_ptr<CancellationToken>> tokens_;
};

/// Creates and opens a toolkit in one step.
std::unique_ptr<Toolkit> open_toolkit(ToolkitConfig config,
                                      std::shared_ptr<ProcessRunner> runner = nullptr);

/// Cuts `text` to `limit` characters and appends a truncation note.
/// Returns true when something was removed.
bool truncate_output(std::string& text, std::size_t limit);

// ── Adapters ──────────────────────────────────────────────────────────────────

/// Metadata an agent framework needs to expose a toolkit operation as a tool.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string parameters_schema;   // JSON Schema object, already rendered
};

ToolDescriptor bash_tool_descriptor(const Toolkit& toolkit);

/// bash, read_file and write_file, in that order.
std::vector<ToolDescriptor> toolkit_descriptors(const Toolkit& toolkit);

} // namespace shellguard
