#include "shellguard/toolkit.hpp"
#include "shellguard/discovery.hpp"
#include "shellguard/errors.hpp"
#include "shellguard/json.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace fs = std::filesystem;

namespace shellguard {

void CommandResult::raise_for_status() const {
    if (success()) return;
    throw CommandError(exit_code_, stderr_.empty() ? stdout_ : stderr_);
}

bool truncate_output(std::string& text, std::size_t limit) {
    if (text.size() <= limit) return false;
    auto keep = limit;
    // Do not split a UTF-8 sequence.
    while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0) == 0x80) --keep;
    auto removed = text.size() - keep;
    text.resize(keep);
    text += "\n\n[Truncated: " + std::to_string(removed) + " characters removed]";
    return true;
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

Toolkit::Toolkit(ToolkitConfig config, std::shared_ptr<ProcessRunner> runner)
    : config_(std::move(config))
    , runner_(runner ? std::move(runner) : std::make_shared<PosixProcessRunner>()) {}

Toolkit::~Toolkit() {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        for (const auto& token : tokens_) token->cancel();
    }
    try {
        close();
    } catch (const Error& e) {
        spdlog::error("toolkit close failed: {}", e.what());
    }
}

void Toolkit::open() {
    if (state_ != LifecycleState::Created) {
        throw LifecycleError("open", state_.load());
    }

    SecurityPolicy policy(config_.level, config_.allowlist, config_.block_threshold);

    auto table = default_rule_table();
    for (const auto& rule : config_.extra_rules) table.add_rule(rule);
    auto engine = std::make_shared<const PolicyEngine>(std::move(table));

    auto source = config_.source.empty() ? fs::current_path() : config_.source;
    auto overlay = std::make_unique<OverlayManager>(source);
    overlay->open();
    for (const auto& file : config_.files) {
        overlay->write_file(file.first, file.second);
    }

    policy_ = std::move(policy);
    engine_ = std::move(engine);
    overlay_ = std::move(overlay);

    tools_ = discover_tools();
    auto files = project_files();
    tool_prompt_ = generate_tool_prompt(tools_, files, config_.extra_instructions);

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        state_ = LifecycleState::Open;
    }
    spdlog::info("toolkit opened on {} (level {}, {} rules, {} tools)",
                 overlay_->source_root().string(), to_string(config_.level),
                 engine_->rule_count(), tools_.size());
}

void Toolkit::close() {
    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        if (state_.exchange(LifecycleState::Closed) == LifecycleState::Closed) return;
        inflight_done_.wait(lock, [this] { return inflight_ == 0; });
    }
    if (!overlay_) return;

    overlay_->close();
    spdlog::info("toolkit closed, overlay discarded");
}

std::unique_ptr<Toolkit> open_toolkit(ToolkitConfig config, std::shared_ptr<ProcessRunner> runner) {
    auto toolkit = std::make_unique<Toolkit>(std::move(config), std::move(runner));
    toolkit->open();
    return toolkit;
}

// ── In-flight accounting ──────────────────────────────────────────────────────

Toolkit::Operation::~Operation() {
    if (owner_) owner_->leave();
}

Toolkit::Operation Toolkit::begin(const char* operation) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    if (state_ != LifecycleState::Open) {
        throw LifecycleError(operation, state_.load());
    }
    ++inflight_;
    return Operation(this);
}

void Toolkit::leave() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    if (--inflight_ == 0) inflight_done_.notify_all();
}

void Toolkit::finish(const std::shared_ptr<CancellationToken>& token) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    tokens_.erase(token);
    if (--inflight_ == 0) inflight_done_.notify_all();
}

// ── Commands ──────────────────────────────────────────────────────────────────

EvaluationResult Toolkit::explain(const std::string& command) const {
    if (!engine_ || !policy_) throw LifecycleError("explain", state_.load());
    return engine_->evaluate_with_trace(command, *policy_);
}

PolicyDecision Toolkit::screen(const std::string& command) const {
    auto decision = engine_->evaluate(command, *policy_);
    spdlog::debug("policy {} for '{}': {}", to_string(decision.outcome), command,
                  decision.reason.empty() ? "no rule matched" : decision.reason);

    if (decision.outcome == Outcome::Block) {
        spdlog::warn("blocked '{}': {}", command, decision.reason);
        enforce(decision, command);
    }
    if (decision.outcome == Outcome::Log) {
        spdlog::warn("running flagged command '{}' [{}]: {}", command,
                     decision.matched_rule ? decision.matched_rule->id : "", decision.reason);
    }
    return decision;
}

CommandResult Toolkit::bash(const std::string& command, std::optional<std::chrono::milliseconds> timeout) {
    return bash_async(command, timeout).get();
}

std::future<CommandResult> Toolkit::bash_async(const std::string& command,
                                               std::optional<std::chrono::milliseconds> timeout) {
    auto op = begin("bash");
    auto decision = screen(command);

    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        tokens_.insert(token);
    }
    auto limit = timeout.value_or(config_.timeout);

    std::future<CommandResult> future;
    try {
        future = std::async(std::launch::async, [this, command, decision, limit, token]() {
            try {
                auto result = execute(command, decision, limit, *token);
                finish(token);
                return result;
            } catch (...) {
                finish(token);
                throw;
            }
        });
    } catch (...) {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        tokens_.erase(token);
        throw;
    }
    op.release();   // the task calls finish()
    return future;
}

CommandResult Toolkit::execute(const std::string& command, const PolicyDecision& decision,
                               std::chrono::milliseconds timeout, const CancellationToken& token) {
    auto staging = overlay_->stage();

    ProcessRequest request;
    request.command = command;
    request.cwd = staging.root;
    request.shell = config_.shell;
    request.env = config_.env;
    request.timeout = timeout;

    ProcessOutcome outcome;
    try {
        outcome = runner_->run(request, token);
    } catch (const ExecutionError& e) {
        if (e.kind() == ExecutionError::Kind::SpawnFailed) {
            overlay_->discard(staging);
        } else {
            overlay_->absorb(staging);
        }
        throw;
    } catch (...) {
        overlay_->discard(staging);
        throw;
    }

    overlay_->absorb(staging);

    if (outcome.timed_out) {
        spdlog::warn("'{}' timed out after {} ms", command, timeout.count());
        throw ExecutionError(ExecutionError::Kind::Timeout,
                             "command timed out after " + std::to_string(timeout.count()) + " ms: " + command);
    }
    if (outcome.cancelled) {
        throw ExecutionError(ExecutionError::Kind::Timeout, "command cancelled: " + command);
    }

    bool truncated = truncate_output(outcome.stdout_data, config_.max_output_bytes);
    truncated = truncate_output(outcome.stderr_data, config_.max_output_bytes) || truncated;

    spdlog::debug("'{}' exited {} in {} ms", command, outcome.exit_code, outcome.duration.count());
    return CommandResult(std::move(outcome.stdout_data), std::move(outcome.stderr_data),
                         outcome.exit_code, outcome.duration, decision, truncated);
}

// ── Files ─────────────────────────────────────────────────────────────────────

std::string Toolkit::read_file(const std::string& path) {
    auto op = begin("read_file");
    return overlay_->read_file(path);
}

void Toolkit::write_file(const std::string& path, const std::string& content) {
    auto op = begin("write_file");
    overlay_->write_file(path, content);
}

void Toolkit::remove(const std::string& path) {
    auto op = begin("remove");
    overlay_->remove(path);
}

std::vector<DirEntry> Toolkit::list_directory(const std::string& path) {
    auto op = begin("list_directory");
    return overlay_->list_directory(path);
}

std::vector<Change> Toolkit::diff() {
    auto op = begin("diff");
    return overlay_->diff();
}

std::vector<std::string> Toolkit::project_files() {
    constexpr std::size_t limit = 1000;
    std::vector<std::string> files;
    std::vector<std::string> pending { "." };

    while (!pending.empty() && files.size() < limit) {
        auto dir = pending.back();
        pending.pop_back();
        for (const auto& entry : overlay_->list_directory(dir)) {
            if (entry.name.empty() || entry.name[0] == '.') continue;
            auto path = dir == "." ? entry.name : dir + "/" + entry.name;
            std::error_code ec;
            bool link = fs::is_symlink(fs::symlink_status(entry.location, ec));
            if (entry.is_directory && !link) {
                pending.push_back(path);
            } else if (files.size() < limit) {
                files.push_back(path);
            }
        }
    }
    return files;
}

// ── Adapters ──────────────────────────────────────────────────────────────────

namespace {

std::string string_property(const std::string& name, const std::string& description) {
    return json_detail::quoted(name) + ": { \"type\": \"string\", \"description\": "
         + json_detail::quoted(description) + " }";
}

} // namespace

ToolDescriptor bash_tool_descriptor(const Toolkit& toolkit) {
    ToolDescriptor d;
    d.name = "bash";
    d.description = "Execute bash commands in a sandboxed copy of the project. "
                    "Writes stay private to this session.";
    if (!toolkit.tool_prompt().empty()) d.description += "\n" + toolkit.tool_prompt();

    std::ostringstream os;
    os << "{ \"type\": \"object\", \"properties\": { "
       << string_property("command", "The shell command to run") << ", "
       << "\"timeout_ms\": { \"type\": \"integer\", \"description\": "
       << json_detail::quoted("Timeout in milliseconds (default "
                              + std::to_string(toolkit.config().timeout.count()) + ")")
       << " } }, \"required\": [\"command\"] }";
    d.parameters_schema = os.str();
    return d;
}

std::vector<ToolDescriptor> toolkit_descriptors(const Toolkit& toolkit) {
    std::vector<ToolDescriptor> tools { bash_tool_descriptor(toolkit) };

    tools.push_back({ "read_file", "Read a file from the sandbox filesystem.",
                      "{ \"type\": \"object\", \"properties\": { "
                      + string_property("path", "Path relative to the project root")
                      + " }, \"required\": [\"path\"] }" });

    tools.push_back({ "write_file", "Write content to a file in the sandbox.",
                      "{ \"type\": \"object\", \"properties\": { "
                      + string_property("path", "Path relative to the project root") + ", "
                      + string_property("content", "Full new file content")
                      + " }, \"required\": [\"path\", \"content\"] }" });
    return tools;
}

} // namespace shellguard
