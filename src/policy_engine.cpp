#include "shellguard/policy_engine.hpp"
#include "shellguard/command_text.hpp"
#include "shellguard/errors.hpp"

namespace shellguard {

// ── SecurityPolicy ────────────────────────────────────────────────────────────

SecurityPolicy::SecurityPolicy(SecurityLevel level,
                               std::optional<Allowlist> allowlist,
                               Severity block_threshold)
    : level_(level)
    , allowlist_(std::move(allowlist))
    , block_threshold_(block_threshold) {
    if (level_ == SecurityLevel::Paranoid && !allowlist_) {
        throw ConfigError("paranoid security level requires an allowlist");
    }
    if (level_ != SecurityLevel::Paranoid && allowlist_) {
        throw ConfigError(std::string("an allowlist is only valid for the paranoid level, not ")
                          + to_string(level_));
    }
}

SecurityPolicy SecurityPolicy::standard() {
    return SecurityPolicy(SecurityLevel::Standard);
}

SecurityPolicy SecurityPolicy::paranoid(Allowlist allowed) {
    return SecurityPolicy(SecurityLevel::Paranoid, std::move(allowed));
}

SecurityPolicy SecurityPolicy::permissive() {
    return SecurityPolicy(SecurityLevel::Permissive);
}

bool SecurityPolicy::is_allowlisted(const std::string& executable) const {
    if (!allowlist_) return false;
    if (allowlist_->count(executable)) return true;
    for (const auto& entry : *allowlist_) {
        if (entry.empty() || entry.back() != '*') continue;
        auto prefix = entry.substr(0, entry.size() - 1);
        if (executable.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

// ── PolicyEngine ─────────────────────────────────────────────────────────────

namespace {

PolicyDecision not_allowlisted(const std::string& executable) {
    PolicyDecision d;
    d.outcome = Outcome::Block;
    d.reason = "Command '" + executable + "' is not allowlisted";
    d.rejected_executable = executable;
    return d;
}

} // namespace

PolicyEngine::PolicyEngine() : rules_(default_rule_table()) {}

PolicyEngine::PolicyEngine(RuleTable rules) : rules_(std::move(rules)) {}

void PolicyEngine::add_rule(Rule rule) {
    rules_.add_rule(std::move(rule));
}

EvaluationResult PolicyEngine::evaluate_with_trace(const std::string& command,
                                                   const SecurityPolicy& policy) const {
    EvaluationTrace trace;
    trace.command = command;
    trace.normalized = normalize_command(command);
    trace.level = policy.level();

    const bool paranoid = policy.level() == SecurityLevel::Paranoid;
    auto executables = paranoid ? executable_names(command) : std::vector<std::string>{};

    if (paranoid && !executables.empty()) {
        const auto& leading = executables.front();
        if (!policy.is_allowlisted(leading)) {
            trace.steps.push_back({ "allowlist", StepOutcome::NotAllowlisted, leading });
            return { not_allowlisted(leading), std::move(trace) };
        }
        trace.steps.push_back({ "allowlist", StepOutcome::Allowlisted, leading });
    }

    const Rule* first_blocking = nullptr;
    const Rule* first_match = nullptr;

    for (const auto& rule : rules_.rules()) {
        if (!rule.matches(trace.command, trace.normalized)) {
            trace.steps.push_back({ rule.id, StepOutcome::NoMatch, "" });
            continue;
        }
        trace.steps.push_back({ rule.id, StepOutcome::Match, rule.description });
        if (!first_match) first_match = &rule;
        if (!first_blocking && rule.severity >= policy.block_threshold()) {
            first_blocking = &rule;
        }
    }

    PolicyDecision decision;

    if (policy.level() == SecurityLevel::Permissive) {
        if (first_match) {
            decision.outcome = Outcome::Log;
            decision.matched_rule = *first_match;
            decision.reason = first_match->description;
        }
        return { decision, std::move(trace) };
    }

    if (first_blocking) {
        decision.outcome = Outcome::Block;
        decision.matched_rule = *first_blocking;
        decision.reason = first_blocking->description;
        return { decision, std::move(trace) };
    }

    for (std::size_t i = 1; i < executables.size(); ++i) {
        if (!policy.is_allowlisted(executables[i])) {
            trace.steps.push_back({ "allowlist", StepOutcome::NotAllowlisted, executables[i] });
            return { not_allowlisted(executables[i]), std::move(trace) };
        }
        trace.steps.push_back({ "allowlist", StepOutcome::Allowlisted, executables[i] });
    }

    if (first_match) {
        decision.outcome = Outcome::Log;
        decision.matched_rule = *first_match;
        decision.reason = first_match->description + " (below blocking threshold)";
    }
    return { decision, std::move(trace) };
}

PolicyDecision PolicyEngine::evaluate(const std::string& command,
                                      const SecurityPolicy& policy) const {
    return evaluate_with_trace(command, policy).decision;
}

PolicyDecision PolicyEngine::evaluate(const std::string& command, SecurityLevel level,
                                      const std::optional<Allowlist>& allowlist) const {
    return evaluate(command, SecurityPolicy(level, allowlist));
}

void enforce(const PolicyDecision& decision, const std::string& command) {
    if (decision.outcome != Outcome::Block) return;

    if (decision.not_allowlisted() || !decision.matched_rule) {
        throw SecurityViolation(SecurityViolation::Kind::NotAllowlisted, "allowlist",
                                decision.reason, command);
    }
    const auto& rule = *decision.matched_rule;
    throw SecurityViolation(SecurityViolation::kind_for(rule.category), rule.id,
                            rule.description, command);
}

} // namespace shellguard
