#pragma once

#include "shellguard/rules.hpp"
#include "shellguard/types.hpp"

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace shellguard {

/// Executable names permitted in PARANOID mode. An entry ending in '*'
/// matches by prefix ("python*" admits python3).
using Allowlist = std::set<std::string>;

/**
 * SecurityPolicy
 *
 * The per-session security configuration. Construction validates the
 * combination: an allowlist is only meaningful for PARANOID, and PARANOID
 * requires one (an empty set is accepted and denies everything). Invalid
 * combinations throw ConfigError; they are never silently reinterpreted.
 */
class SecurityPolicy {
public:
    explicit SecurityPolicy(SecurityLevel level,
                            std::optional<Allowlist> allowlist = std::nullopt,
                            Severity block_threshold = Severity::High);

    static SecurityPolicy standard();
    static SecurityPolicy paranoid(Allowlist allowed);
    static SecurityPolicy permissive();

    SecurityLevel                   level() const { return level_; }
    const std::optional<Allowlist>& allowlist() const { return allowlist_; }
    Severity                        block_threshold() const { return block_threshold_; }

    bool is_allowlisted(const std::string& executable) const;

private:
    SecurityLevel            level_;
    std::optional<Allowlist> allowlist_;
    Severity                 block_threshold_;
};

struct PolicyDecision {
    Outcome             outcome = Outcome::Allow;
    std::optional<Rule> matched_rule;
    std::string         reason;
    std::string         rejected_executable;   // set when an allowlist check failed

    bool not_allowlisted() const { return !rejected_executable.empty(); }
};

// ── Trace types ───────────────────────────────────────────────────────────────

enum class StepOutcome { Match, NoMatch, Allowlisted, NotAllowlisted };

inline std::ostream& operator<<(std::ostream& os, StepOutcome o) {
    switch (o) {
        case StepOutcome::Match:          return os << "Match";
        case StepOutcome::NoMatch:        return os << "NoMatch";
        case StepOutcome::Allowlisted:    return os << "Allowlisted";
        case StepOutcome::NotAllowlisted: return os << "NotAllowlisted";
        default:                          return os << "Unknown";
    }
}

struct PolicyStep {
    std::string name;      // rule id, or "allowlist"
    StepOutcome outcome;
    std::string detail;    // rule description or executable name
};

struct EvaluationTrace {
    std::string             command;
    std::string             normalized;
    SecurityLevel           level = SecurityLevel::Standard;
    std::vector<PolicyStep> steps;

    std::size_t match_count() const {
        std::size_t count = 0;
        for (const auto& s : steps)
            if (s.outcome == StepOutcome::Match) ++count;
        return count;
    }
    std::size_t rule_steps() const {
        std::size_t count = 0;
        for (const auto& s : steps)
            if (s.outcome == StepOutcome::Match || s.outcome == StepOutcome::NoMatch) ++count;
        return count;
    }
};

struct EvaluationResult {
    PolicyDecision  decision;
    EvaluationTrace trace;
};

/**
 * PolicyEngine
 *
 * Classifies a command before it is spawned. Evaluation is a pure function
 * of {command, policy}: no process is started and no file is touched.
 *
 * Resolution strategy:
 *   PARANOID   - the first segment's executable must be allowlisted,
 *                otherwise Block immediately. Rules then run as in
 *                STANDARD, and finally every later segment's executable
 *                must be allowlisted too.
 *   STANDARD   - every rule is tried. The first match at or above the
 *                blocking threshold (in table order) blocks; a match below
 *                it is logged; no match allows.
 *   PERMISSIVE - every rule is tried; any match is logged, never blocked.
 *
 * This is a heuristic filter. Determined obfuscation (encodings, variables
 * assembled at runtime, scripts written then executed) can get past it.
 */
class PolicyEngine {
public:
    PolicyEngine();
    explicit PolicyEngine(RuleTable rules);

    void add_rule(Rule rule);

    EvaluationResult evaluate_with_trace(const std::string& command,
                                         const SecurityPolicy& policy) const;

    PolicyDecision evaluate(const std::string& command, const SecurityPolicy& policy) const;

    /// Convenience form; validates the combination exactly like SecurityPolicy.
    PolicyDecision evaluate(const std::string& command, SecurityLevel level,
                            const std::optional<Allowlist>& allowlist = std::nullopt) const;

    const RuleTable& rules() const { return rules_; }
    std::size_t rule_count() const { return rules_.rule_count(); }

private:
    RuleTable rules_;
};

/// Throws SecurityViolation when `decision` is a Block.
void enforce(const PolicyDecision& decision, const std::string& command);

} // namespace shellguard
