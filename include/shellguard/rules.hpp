#pragma once

#include "shellguard/types.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace shellguard {

/**
 * Rule
 *
 * A named pattern that classifies a command as dangerous. The matcher is an
 * ECMAScript regular expression searched in both the raw and the normalized
 * command text (see normalize_command). Matching is heuristic: it catches
 * the usual spellings and simple obfuscation, not arbitrary encodings.
 */
struct Rule {
    std::string id;
    Category    category = Category::Filesystem;
    std::string pattern;
    std::string description;
    Severity    severity = Severity::High;
    std::shared_ptr<const std::regex> matcher;

    bool matches(const std::string& raw, const std::string& normalized) const;
};

/// Compiles `pattern`; throws ConfigError when it is not a valid regex.
Rule make_rule(std::string id, Category category, std::string pattern,
               std::string description, Severity severity);

struct RuleMatch {
    std::string id;
    Category    category;
    Severity    severity;
    std::string description;
};

struct ScanReport {
    std::string            command;
    std::string            normalized;
    std::vector<RuleMatch> matches;

    bool clean() const { return matches.empty(); }
};

/**
 * RuleTable
 *
 * Ordered, append-only set of rules. Scanning never stops early: every rule
 * is tried and each match is reported in table order.
 */
class RuleTable {
public:
    void add_rule(Rule rule);

    ScanReport scan(const std::string& command) const;

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule* find(const std::string& id) const;
    std::size_t rule_count() const { return rules_.size(); }

private:
    std::vector<Rule> rules_;
};

// ── Built-in rules ────────────────────────────────────────────────────────

/// Returns a RuleTable pre-loaded with the built-in dangerous-command rules.
RuleTable default_rule_table();

} // namespace shellguard
