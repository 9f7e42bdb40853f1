#pragma once

#include "shellguard/overlay.hpp"
#include "shellguard/policy_engine.hpp"
#include "shellguard/toolkit.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace shellguard {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string step_outcome_str(StepOutcome o) {
    switch (o) {
        case StepOutcome::Match:          return "Match";
        case StepOutcome::NoMatch:        return "NoMatch";
        case StepOutcome::Allowlisted:    return "Allowlisted";
        case StepOutcome::NotAllowlisted: return "NotAllowlisted";
        default:                          return "Unknown";
    }
}

inline std::string change_kind_str(ChangeKind k) {
    switch (k) {
        case ChangeKind::Added:    return "Added";
        case ChangeKind::Modified: return "Modified";
        case ChangeKind::Deleted:  return "Deleted";
        default:                   return "Unknown";
    }
}

inline std::string decision_fields(const PolicyDecision& d, const std::string& indent) {
    std::ostringstream os;
    os << indent << "\"outcome\": " << quoted(to_string(d.outcome)) << ",\n";
    if (d.matched_rule) {
        os << indent << "\"rule\": " << quoted(d.matched_rule->id) << ",\n"
           << indent << "\"category\": " << quoted(to_string(d.matched_rule->category)) << ",\n"
           << indent << "\"severity\": " << quoted(to_string(d.matched_rule->severity)) << ",\n";
    } else {
        os << indent << "\"rule\": null,\n";
    }
    if (d.not_allowlisted()) {
        os << indent << "\"not_allowlisted\": " << quoted(d.rejected_executable) << ",\n";
    }
    os << indent << "\"reason\": " << quoted(d.reason) << "\n";
    return os.str();
}

} // namespace json_detail

inline std::string to_json(const PolicyDecision& d) {
    return "{\n" + json_detail::decision_fields(d, "  ") + "}";
}

inline std::string to_json(const PolicyStep& step) {
    std::ostringstream os;
    os << "{ \"step\": "    << json_detail::quoted(step.name)
       << ", \"outcome\": " << json_detail::quoted(json_detail::step_outcome_str(step.outcome))
       << ", \"detail\": "  << json_detail::quoted(step.detail)
       << " }";
    return os.str();
}

inline std::string to_json(const EvaluationResult& result) {
    std::ostringstream os;
    const auto& t = result.trace;
    os << "{\n"
       << "  \"decision\": {\n"
       << json_detail::decision_fields(result.decision, "    ")
       << "  },\n"
       << "  \"trace\": {\n"
       << "    \"command\": "    << json_detail::quoted(t.command) << ",\n"
       << "    \"normalized\": " << json_detail::quoted(t.normalized) << ",\n"
       << "    \"level\": "      << json_detail::quoted(to_string(t.level)) << ",\n"
       << "    \"matches\": "    << t.match_count() << ",\n"
       << "    \"steps\": [";
    for (std::size_t i = 0; i < t.steps.size(); ++i) {
        os << "\n      " << to_json(t.steps[i]);
        if (i + 1 < t.steps.size()) os << ",";
    }
    os << "\n    ]\n"
       << "  }\n"
       << "}";
    return os.str();
}

inline std::string to_json(const CommandResult& r) {
    std::ostringstream os;
    os << "{\n"
       << "  \"stdout\": "      << json_detail::quoted(r.stdout_text()) << ",\n"
       << "  \"stderr\": "      << json_detail::quoted(r.stderr_text()) << ",\n"
       << "  \"exit_code\": "   << r.exit_code() << ",\n"
       << "  \"duration_ms\": " << r.duration().count() << ",\n"
       << "  \"truncated\": "   << (r.truncated() ? "true" : "false") << ",\n"
       << "  \"decision\": {\n"
       << json_detail::decision_fields(r.decision(), "    ")
       << "  }\n"
       << "}";
    return os.str();
}

inline std::string to_json(const std::vector<Change>& changes) {
    std::ostringstream os;
    os << "[";
    for (std::size_t i = 0; i < changes.size(); ++i) {
        os << "\n  { \"path\": " << json_detail::quoted(changes[i].path)
           << ", \"kind\": "     << json_detail::quoted(json_detail::change_kind_str(changes[i].kind))
           << " }";
        if (i + 1 < changes.size()) os << ",";
    }
    os << (changes.empty() ? "]" : "\n]");
    return os.str();
}

inline std::string to_json(const ToolDescriptor& tool) {
    std::ostringstream os;
    os << "{\n"
       << "  \"name\": "        << json_detail::quoted(tool.name) << ",\n"
       << "  \"description\": " << json_detail::quoted(tool.description) << ",\n"
       << "  \"parameters\": "  << tool.parameters_schema << "\n"
       << "}";
    return os.str();
}

} // namespace shellguard
