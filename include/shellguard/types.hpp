#pragma once

#include <ostream>
#include <string>

namespace shellguard {

enum class SecurityLevel { Standard, Paranoid, Permissive };

enum class Category { Filesystem, RCE, Resource, Privilege, Disk };

enum class Severity { Low, Medium, High, Critical };

enum class Outcome { Allow, Block, Log };

enum class LifecycleState { Created, Open, Closed };

inline const char* to_string(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Standard:   return "standard";
        case SecurityLevel::Paranoid:   return "paranoid";
        case SecurityLevel::Permissive: return "permissive";
        default:                        return "unknown";
    }
}

inline const char* to_string(Category category) {
    switch (category) {
        case Category::Filesystem: return "Filesystem";
        case Category::RCE:        return "RCE";
        case Category::Resource:   return "Resource";
        case Category::Privilege:  return "Privilege";
        case Category::Disk:       return "Disk";
        default:                   return "Unknown";
    }
}

inline const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
        default:                 return "unknown";
    }
}

inline const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Allow: return "Allow";
        case Outcome::Block: return "Block";
        case Outcome::Log:   return "Log";
        default:             return "Unknown";
    }
}

inline const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Created: return "Created";
        case LifecycleState::Open:    return "Open";
        case LifecycleState::Closed:  return "Closed";
        default:                      return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, SecurityLevel level) {
    return os << to_string(level);
}

inline std::ostream& operator<<(std::ostream& os, Category category) {
    return os << to_string(category);
}

inline std::ostream& operator<<(std::ostream& os, Severity severity) {
    return os << to_string(severity);
}

inline std::ostream& operator<<(std::ostream& os, Outcome outcome) {
    return os << to_string(outcome);
}

inline std::ostream& operator<<(std::ostream& os, LifecycleState state) {
    return os << to_string(state);
}

} // namespace shellguard
