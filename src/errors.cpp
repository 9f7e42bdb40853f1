#include "shellguard/errors.hpp"

namespace shellguard {

SecurityViolation::SecurityViolation(Kind kind, std::string rule_id,
                                     std::string description, std::string command)
    : Error(std::string("Security violation [") + to_string(kind) + "]: " + description)
    , kind_(kind)
    , rule_id_(std::move(rule_id))
    , description_(std::move(description))
    , command_(std::move(command)) {}

SecurityViolation::Kind SecurityViolation::kind_for(Category category) {
    switch (category) {
        case Category::Filesystem: return Kind::Filesystem;
        case Category::RCE:        return Kind::RCE;
        case Category::Resource:   return Kind::Resource;
        case Category::Privilege:  return Kind::Privilege;
        case Category::Disk:       return Kind::Disk;
    }
    return Kind::Filesystem;
}

const char* to_string(SecurityViolation::Kind kind) {
    switch (kind) {
        case SecurityViolation::Kind::Filesystem:     return "Filesystem";
        case SecurityViolation::Kind::RCE:            return "RCE";
        case SecurityViolation::Kind::Resource:       return "Resource";
        case SecurityViolation::Kind::Privilege:      return "Privilege";
        case SecurityViolation::Kind::Disk:           return "Disk";
        case SecurityViolation::Kind::NotAllowlisted: return "not-allowlisted";
        default:                                      return "Unknown";
    }
}

} // namespace shellguard
