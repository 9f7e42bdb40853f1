#pragma once

#include "shellguard/types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace shellguard {

/// Base of every error raised by the library.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid security configuration, rule pattern or config file.
class ConfigError : public Error {
public:
    using Error::Error;
};

/// Operation invoked outside the lifecycle state it requires.
class LifecycleError : public Error {
public:
    LifecycleError(const std::string& operation, LifecycleState state)
        : Error(operation + " is not allowed while the toolkit is " + to_string(state))
        , state_(state) {}

    explicit LifecycleError(const std::string& message)
        : Error(message), state_(LifecycleState::Closed) {}

    LifecycleState state() const { return state_; }

private:
    LifecycleState state_;
};

/**
 * SecurityViolation
 *
 * Raised instead of a CommandResult when the policy engine blocks a command.
 * kind() is the matched rule's category, or NotAllowlisted when a PARANOID
 * allowlist rejected the executable.
 */
class SecurityViolation : public Error {
public:
    enum class Kind { Filesystem, RCE, Resource, Privilege, Disk, NotAllowlisted };

    SecurityViolation(Kind kind, std::string rule_id, std::string description, std::string command);

    Kind               kind() const { return kind_; }
    const std::string& rule_id() const { return rule_id_; }
    const std::string& description() const { return description_; }
    const std::string& command() const { return command_; }

    static Kind kind_for(Category category);

private:
    Kind        kind_;
    std::string rule_id_;
    std::string description_;
    std::string command_;
};

const char* to_string(SecurityViolation::Kind kind);

inline std::ostream& operator<<(std::ostream& os, SecurityViolation::Kind kind) {
    return os << to_string(kind);
}

/// A logical overlay path normalizes outside the source root.
class PathEscapeError : public Error {
public:
    explicit PathEscapeError(std::string path)
        : Error("path escapes the source root: " + path), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// The process could not be started, crashed or timed out.
class ExecutionError : public Error {
public:
    enum class Kind { SpawnFailed, Timeout, Crashed };

    ExecutionError(Kind kind, const std::string& message) : Error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/// Raised by CommandResult::raise_for_status() for a non-zero exit.
class CommandError : public Error {
public:
    CommandError(int exit_code, const std::string& output)
        : Error("command failed with exit code " + std::to_string(exit_code) + ": " + output)
        , exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

/// Shadow directory creation, copy or removal failed.
class OverlayIOError : public Error {
public:
    OverlayIOError(const std::string& message, std::filesystem::path path)
        : Error(message + ": " + path.string()), path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace shellguard
