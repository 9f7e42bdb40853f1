#pragma once

#include <string>
#include <vector>

namespace shellguard {

/**
 * Pure text helpers used by the policy engine.
 *
 * None of these is a shell parser. They undo the cheap obfuscations an agent
 * might produce by accident or on purpose (quotes around words, backslash
 * escapes, runs of whitespace, $IFS as a separator) so that the rule
 * patterns see a canonical spelling.
 */

/// Strips quotes and backslash escapes, replaces $IFS / ${IFS} with a space
/// and collapses whitespace runs into one space. Leading/trailing whitespace
/// is trimmed.
std::string normalize_command(const std::string& command);

/// Splits a command on ; && || | & newlines, $( and backticks.
/// Empty segments are dropped; each segment is trimmed.
std::vector<std::string> split_segments(const std::string& command);

/// Executable of a single segment: drops redirections with their targets,
/// skips VAR=value assignments and the wrappers `env`, `nice`, `timeout`,
/// `nohup`, `time`, `exec`, `command` and `builtin` together with their
/// options, strips quoting and reduces a path to its basename. A wrapper
/// with an option it does not know is returned as the executable itself.
/// Empty when the segment holds no executable.
std::string executable_name(const std::string& segment);

/// Executables of every segment, in order.
std::vector<std::string> executable_names(const std::string& command);

} // namespace shellguard
