#pragma once

#include "shellguard/toolkit.hpp"
#include "shellguard/types.hpp"

#include <filesystem>
#include <string>

namespace shellguard {

/// Reads a YAML configuration file. Relative `source` paths are resolved
/// against the file's directory. Throws ConfigError naming the file.
ToolkitConfig load_config(const std::filesystem::path& path);

/// Parses YAML text. Throws ConfigError on malformed YAML, unknown enum
/// values, invalid rule patterns or an inconsistent security section.
ToolkitConfig parse_config(const std::string& yaml_text);

// Case-insensitive enum parsers; throw ConfigError on unknown names.
SecurityLevel parse_security_level(const std::string& name);
Category      parse_category(const std::string& name);
Severity      parse_severity(const std::string& name);

} // namespace shellguard
