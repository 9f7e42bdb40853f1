#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace shellguard {

/// Tools the prompt knows how to describe, keyed by executable name.
const std::map<std::string, std::string>& known_tools();

/// Suggested tools per file extension (".json" -> jq, ...).
const std::map<std::string, std::vector<std::string>>& format_tool_hints();

/// Looks up every known tool in the directories of `path_env` (a PATH-style
/// list). Nothing is spawned; a tool counts as present when an executable
/// regular file of that name exists. An empty `path_env` finds nothing.
std::set<std::string> discover_tools(const std::string& path_env);

/// Same, using the PATH of the current process.
std::set<std::string> discover_tools();

/**
 * Builds the LLM-facing tool prompt.
 *
 *   Available tools: cat, grep, ls, and more
 *   Special: jq for JSON, rg for fast search
 *   For .json files: jq, python3 -c 'import json...'
 *
 * Format hints are emitted for the extensions found in `files` and list
 * at most two tools, restricted to available ones (python hints always
 * pass). With no tools available the prompt is just `extra_instructions`.
 */
std::string generate_tool_prompt(const std::set<std::string>& available,
                                 const std::vector<std::string>& files,
                                 const std::string& extra_instructions = "");

} // namespace shellguard
