#include "shellguard/discovery.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace shellguard {

const std::map<std::string, std::string>& known_tools() {
    static const std::map<std::string, std::string> tools = {
        // search and filter
        { "grep",    "Pattern matching and searching (regex support)" },
        { "find",    "Locate files by pattern, name, or attributes" },
        { "ag",      "The Silver Searcher - fast code search" },
        { "rg",      "ripgrep - fast regex search" },
        // text processing
        { "sed",     "Stream editor for substitution and transformation" },
        { "awk",     "Field-based processing and pattern scanning" },
        { "cut",     "Extract columns/fields by delimiter" },
        { "tr",      "Translate, squeeze, or delete characters" },
        { "sort",    "Sort lines alphabetically/numerically" },
        { "uniq",    "Remove duplicates or count occurrences" },
        // viewing
        { "cat",     "View file contents" },
        { "head",    "View first N lines of a file" },
        { "tail",    "View last N lines of a file" },
        { "less",    "Page through file contents" },
        { "wc",      "Count lines, words, characters" },
        // structured data
        { "jq",      "Parse and manipulate JSON" },
        { "yq",      "Parse YAML, XML, TOML" },
        { "xsv",     "Fast CSV processing" },
        { "mlr",     "Miller - CSV/JSON processing" },
        // comparison
        { "diff",    "Compare files line by line" },
        { "comm",    "Compare two sorted files" },
        // network
        { "curl",    "Transfer data from URLs" },
        { "wget",    "Download files from URLs" },
        // interpreters
        { "python3", "Python interpreter" },
        { "python",  "Python interpreter" },
        { "node",    "Node.js runtime" },
        // utilities
        { "xargs",   "Build commands from stdin" },
        { "tee",     "Split output to file and stdout" },
        { "ls",      "List directory contents" },
        { "tree",    "Display directory tree" },
        { "file",    "Determine file type" },
        { "stat",    "Display file status" },
    };
    return tools;
}

const std::map<std::string, std::vector<std::string>>& format_tool_hints() {
    static const std::map<std::string, std::vector<std::string>> hints = {
        { ".json",  { "jq", "python3 -c 'import json...'" } },
        { ".jsonl", { "jq -c", "python3" } },
        { ".yaml",  { "yq" } },
        { ".yml",   { "yq" } },
        { ".csv",   { "awk", "cut", "xsv", "mlr", "python3 -c 'import csv...'" } },
        { ".tsv",   { "awk", "cut" } },
        { ".xml",   { "yq -p xml", "grep" } },
        { ".html",  { "grep", "python3 -c 'from bs4...'" } },
        { ".md",    { "grep", "cat" } },
        { ".py",    { "grep", "ast module via python3" } },
        { ".js",    { "grep", "node" } },
        { ".ts",    { "grep" } },
    };
    return hints;
}

std::set<std::string> discover_tools(const std::string& path_env) {
    std::set<std::string> available;
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        for (const auto& tool : known_tools()) {
            if (available.count(tool.first)) continue;
            auto candidate = fs::path(dir) / tool.first;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
                available.insert(tool.first);
            }
        }
    }
    return available;
}

std::set<std::string> discover_tools() {
    const char* path = std::getenv("PATH");
    return discover_tools(path ? path : "");
}

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string lower_extension(const std::string& file) {
    auto ext = fs::path(file).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

std::string generate_tool_prompt(const std::set<std::string>& available,
                                 const std::vector<std::string>& files,
                                 const std::string& extra_instructions) {
    if (available.empty()) return extra_instructions;

    std::vector<std::string> lines;

    std::vector<std::string> core;
    for (const char* tool : { "awk", "cat", "find", "grep", "head", "ls", "sed", "tail" }) {
        if (available.count(tool)) core.push_back(tool);
    }
    if (!core.empty()) lines.push_back("Available tools: " + join(core, ", ") + ", and more");

    std::vector<std::string> special;
    if (available.count("jq")) special.push_back("jq for JSON");
    if (available.count("yq")) special.push_back("yq for YAML/XML");
    if (available.count("rg"))      special.push_back("rg for fast search");
    else if (available.count("ag")) special.push_back("ag for fast search");
    if (!special.empty()) lines.push_back("Special: " + join(special, ", "));

    std::set<std::string> extensions;
    for (const auto& f : files) {
        auto ext = lower_extension(f);
        if (!ext.empty()) extensions.insert(ext);
    }
    for (const auto& ext : extensions) {
        auto it = format_tool_hints().find(ext);
        if (it == format_tool_hints().end()) continue;

        std::vector<std::string> usable;
        for (const auto& hint : it->second) {
            auto base = hint.substr(0, hint.find(' '));
            if (available.count(base) || hint.find("python") != std::string::npos) {
                usable.push_back(hint);
            }
            if (usable.size() == 2) break;
        }
        if (!usable.empty()) lines.push_back("For " + ext + " files: " + join(usable, ", "));
    }

    if (!extra_instructions.empty()) {
        lines.push_back("");
        lines.push_back(extra_instructions);
    }
    return join(lines, "\n");
}

} // namespace shellguard
