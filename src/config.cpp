#include "shellguard/config.hpp"
#include "shellguard/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace shellguard {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string required_string(const YAML::Node& node, const char* key, const std::string& where) {
    if (!node[key] || !node[key].IsScalar()) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    return node[key].as<std::string>();
}

void parse_security(const YAML::Node& node, ToolkitConfig& config) {
    if (!node.IsMap()) throw ConfigError("'security' must be a mapping");

    if (node["level"]) config.level = parse_security_level(node["level"].as<std::string>());
    if (node["block_threshold"]) {
        config.block_threshold = parse_severity(node["block_threshold"].as<std::string>());
    }
    if (node["allowlist"]) {
        if (!node["allowlist"].IsSequence()) throw ConfigError("'security.allowlist' must be a list");
        Allowlist allowed;
        for (const auto& item : node["allowlist"]) allowed.insert(item.as<std::string>());
        config.allowlist = std::move(allowed);
    }
    if (node["rules"]) {
        if (!node["rules"].IsSequence()) throw ConfigError("'security.rules' must be a list");
        for (const auto& r : node["rules"]) {
            auto id = required_string(r, "id", "security.rules");
            auto where = "rule '" + id + "'";
            auto severity = r["severity"] ? parse_severity(r["severity"].as<std::string>()) : Severity::High;
            config.extra_rules.push_back(make_rule(id,
                                                   parse_category(required_string(r, "category", where)),
                                                   required_string(r, "pattern", where),
                                                   r["description"] ? r["description"].as<std::string>() : id,
                                                   severity));
        }
    }

    // Same validation the toolkit applies at open, reported while the file is at hand.
    SecurityPolicy check(config.level, config.allowlist, config.block_threshold);
    (void)check;
}

void parse_execution(const YAML::Node& node, ToolkitConfig& config) {
    if (!node.IsMap()) throw ConfigError("'execution' must be a mapping");

    if (node["timeout_ms"]) {
        auto ms = node["timeout_ms"].as<long long>();
        if (ms <= 0) throw ConfigError("'execution.timeout_ms' must be positive");
        config.timeout = std::chrono::milliseconds(ms);
    }
    if (node["max_output_bytes"]) {
        auto bytes = node["max_output_bytes"].as<long long>();
        if (bytes <= 0) throw ConfigError("'execution.max_output_bytes' must be positive");
        config.max_output_bytes = static_cast<std::size_t>(bytes);
    }
    if (node["shell"]) config.shell = node["shell"].as<std::string>();
    if (node["env"]) {
        if (!node["env"].IsMap()) throw ConfigError("'execution.env' must be a mapping");
        for (const auto& kv : node["env"]) {
            config.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
}

ToolkitConfig from_yaml(const YAML::Node& root) {
    ToolkitConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigError("configuration must be a mapping");

    if (root["source"]) config.source = root["source"].as<std::string>();
    if (root["security"]) parse_security(root["security"], config);
    if (root["execution"]) parse_execution(root["execution"], config);
    if (root["files"]) {
        if (!root["files"].IsMap()) throw ConfigError("'files' must be a mapping");
        for (const auto& kv : root["files"]) {
            config.files[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (root["instructions"]) config.extra_instructions = root["instructions"].as<std::string>();
    if (root["logging"] && root["logging"]["level"]) {
        config.log_level = root["logging"]["level"].as<std::string>();
    }
    return config;
}

} // namespace

SecurityLevel parse_security_level(const std::string& name) {
    auto n = lower(name);
    if (n == "standard")   return SecurityLevel::Standard;
    if (n == "paranoid")   return SecurityLevel::Paranoid;
    if (n == "permissive") return SecurityLevel::Permissive;
    throw ConfigError("unknown security level '" + name + "'");
}

Category parse_category(const std::string& name) {
    auto n = lower(name);
    if (n == "filesystem") return Category::Filesystem;
    if (n == "rce")        return Category::RCE;
    if (n == "resource")   return Category::Resource;
    if (n == "privilege")  return Category::Privilege;
    if (n == "disk")       return Category::Disk;
    throw ConfigError("unknown rule category '" + name + "'");
}

Severity parse_severity(const std::string& name) {
    auto n = lower(name);
    if (n == "low")      return Severity::Low;
    if (n == "medium")   return Severity::Medium;
    if (n == "high")     return Severity::High;
    if (n == "critical") return Severity::Critical;
    throw ConfigError("unknown severity '" + name + "'");
}

ToolkitConfig parse_config(const std::string& yaml_text) {
    try {
        return from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

ToolkitConfig load_config(const fs::path& path) {
    ToolkitConfig config;
    try {
        config = from_yaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    if (!config.source.empty() && config.source.is_relative()) {
        config.source = (path.parent_path() / config.source).lexically_normal();
    }
    return config;
}

} // namespace shellguard
