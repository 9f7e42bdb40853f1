#include "shellguard/config.hpp"
#include "shellguard/errors.hpp"
#include "shellguard/json.hpp"
#include "shellguard/toolkit.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace shellguard;

namespace {

struct Options {
    std::optional<std::string> config_file;
    std::optional<std::string> source;
    std::optional<std::string> level;
    std::optional<std::string> log_level;
    std::optional<long long>   timeout_ms;
    Allowlist                  allow;
    bool                       json = false;
    bool                       explain = false;
    bool                       show_diff = false;
    bool                       show_tools = false;
    std::vector<std::string>   commands;
};

void usage(std::ostream& os) {
    os << "usage: shellguard [options] [command ...]\n"
       << "\n"
       << "Runs each command in a sandboxed copy of --source. With no commands,\n"
       << "reads one command per line from stdin.\n"
       << "\n"
       << "  --config FILE      YAML configuration\n"
       << "  --source DIR       directory to expose (default: cwd)\n"
       << "  --level LEVEL      standard | paranoid | permissive\n"
       << "  --allow NAME       allowlist entry for paranoid (repeatable)\n"
       << "  --timeout MS       per-command timeout\n"
       << "  --explain          print the policy trace instead of running\n"
       << "  --diff             print overlay changes before exit\n"
       << "  --tools            print the tool prompt and exit\n"
       << "  --json             JSON output\n"
       << "  --log-level LEVEL  trace | debug | info | warn | error | off\n";
}

Options parse_args(int argc, char** argv) {
    Options opts;
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw ConfigError(flag + " needs a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            std::exit(0);
        }
        else if (arg == "--config")    opts.config_file = value(i, arg);
        else if (arg == "--source")    opts.source = value(i, arg);
        else if (arg == "--level")     opts.level = value(i, arg);
        else if (arg == "--log-level") opts.log_level = value(i, arg);
        else if (arg == "--allow")     opts.allow.insert(value(i, arg));
        else if (arg == "--timeout") {
            auto text = value(i, arg);
            try {
                opts.timeout_ms = std::stoll(text);
            } catch (const std::exception&) {
                throw ConfigError("--timeout expects milliseconds, got '" + text + "'");
            }
        }
        else if (arg == "--json")    opts.json = true;
        else if (arg == "--explain") opts.explain = true;
        else if (arg == "--diff")    opts.show_diff = true;
        else if (arg == "--tools")   opts.show_tools = true;
        else if (arg == "--") {
            for (++i; i < argc; ++i) opts.commands.push_back(argv[i]);
        }
        else if (!arg.empty() && arg[0] == '-') throw ConfigError("unknown option " + arg);
        else opts.commands.push_back(arg);
    }
    return opts;
}

ToolkitConfig build_config(const Options& opts) {
    ToolkitConfig config = opts.config_file ? load_config(*opts.config_file) : ToolkitConfig{};
    if (opts.source)     config.source = *opts.source;
    if (opts.level)      config.level = parse_security_level(*opts.level);
    if (opts.timeout_ms) config.timeout = std::chrono::milliseconds(*opts.timeout_ms);
    if (opts.log_level)  config.log_level = *opts.log_level;
    if (!opts.allow.empty()) {
        Allowlist merged = config.allowlist.value_or(Allowlist{});
        merged.insert(opts.allow.begin(), opts.allow.end());
        config.allowlist = std::move(merged);
    }
    return config;
}

void apply_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level '" + name + "'");
    }
    spdlog::set_level(level);
}

void print_trace(const EvaluationResult& result) {
    const auto& d = result.decision;
    std::cout << "\n  Command    : " << result.trace.command << "\n"
              << "  Normalized : " << result.trace.normalized << "\n"
              << "  Decision   : " << d.outcome;
    if (d.matched_rule) std::cout << " <- " << d.matched_rule->id;
    std::cout << "\n";
    if (!d.reason.empty()) std::cout << "  Reason     : " << d.reason << "\n";
    std::cout << "  Steps (" << result.trace.match_count() << " of "
              << result.trace.rule_steps() << " rules matched):\n";
    for (const auto& step : result.trace.steps) {
        if (step.outcome == StepOutcome::NoMatch) continue;
        std::cout << "    [" << step.outcome << "] " << step.name;
        if (!step.detail.empty()) std::cout << " -- " << step.detail;
        std::cout << "\n";
    }
}

/// Runs one command and reports it; returns the exit status for the CLI.
int run_one(Toolkit& toolkit, const std::string& command, const Options& opts) {
    if (opts.explain) {
        auto result = toolkit.explain(command);
        if (opts.json) std::cout << to_json(result) << "\n";
        else           print_trace(result);
        return result.decision.outcome == Outcome::Block ? 2 : 0;
    }

    try {
        auto result = toolkit.bash(command);
        if (opts.json) {
            std::cout << to_json(result) << "\n";
        } else {
            if (result.decision().outcome == Outcome::Log) {
                std::cerr << "[WARN] " << result.decision().reason << "\n";
            }
            std::cout << result.stdout_text();
            std::cerr << result.stderr_text();
        }
        return result.exit_code();
    } catch (const SecurityViolation& v) {
        if (opts.json) {
            std::cout << "{ \"blocked\": true, \"kind\": " << json_detail::quoted(to_string(v.kind()))
                      << ", \"rule\": " << json_detail::quoted(v.rule_id())
                      << ", \"reason\": " << json_detail::quoted(v.description()) << " }\n";
        } else {
            std::cerr << "[BLOCKED] " << v.what() << "\n";
        }
        return 2;
    } catch (const ExecutionError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return e.kind() == ExecutionError::Kind::Timeout ? 124 : 126;
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    ToolkitConfig config;
    try {
        opts = parse_args(argc, argv);
        config = build_config(opts);
        apply_log_level(config.log_level);
    } catch (const Error& e) {
        std::cerr << "shellguard: " << e.what() << "\n\n";
        usage(std::cerr);
        return 64;
    }

    int status = 0;
    try {
        Toolkit toolkit(config);
        toolkit.open();

        if (opts.show_tools) {
            if (opts.json) {
                auto tools = toolkit_descriptors(toolkit);
                std::cout << "[";
                for (std::size_t i = 0; i < tools.size(); ++i) {
                    std::cout << (i ? ",\n" : "\n") << to_json(tools[i]);
                }
                std::cout << "\n]\n";
            } else {
                std::cout << toolkit.tool_prompt() << "\n";
            }
            toolkit.close();
            return 0;
        }

        if (opts.commands.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line.empty() || line[0] == '#') continue;
                status = run_one(toolkit, line, opts);
            }
        } else {
            for (const auto& command : opts.commands) status = run_one(toolkit, command, opts);
        }

        if (opts.show_diff) {
            auto changes = toolkit.diff();
            if (opts.json) {
                std::cout << to_json(changes) << "\n";
            } else {
                std::cout << "\n" << std::string(55, '-') << "\n"
                          << "  Overlay changes (" << changes.size() << ")\n"
                          << std::string(55, '-') << "\n";
                for (const auto& c : changes) std::cout << "  " << c.kind << "  " << c.path << "\n";
            }
        }
        toolkit.close();
    } catch (const Error& e) {
        std::cerr << "shellguard: " << e.what() << "\n";
        return 1;
    }
    return status;
}
