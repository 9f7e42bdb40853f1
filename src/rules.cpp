#include "shellguard/rules.hpp"
#include "shellguard/command_text.hpp"
#include "shellguard/errors.hpp"

namespace shellguard {

// ── Rule ──────────────────────────────────────────────────────────────────────

bool Rule::matches(const std::string& raw, const std::string& normalized) const {
    if (!matcher) return false;
    return std::regex_search(raw, *matcher) || std::regex_search(normalized, *matcher);
}

Rule make_rule(std::string id, Category category, std::string pattern,
               std::string description, Severity severity) {
    std::shared_ptr<const std::regex> matcher;
    try {
        matcher = std::make_shared<const std::regex>(
            pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw ConfigError("rule '" + id + "' has an invalid pattern: " + e.what());
    }
    return { std::move(id), category, std::move(pattern), std::move(description),
             severity, std::move(matcher) };
}

// ── RuleTable ─────────────────────────────────────────────────────────────────

void RuleTable::add_rule(Rule rule) {
    if (rule.id.empty()) {
        throw ConfigError("rule id must not be empty");
    }
    if (find(rule.id)) {
        throw ConfigError("duplicate rule id '" + rule.id + "'");
    }
    if (!rule.matcher) {
        rule = make_rule(rule.id, rule.category, rule.pattern, rule.description, rule.severity);
    }
    rules_.push_back(std::move(rule));
}

const Rule* RuleTable::find(const std::string& id) const {
    for (const auto& rule : rules_) {
        if (rule.id == id) return &rule;
    }
    return nullptr;
}

ScanReport RuleTable::scan(const std::string& command) const {
    ScanReport report;
    report.command = command;
    report.normalized = normalize_command(command);

    for (const auto& rule : rules_) {
        if (rule.matches(report.command, report.normalized)) {
            report.matches.push_back({ rule.id, rule.category, rule.severity, rule.description });
        }
    }
    return report;
}

// ── Default rules ─────────────────────────────────────────────────────────────

RuleTable default_rule_table() {
    RuleTable table;

    // Filesystem destruction
    table.add_rule(make_rule(
        "fs.rm_recursive_root", Category::Filesystem,
        R"re(\brm\b(?=[^;&|\n]*\s-(?:[a-zA-Z]*[rR]|-recursive\b))[^;&|\n]*\s(?:/|~|\$HOME|\$\{HOME\})[^\s/;&|]*/?\*?(?=\s|;|&|\||$))re",
        "Recursive delete of root, a root-level directory or home", Severity::Critical));
    table.add_rule(make_rule(
        "fs.find_delete_root", Category::Filesystem,
        R"re(\bfind\s+(?:/|~)(?=\s)[^;&|\n]*\s-delete\b)re",
        "find -delete starting at root or home", Severity::Critical));
    table.add_rule(make_rule(
        "fs.mkfs", Category::Filesystem,
        R"re(\bmkfs(?:\.\w+)?\b)re",
        "Filesystem creation/destruction", Severity::Critical));
    table.add_rule(make_rule(
        "fs.wipefs", Category::Filesystem,
        R"re(\bwipefs\b)re",
        "Filesystem signature wipe", Severity::Critical));

    // Remote code execution
    table.add_rule(make_rule(
        "rce.fetch_pipe_shell", Category::RCE,
        R"re(\b(?:curl|wget)\b.*\|\s*(?:sudo\s+)?(?:\S*/)?(?:ba|z|da|k|c|tc|fi)?sh\b)re",
        "Remote code execution via curl|sh", Severity::Critical));
    table.add_rule(make_rule(
        "rce.fetch_pipe_interpreter", Category::RCE,
        R"re(\b(?:curl|wget)\b.*\|\s*(?:sudo\s+)?(?:\S*/)?(?:python[0-9.]*|perl|ruby|node|php)\b)re",
        "Remote code execution via curl|python", Severity::Critical));
    table.add_rule(make_rule(
        "rce.fetch_substitution", Category::RCE,
        R"re((?:\b(?:ba|z|da|k)?sh(?:\s+-c)?|\beval|\bsource|(?:^|\s)\.)\s+(?:<\(|\$\(|`)\s*(?:curl|wget)\b)re",
        "Remote code execution via shell substitution of a download", Severity::Critical));
    table.add_rule(make_rule(
        "rce.pipe_to_shell", Category::RCE,
        R"re(\|\s*(?:sudo\s+)?(?:\S*/)?(?:ba|z|da|k|c|tc|fi)?sh\b)re",
        "Output piped into a shell interpreter", Severity::High));
    table.add_rule(make_rule(
        "rce.netcat_listener", Category::RCE,
        R"re(\b(?:nc|ncat|netcat)\b[^;&|\n]*\s-[a-zA-Z]*[le])re",
        "Netcat listener (potential backdoor)", Severity::High));
    table.add_rule(make_rule(
        "rce.dev_tcp", Category::RCE,
        R"re(/dev/(?:tcp|udp)/)re",
        "Network redirection through /dev/tcp (reverse shell)", Severity::Critical));
    table.add_rule(make_rule(
        "rce.ssh_remote", Category::RCE,
        R"re(\bssh\s+.*@)re",
        "SSH connection", Severity::High));

    // Fork bombs and resource exhaustion
    table.add_rule(make_rule(
        "res.fork_bomb", Category::Resource,
        R"re(:\s*\(\s*\)\s*\{.*\})re",
        "Fork bomb pattern", Severity::Critical));
    table.add_rule(make_rule(
        "res.fork_bomb_named", Category::Resource,
        R"re(\b(\w+)\s*\(\s*\)\s*\{[^}]*\b\1\s*\|\s*\1\b)re",
        "Fork bomb pattern (named function)", Severity::Critical));
    table.add_rule(make_rule(
        "res.yes_pipe", Category::Resource,
        R"re((?:^|[;&|(]\s*)(?:\S*/)?yes\b(?:\s+[^\s;&|>]+)?\s*(?:\||>))re",
        "Infinite output pipe", Severity::High));
    table.add_rule(make_rule(
        "res.cat_dev_zero", Category::Resource,
        R"re(\bcat\s+/dev/(?:zero|u?random)\b(?!\s*\|\s*head\b))re",
        "Unbounded read from /dev/zero or /dev/random", Severity::High));
    table.add_rule(make_rule(
        "res.dd_unbounded", Category::Resource,
        R"re(\bdd\b(?![^;&|\n]*\bcount=)[^;&|\n]*\bif=/dev/(?:zero|u?random)\b)re",
        "dd from /dev/zero or /dev/random without count=", Severity::High));
    table.add_rule(make_rule(
        "res.killall", Category::Resource,
        R"re(\bkillall\b)re",
        "Mass process termination", Severity::High));
    table.add_rule(make_rule(
        "res.pkill_force", Category::Resource,
        R"re(\bpkill\s+-(?:9|KILL|SIGKILL)\b)re",
        "Forceful process termination", Severity::High));
    table.add_rule(make_rule(
        "res.kill_all_processes", Category::Resource,
        R"re(\bkill\s+-(?:9|KILL|SIGKILL)\s+-1\b)re",
        "Kill every process", Severity::Critical));

    // Privilege escalation and system modification
    table.add_rule(make_rule(
        "priv.sudo", Category::Privilege,
        R"re(\bsudo\b)re",
        "Privilege escalation via sudo", Severity::Critical));
    table.add_rule(make_rule(
        "priv.su", Category::Privilege,
        R"re((?:^|[;&|(`]|\$\()\s*(?:\S*/)?su(?:\s|$))re",
        "Privilege escalation via su", Severity::Critical));
    table.add_rule(make_rule(
        "priv.doas_pkexec", Category::Privilege,
        R"re(\b(?:doas|pkexec)\b)re",
        "Privilege escalation via doas/pkexec", Severity::Critical));
    table.add_rule(make_rule(
        "priv.setuid", Category::Privilege,
        R"re(\bchmod\s+(?:-\w+\s+)*(?:[ugoa]*\+[rwxXt]*s|[0-7]?[4-7][0-7]{3})\b)re",
        "Setuid/setgid permission change", Severity::High));
    table.add_rule(make_rule(
        "priv.systemctl", Category::Privilege,
        R"re(\bsystemctl\s+(?:--\S+\s+)*(?:stop|disable|mask|poweroff|reboot|halt)\b)re",
        "Service disruption", Severity::High));
    table.add_rule(make_rule(
        "priv.shutdown", Category::Privilege,
        R"re((?:^|[;&|]\s*)(?:\S*/)?(?:shutdown|reboot|halt|poweroff)\b)re",
        "System shutdown or reboot", Severity::High));

    // Direct disk access and root-permission writes
    table.add_rule(make_rule(
        "disk.redirect_block_device", Category::Disk,
        R"re(>\s*/dev/(?:sd[a-z]|hd[a-z]|vd[a-z]|xvd[a-z]|nvme\d|mmcblk\d|disk\d|mapper/))re",
        "Direct disk write", Severity::Critical));
    table.add_rule(make_rule(
        "disk.dd_device", Category::Disk,
        R"re(\bdd\b[^;&|\n]*\bof=/dev/(?!null\b|zero\b|stdout\b|stderr\b))re",
        "Direct disk write via dd", Severity::Critical));
    table.add_rule(make_rule(
        "disk.chmod_root", Category::Disk,
        R"re(\bchmod\s+(?:-\w+\s+)*(?:[0-7]?777|a\+rwx)\s+/[^\s/]*/?(?=\s|$))re",
        "Dangerous permission change on root", Severity::High));
    table.add_rule(make_rule(
        "disk.chown_root", Category::Disk,
        R"re(\bchown\s+(?:-\w+\s+)*-R\b[^;&|\n]*\s/[^\s/]*/?(?=\s|$))re",
        "Recursive ownership change on root", Severity::High));
    table.add_rule(make_rule(
        "disk.write_credentials", Category::Disk,
        R"re(>\s*/etc/(?:passwd|shadow|sudoers|group)\b)re",
        "Write to system credential files", Severity::Critical));

    return table;
}

} // namespace shellguard
