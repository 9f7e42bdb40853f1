#include "shellguard/errors.hpp"
#include "shellguard/overlay.hpp"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace shellguard;

// ── Helpers ──────────────────────────────────────────────────────────────────

/// Temporary source tree, removed on scope exit.
struct SourceTree {
    fs::path root;

    SourceTree() {
        std::string tmpl = (fs::temp_directory_path() / "shellguard-src-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        root = fs::canonical(::mkdtemp(buf.data()));
        write("a.txt", "orig");
        write("b.txt", "bee");
        fs::create_directory(root / "d");
        write("d/x.txt", "ex");
    }
    ~SourceTree() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string& rel, const std::string& content) const {
        std::ofstream(root / rel, std::ios::binary) << content;
    }
    std::string read(const std::string& rel) const {
        std::ifstream in(root / rel, std::ios::binary);
        std::ostringstream os;
        os << in.rdbuf();
        return os.str();
    }
};

static std::string names(const std::vector<DirEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        if (!out.empty()) out += ",";
        out += e.name + (e.is_directory ? "/" : "");
    }
    return out;
}

static std::string changes(const std::vector<Change>& diff) {
    std::ostringstream os;
    for (const auto& c : diff) os << c.kind << ":" << c.path << " ";
    return os.str();
}

static int passed = 0;
static int failed = 0;

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

template <typename E, typename F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

// ── Test suites ───────────────────────────────────────────────────────────────

void test_open_close() {
    std::cout << "\n[OpenClose]\n";
    SourceTree src;
    OverlayManager overlay(src.root);

    ASSERT_TRUE("operations before open -> LifecycleError",
                throws<LifecycleError>([&] { overlay.read_file("a.txt"); }));

    overlay.open();
    ASSERT_TRUE("is open", overlay.is_open());
    ASSERT_TRUE("shadow exists", fs::is_directory(overlay.shadow_root()));
    ASSERT_TRUE("shadow outside source",
                overlay.shadow_root().lexically_relative(src.root).string().rfind("..", 0) == 0);
    ASSERT_TRUE("second open -> LifecycleError", throws<LifecycleError>([&] { overlay.open(); }));

    auto shadow = overlay.shadow_root();
    overlay.write_file("a.txt", "changed");
    overlay.close();
    ASSERT_TRUE("shadow removed on close", !fs::exists(shadow));
    ASSERT_EQ("source untouched", std::string("orig"), src.read("a.txt"));

    overlay.close();
    ASSERT_TRUE("second close is a no-op", !overlay.is_open());
    ASSERT_TRUE("operations after close -> LifecycleError",
                throws<LifecycleError>([&] { overlay.write_file("a.txt", "x"); }));

    OverlayManager missing(src.root / "does-not-exist");
    ASSERT_TRUE("missing source -> OverlayIOError", throws<OverlayIOError>([&] { missing.open(); }));

    OverlayManager never_opened(src.root);
    never_opened.close();
    ASSERT_TRUE("close without open is a no-op", !never_opened.is_open());
}

void test_read_write() {
    std::cout << "\n[ReadWrite]\n";
    SourceTree src;
    OverlayManager overlay(src.root);
    overlay.open();

    auto before = overlay.resolve_for_read("a.txt");
    ASSERT_TRUE("unchanged path resolves to source", before && *before == src.root / "a.txt");
    ASSERT_TRUE("missing path -> nullopt", !overlay.resolve_for_read("nope.txt"));

    overlay.write_file("a.txt", "new content");
    ASSERT_EQ("read sees overlay", std::string("new content"), overlay.read_file("a.txt"));
    ASSERT_EQ("source untouched", std::string("orig"), src.read("a.txt"));
    auto after = overlay.resolve_for_read("a.txt");
    ASSERT_TRUE("resolves into shadow", after && after->string().rfind(overlay.shadow_root().string(), 0) == 0);

    auto writable = overlay.resolve_for_write("b.txt");
    std::ifstream copied(writable);
    std::string first;
    copied >> first;
    ASSERT_EQ("first write copies the source content", std::string("bee"), first);
    ASSERT_TRUE("resolve_for_write is idempotent", overlay.resolve_for_write("b.txt") == writable);

    overlay.write_file("sub/deep/new.txt", "fresh");
    ASSERT_EQ("new nested file readable", std::string("fresh"), overlay.read_file("sub/deep/new.txt"));
    ASSERT_TRUE("parents not created in source", !fs::exists(src.root / "sub"));
    ASSERT_EQ("listing shows new directory", std::string("a.txt,b.txt,d/,sub/"),
              names(overlay.list_directory(".")));

    ASSERT_EQ("absolute path inside root", std::string("new content"),
              overlay.read_file((src.root / "a.txt").string()));

    auto diff = overlay.diff();
    ASSERT_EQ("diff lists explicit changes only",
              std::string("Modified:a.txt Modified:b.txt Added:sub/deep/new.txt "), changes(diff));
}

void test_delete() {
    std::cout << "\n[Delete]\n";
    SourceTree src;
    OverlayManager overlay(src.root);
    overlay.open();

    overlay.remove("a.txt");
    ASSERT_TRUE("deleted path -> nullopt", !overlay.resolve_for_read("a.txt"));
    ASSERT_EQ("listing omits deleted file", std::string("b.txt,d/"), names(overlay.list_directory(".")));
    ASSERT_TRUE("real file remains", fs::exists(src.root / "a.txt"));
    ASSERT_TRUE("remove of missing path -> OverlayIOError",
                throws<OverlayIOError>([&] { overlay.remove("a.txt"); }));

    overlay.write_file("a.txt", "back");
    ASSERT_EQ("recreated after delete", std::string("back"), overlay.read_file("a.txt"));

    overlay.remove("d");
    ASSERT_TRUE("children of deleted dir hidden", !overlay.resolve_for_read("d/x.txt"));
    overlay.write_file("d/y.txt", "why");
    ASSERT_EQ("recreated dir is opaque", std::string("y.txt"), names(overlay.list_directory("d")));
    ASSERT_TRUE("source dir untouched", fs::exists(src.root / "d" / "x.txt"));

    overlay.write_file("temp.txt", "t");
    overlay.remove("temp.txt");
    auto diff = changes(overlay.diff());
    ASSERT_TRUE("overlay-only file leaves no trace", diff.find("temp.txt") == std::string::npos);

    overlay.make_directory("made");
    ASSERT_TRUE("make_directory visible", fs::is_directory(*overlay.resolve_for_read("made")));
    ASSERT_TRUE("diff reports made dir", changes(overlay.diff()).find("Added:made") != std::string::npos);
    ASSERT_TRUE("make_directory on a file -> OverlayIOError",
                throws<OverlayIOError>([&] { overlay.make_directory("b.txt"); }));
}

void test_path_escape() {
    std::cout << "\n[PathEscape]\n";
    SourceTree src;
    fs::create_directory_symlink("/etc", src.root / "outside");
    fs::create_symlink("a.txt", src.root / "alias.txt");

    OverlayManager overlay(src.root);
    overlay.open();

    ASSERT_TRUE("../../etc/passwd read",
                throws<PathEscapeError>([&] { overlay.resolve_for_read("../../etc/passwd"); }));
    ASSERT_TRUE("../../etc/passwd write",
                throws<PathEscapeError>([&] { overlay.resolve_for_write("../../etc/passwd"); }));
    ASSERT_TRUE("/etc/passwd read",
                throws<PathEscapeError>([&] { overlay.resolve_for_read("/etc/passwd"); }));
    ASSERT_TRUE("/etc/passwd write",
                throws<PathEscapeError>([&] { overlay.resolve_for_write("/etc/passwd"); }));
    ASSERT_TRUE("symlink leaving the root",
                throws<PathEscapeError>([&] { overlay.resolve_for_read("outside/passwd"); }));
    ASSERT_TRUE("remove outside the root",
                throws<PathEscapeError>([&] { overlay.remove("d/../../x"); }));

    ASSERT_EQ("inner .. is fine", std::string("a.txt"), overlay.canonical_key("d/../a.txt"));
    ASSERT_EQ("symlink aliases share a key", std::string("a.txt"), overlay.canonical_key("alias.txt"));
    ASSERT_EQ("root key", std::string("."), overlay.canonical_key(""));

    overlay.write_file("alias.txt", "via alias");
    ASSERT_EQ("write through alias lands on target", std::string("via alias"), overlay.read_file("a.txt"));
    ASSERT_EQ("source untouched", std::string("orig"), src.read("a.txt"));
}

void test_replaced_symlinks() {
    std::cout << "\n[ReplacedSymlinks]\n";
    SourceTree src;
    fs::create_symlink("a.txt", src.root / "link");
    fs::create_directory_symlink("d", src.root / "dlink");

    OverlayManager overlay(src.root);
    overlay.open();
    ASSERT_EQ("link resolves to its target", std::string("a.txt"), overlay.canonical_key("link"));
    ASSERT_EQ("link itself when not following", std::string("link"), overlay.canonical_key("link", false));

    overlay.remove("link");
    ASSERT_EQ("removing the link keeps the target", std::string("orig"), overlay.read_file("a.txt"));
    ASSERT_TRUE("link hidden", !overlay.resolve_for_read("link"));

    overlay.write_file("link", "new file");
    ASSERT_EQ("rewritten link has its own key", std::string("link"), overlay.canonical_key("link"));
    ASSERT_EQ("new file readable", std::string("new file"), overlay.read_file("link"));
    ASSERT_EQ("old target untouched", std::string("orig"), overlay.read_file("a.txt"));

    overlay.remove("dlink");
    overlay.make_directory("dlink");
    overlay.write_file("dlink/x.txt", "mine");
    ASSERT_EQ("recreated directory is separate", std::string("mine"), overlay.read_file("dlink/x.txt"));
    ASSERT_EQ("old directory target untouched", std::string("ex"), overlay.read_file("d/x.txt"));
    ASSERT_TRUE("source link untouched", fs::is_symlink(src.root / "link"));

    // A command replacing a link with a file.
    OverlayManager second(src.root);
    second.open();
    auto staging = second.stage();
    ASSERT_TRUE("link staged as a link", fs::is_symlink(staging.root / "link"));
    fs::remove(staging.root / "link");
    std::ofstream(staging.root / "link") << "plain";
    second.absorb(staging);
    ASSERT_EQ("replacement kept under the link name", std::string("plain"), second.read_file("link"));
    ASSERT_EQ("target not overwritten", std::string("orig"), second.read_file("a.txt"));
}

void test_concurrent_writes() {
    std::cout << "\n[ConcurrentWrites]\n";
    SourceTree src;
    OverlayManager overlay(src.root);
    overlay.open();

    const std::string a(64 * 1024, 'a');
    const std::string b(64 * 1024, 'b');
    std::thread ta([&] { for (int i = 0; i < 50; ++i) overlay.write_file("race.txt", a); });
    std::thread tb([&] { for (int i = 0; i < 50; ++i) overlay.write_file("race.txt", b); });
    ta.join();
    tb.join();

    auto result = overlay.read_file("race.txt");
    ASSERT_TRUE("one writer's full content wins", result == a || result == b);
}

void test_staging_during_removals() {
    std::cout << "\n[StagingDuringRemovals]\n";
    SourceTree src;
    OverlayManager overlay(src.root);
    overlay.open();

    const int files = 200;
    for (int k = 0; k < files; ++k) overlay.write_file("f" + std::to_string(k), "v0");
    overlay.make_directory("churn");
    overlay.write_file("churn/inner.txt", "v0");

    std::atomic<bool> done { false };
    std::thread churn([&] {
        for (int round = 0; !done; ++round) {
            for (int k = 0; k < files && !done; ++k) {
                auto key = "f" + std::to_string(k);
                overlay.remove(key);
                overlay.write_file(key, "v" + std::to_string(round));
            }
            overlay.remove("churn");
            overlay.make_directory("churn");
            overlay.write_file("churn/inner.txt", "again");
        }
    });

    int failures = 0;
    for (int i = 0; i < 200; ++i) {
        try {
            auto staging = overlay.stage();
            overlay.discard(staging);
        } catch (const Error& e) {
            if (failures++ == 0) std::cout << "  stage failed: " << e.what() << "\n";
        }
    }
    done = true;
    churn.join();

    ASSERT_EQ("stage never fails while files are replaced", 0, failures);
    ASSERT_EQ("source untouched", std::string("orig"), src.read("a.txt"));
}

void test_staging() {
    std::cout << "\n[Staging]\n";
    SourceTree src;
    OverlayManager overlay(src.root);
    overlay.open();
    overlay.write_file("staged.txt", "from overlay");
    overlay.remove("b.txt");

    auto staging = overlay.stage();
    ASSERT_TRUE("staging under the shadow root",
                staging.root.string().rfind(overlay.shadow_root().string(), 0) == 0);
    ASSERT_TRUE("source file materialized", fs::exists(staging.root / "a.txt"));
    ASSERT_TRUE("overlay file materialized", fs::exists(staging.root / "staged.txt"));
    ASSERT_TRUE("deleted file not materialized", !fs::exists(staging.root / "b.txt"));
    ASSERT_TRUE("directories materialized", fs::exists(staging.root / "d" / "x.txt"));

    std::ofstream(staging.root / "a.txt", std::ios::trunc) << "rewritten by a process";
    std::ofstream(staging.root / "created.txt") << "new";
    fs::create_directory(staging.root / "gen");
    std::ofstream(staging.root / "gen" / "out.txt") << "generated";
    fs::remove(staging.root / "d" / "x.txt");

    overlay.absorb(staging);
    ASSERT_TRUE("staging discarded", !fs::exists(staging.root));
    ASSERT_EQ("modified file absorbed", std::string("rewritten by a process"), overlay.read_file("a.txt"));
    ASSERT_EQ("created file absorbed", std::string("new"), overlay.read_file("created.txt"));
    ASSERT_EQ("created dir absorbed", std::string("generated"), overlay.read_file("gen/out.txt"));
    ASSERT_TRUE("removed file absorbed", !overlay.resolve_for_read("d/x.txt"));
    ASSERT_EQ("source untouched", std::string("orig"), src.read("a.txt"));
    ASSERT_TRUE("source keeps d/x.txt", fs::exists(src.root / "d" / "x.txt"));
    ASSERT_TRUE("source gains nothing", !fs::exists(src.root / "created.txt"));
}

int main() {
    std::cout << "=== Overlay Tests ===\n";

    test_open_close();
    test_read_write();
    test_delete();
    test_path_escape();
    test_replaced_symlinks();
    test_concurrent_writes();
    test_staging_during_removals();
    test_staging();

    std::cout << "\n--- Results: " << passed << " passed, "
              << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
