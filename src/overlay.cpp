#include "shellguard/overlay.hpp"
#include "shellguard/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace shellguard {

namespace {

bool escapes(const fs::path& relative) {
    return !relative.empty() && *relative.begin() == "..";
}

bool is_within(const fs::path& path, const fs::path& root) {
    auto relative = path.lexically_relative(root);
    return !relative.empty() && !escapes(relative);
}

std::string parent_key(const std::string& key) {
    auto slash = key.rfind('/');
    return slash == std::string::npos ? "." : key.substr(0, slash);
}

std::string leaf_name(const std::string& key) {
    auto slash = key.rfind('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

std::string join_key(const std::string& parent, const std::string& name) {
    return parent == "." ? name : parent + "/" + name;
}

bool vanished(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

std::string with_reason(const std::string& message, const std::error_code& ec) {
    return message + " (" + ec.message() + ")";
}

void push_components(const fs::path& path, std::vector<std::string>& pending) {
    std::vector<std::string> parts;
    for (const auto& part : path) {
        auto text = part.string();
        if (!text.empty() && text != "." && text != "/") parts.push_back(text);
    }
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) pending.push_back(*it);
}

std::string join_components(const std::vector<std::string>& parts) {
    std::string key;
    for (const auto& part : parts) key = key.empty() ? part : key + "/" + part;
    return key.empty() ? "." : key;
}

} // namespace

// ── PathLockTable ─────────────────────────────────────────────────────────────

std::unique_lock<std::mutex> PathLockTable::lock(const std::string& key) {
    std::shared_ptr<std::mutex> m;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = locks_[key];
        if (!slot) slot = std::make_shared<std::mutex>();
        m = slot;
    }
    // The table never drops entries, so the mutex outlives the returned lock.
    return std::unique_lock<std::mutex>(*m);
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

OverlayManager::OverlayManager(fs::path source_root) : source_root_(std::move(source_root)) {}

OverlayManager::~OverlayManager() {
    try {
        close();
    } catch (const Error& e) {
        spdlog::error("overlay cleanup failed: {}", e.what());
    }
}

void OverlayManager::open() {
    if (state_ != LifecycleState::Created) {
        throw LifecycleError("overlay open", state_.load());
    }

    std::error_code ec;
    auto canonical = fs::canonical(source_root_, ec);
    if (ec || !fs::is_directory(canonical)) {
        throw OverlayIOError("source root is not a directory", source_root_);
    }
    source_root_ = canonical;

    auto temp = fs::temp_directory_path(ec);
    if (ec) throw OverlayIOError(with_reason("no temporary directory", ec), "");

    std::string tmpl = (temp / "shellguard-XXXXXX").string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    if (!::mkdtemp(buffer.data())) {
        throw OverlayIOError(std::string("cannot create shadow directory: ") + std::strerror(errno), tmpl);
    }
    shadow_root_ = fs::canonical(buffer.data(), ec);
    if (ec) shadow_root_ = buffer.data();

    auto abandon = [this](const std::string& message) {
        std::error_code ignored;
        fs::remove_all(shadow_root_, ignored);
        throw OverlayIOError(message, shadow_root_);
    };

    if (is_within(shadow_root_, source_root_)) {
        abandon("shadow directory would be nested inside the source root");
    }

    upper_ = shadow_root_ / "upper";
    runs_  = shadow_root_ / "runs";
    tmp_   = shadow_root_ / "tmp";
    for (const auto& dir : { upper_, runs_, tmp_ }) {
        if (!fs::create_directory(dir, ec) || ec) {
            abandon(with_reason("cannot create shadow layout", ec));
        }
    }

    state_ = LifecycleState::Open;
    spdlog::debug("overlay opened: source={} shadow={}", source_root_.string(), shadow_root_.string());
}

void OverlayManager::close() {
    LifecycleState expected = LifecycleState::Open;
    if (!state_.compare_exchange_strong(expected, LifecycleState::Closed)) {
        return;  // never opened, or already closed
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        index_.clear();
    }

    std::error_code ec;
    fs::remove_all(shadow_root_, ec);
    if (ec) {
        throw OverlayIOError(with_reason("cannot remove shadow directory", ec), shadow_root_);
    }
    spdlog::debug("overlay closed: shadow {} removed", shadow_root_.string());
}

void OverlayManager::require_open(const char* operation) const {
    if (state_ != LifecycleState::Open) {
        throw LifecycleError(std::string("overlay ") + operation, state_.load());
    }
}

// ── Path resolution ───────────────────────────────────────────────────────────

fs::path OverlayManager::relative_to_root(const fs::path& absolute, const std::string& path) const {
    auto relative = absolute.lexically_normal().lexically_relative(source_root_);
    if (relative.empty() || escapes(relative)) {
        // The root may be named through an alias, such as a symlinked /tmp.
        std::error_code ec;
        auto resolved = fs::weakly_canonical(absolute, ec);
        if (!ec) relative = resolved.lexically_relative(source_root_);
    }
    if (relative.empty() || escapes(relative)) throw PathEscapeError(path);
    return relative;
}

std::string OverlayManager::canonical_key(const std::string& path, bool follow_final) const {
    fs::path logical(path);
    auto relative = logical.is_absolute() ? relative_to_root(logical, path) : logical.lexically_normal();
    if (escapes(relative)) throw PathEscapeError(path);

    std::vector<std::string> pending;    // next component at the back
    push_components(relative, pending);
    std::vector<std::string> resolved;
    int links = 0;

    // Source symlinks are followed one component at a time, except where the
    // overlay already holds its own entry for the path.
    std::lock_guard<std::mutex> lock(index_mutex_);
    while (!pending.empty()) {
        auto part = pending.back();
        pending.pop_back();
        if (part == "..") {
            if (resolved.empty()) throw PathEscapeError(path);
            resolved.pop_back();
            continue;
        }
        resolved.push_back(part);
        if (pending.empty() && !follow_final) break;

        auto key = join_components(resolved);
        if (index_.count(key)) continue;
        auto source = source_root_ / key;
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(source, ec))) continue;

        if (++links > 40) throw OverlayIOError("too many levels of symbolic links", source);
        auto target = fs::read_symlink(source, ec);
        if (ec) throw OverlayIOError(with_reason("cannot read link", ec), source);
        resolved.pop_back();
        if (target.is_absolute()) {
            target = relative_to_root(target, path);
            resolved.clear();
        }
        push_components(target, pending);
    }
    return join_components(resolved);
}

std::optional<fs::path> OverlayManager::lookup_locked(const std::string& key) const {
    auto it = index_.find(key);
    if (it != index_.end()) {
        if (it->second.kind == Entry::Kind::Deleted) return std::nullopt;
        return it->second.shadow;
    }
    if (!source_visible_locked(key)) return std::nullopt;
    return key == "." ? source_root_ : source_root_ / key;
}

bool OverlayManager::source_visible_locked(const std::string& key) const {
    if (key != ".") {
        for (auto a = parent_key(key); a != "."; a = parent_key(a)) {
            auto it = index_.find(a);
            if (it == index_.end()) continue;
            if (it->second.kind == Entry::Kind::Deleted || it->second.opaque) return false;
        }
    }
    std::error_code ec;
    auto status = fs::symlink_status(key == "." ? source_root_ : source_root_ / key, ec);
    return !ec && fs::exists(status);
}

std::optional<fs::path> OverlayManager::resolve_for_read(const std::string& path) const {
    require_open("read");
    auto key = canonical_key(path);
    std::lock_guard<std::mutex> lock(index_mutex_);
    return lookup_locked(key);
}

fs::path OverlayManager::resolve_for_write(const std::string& path) {
    require_open("write");
    auto key = canonical_key(path);
    if (key == ".") throw OverlayIOError("cannot replace the source root", source_root_);
    auto guard = path_locks_.lock(key);
    return prepare_shadow(key, true, false);
}

// ── Copy-on-write ─────────────────────────────────────────────────────────────

void OverlayManager::ensure_parents(const std::string& key) {
    std::vector<std::string> chain;
    for (auto a = parent_key(key); a != "."; a = parent_key(a)) chain.push_back(a);
    std::reverse(chain.begin(), chain.end());

    std::lock_guard<std::mutex> lock(index_mutex_);
    for (const auto& dir : chain) {
        auto upper = upper_ / dir;
        std::error_code ec;
        auto it = index_.find(dir);
        bool recreate = false;

        if (it != index_.end() && it->second.kind == Entry::Kind::Overlaid) {
            if (!it->second.is_directory) throw OverlayIOError("not a directory", source_root_ / dir);
            fs::create_directories(upper, ec);
            if (ec) throw OverlayIOError(with_reason("cannot create shadow directory", ec), upper);
            continue;
        }
        if (it != index_.end()) {
            recreate = true;   // deleted earlier, now needed again
        } else if (auto existing = lookup_locked(dir)) {
            if (!fs::is_directory(*existing)) throw OverlayIOError("not a directory", *existing);
            fs::create_directories(upper, ec);
            if (ec) throw OverlayIOError(with_reason("cannot create shadow directory", ec), upper);
            continue;
        }

        fs::create_directories(upper, ec);
        if (ec) throw OverlayIOError(with_reason("cannot create shadow directory", ec), upper);

        Entry entry;
        entry.shadow = upper;
        entry.is_directory = true;
        entry.opaque = recreate;
        entry.implicit = !recreate;
        index_[dir] = entry;
    }
}

fs::path OverlayManager::prepare_shadow(const std::string& key, bool copy_current, bool directory) {
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = index_.find(key);
        if (it != index_.end() && it->second.kind == Entry::Kind::Overlaid) {
            if (!directory) it->second.implicit = false;
            return it->second.shadow;
        }
    }

    ensure_parents(key);

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = index_.find(key);
    bool was_deleted = it != index_.end() && it->second.kind == Entry::Kind::Deleted;
    auto current = was_deleted ? std::nullopt : lookup_locked(key);
    bool is_directory = current ? fs::is_directory(*current) : directory;
    auto shadow = upper_ / key;

    std::error_code ec;
    if (is_directory) {
        fs::create_directories(shadow, ec);
    } else if (current && copy_current) {
        fs::copy_file(*current, shadow, fs::copy_options::overwrite_existing, ec);
    } else {
        std::ofstream out(shadow, std::ios::binary | std::ios::trunc);
        if (!out) ec = std::make_error_code(std::errc::io_error);
    }
    if (ec) throw OverlayIOError(with_reason("cannot create shadow copy", ec), shadow);

    Entry entry;
    entry.shadow = shadow;
    entry.is_directory = is_directory;
    entry.opaque = was_deleted && is_directory;
    index_[key] = entry;
    return shadow;
}

fs::path OverlayManager::temp_path() {
    return tmp_ / ("t" + std::to_string(++temp_counter_));
}

void OverlayManager::replace_shadow(const fs::path& shadow, const fs::path& filled) {
    std::error_code ec;
    fs::rename(filled, shadow, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(filled, ignored);
        throw OverlayIOError(with_reason("cannot replace shadow file", ec), shadow);
    }
}

void OverlayManager::write_file(const std::string& path, const std::string& content) {
    require_open("write");
    auto key = canonical_key(path);
    if (key == ".") throw OverlayIOError("cannot replace the source root", source_root_);

    auto guard = path_locks_.lock(key);
    auto shadow = prepare_shadow(key, false, false);
    if (fs::is_directory(shadow)) throw OverlayIOError("is a directory", source_root_ / key);

    auto temp = temp_path();
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) throw OverlayIOError("cannot write shadow file", temp);
    replace_shadow(shadow, temp);
}

void OverlayManager::commit_file(const std::string& key, const fs::path& content) {
    auto guard = path_locks_.lock(key);
    auto shadow = prepare_shadow(key, false, false);
    if (fs::is_directory(shadow)) throw OverlayIOError("is a directory", source_root_ / key);

    auto temp = temp_path();
    std::error_code ec;
    fs::copy_file(content, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) throw OverlayIOError(with_reason("cannot copy staged file", ec), content);
    replace_shadow(shadow, temp);
}

void OverlayManager::make_directory(const std::string& path) {
    require_open("mkdir");
    auto key = canonical_key(path);
    auto guard = path_locks_.lock(key);
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (auto current = lookup_locked(key)) {
            if (!fs::is_directory(*current)) throw OverlayIOError("file exists", *current);
            auto it = index_.find(key);
            if (it != index_.end()) it->second.implicit = false;
            return;
        }
    }
    prepare_shadow(key, false, true);
}

void OverlayManager::remove(const std::string& path) {
    require_open("remove");
    auto key = canonical_key(path, false);
    if (key == ".") throw OverlayIOError("cannot remove the source root", source_root_);
    auto guard = path_locks_.lock(key);
    remove_key(key, true);
}

void OverlayManager::remove_if_present(const std::string& path) {
    auto key = canonical_key(path, false);
    if (key == ".") return;
    auto guard = path_locks_.lock(key);
    remove_key(key, false);
}

void OverlayManager::remove_key(const std::string& key, bool must_exist) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    if (!lookup_locked(key)) {
        if (must_exist) throw OverlayIOError("no such file or directory", source_root_ / key);
        return;
    }

    auto prefix = key + "/";
    for (auto it = index_.lower_bound(prefix);
         it != index_.end() && it->first.compare(0, prefix.size(), prefix) == 0;) {
        it = index_.erase(it);
    }

    std::error_code ec;
    fs::remove_all(upper_ / key, ec);
    if (ec) throw OverlayIOError(with_reason("cannot drop shadow copy", ec), upper_ / key);

    if (source_visible_locked(key)) {
        Entry entry;
        entry.kind = Entry::Kind::Deleted;
        index_[key] = entry;
    } else {
        index_.erase(key);
    }
}

// ── Merged view ───────────────────────────────────────────────────────────────

std::string OverlayManager::read_file(const std::string& path) const {
    auto location = resolve_for_read(path);
    if (!location) throw OverlayIOError("no such file", source_root_ / path);
    if (fs::is_directory(*location)) throw OverlayIOError("is a directory", *location);

    std::ifstream in(*location, std::ios::binary);
    if (!in) throw OverlayIOError("cannot open file", *location);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

std::vector<DirEntry> OverlayManager::list_directory(const std::string& path) const {
    require_open("list");
    auto key = canonical_key(path);

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto location = lookup_locked(key);
    if (!location || !fs::is_directory(*location)) {
        throw OverlayIOError("not a directory", source_root_ / key);
    }

    std::map<std::string, DirEntry> merged;
    auto self = index_.find(key);
    bool opaque = self != index_.end() && self->second.opaque;
    auto source_dir = key == "." ? source_root_ : source_root_ / key;

    if (!opaque && source_visible_locked(key) && fs::is_directory(source_dir)) {
        std::error_code ec;
        for (fs::directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
            auto name = it->path().filename().string();
            auto child = index_.find(join_key(key, name));
            if (child != index_.end()) {
                if (child->second.kind == Entry::Kind::Deleted) continue;
                merged[name] = { name, child->second.is_directory, child->second.shadow };
                continue;
            }
            std::error_code dir_ec;
            merged[name] = { name, fs::is_directory(it->path(), dir_ec), it->path() };
        }
        if (ec) throw OverlayIOError(with_reason("cannot list directory", ec), source_dir);
    }

    for (const auto& item : index_) {
        const auto& entry = item.second;
        if (entry.kind != Entry::Kind::Overlaid || item.first == "." || parent_key(item.first) != key) continue;
        auto name = leaf_name(item.first);
        merged[name] = { name, entry.is_directory, entry.shadow };
    }

    std::vector<DirEntry> entries;
    entries.reserve(merged.size());
    for (auto& item : merged) entries.push_back(std::move(item.second));
    return entries;
}

std::vector<Change> OverlayManager::diff() const {
    std::vector<Change> changes;
    std::lock_guard<std::mutex> lock(index_mutex_);
    for (const auto& item : index_) {
        const auto& entry = item.second;
        if (entry.implicit) continue;
        if (entry.kind == Entry::Kind::Deleted) {
            changes.push_back({ item.first, ChangeKind::Deleted });
            continue;
        }
        std::error_code ec;
        bool in_source = fs::exists(fs::symlink_status(source_root_ / item.first, ec));
        changes.push_back({ item.first, in_source ? ChangeKind::Modified : ChangeKind::Added });
    }
    return changes;
}

// ── Process staging ───────────────────────────────────────────────────────────

Staging OverlayManager::stage() {
    require_open("stage");

    Staging staging;
    staging.root = runs_ / ("run-" + std::to_string(++run_counter_));
    std::error_code ec;
    fs::create_directory(staging.root, ec);
    if (ec) throw OverlayIOError(with_reason("cannot create staging directory", ec), staging.root);

    try {
        materialize(".", staging.root, staging);
    } catch (...) {
        discard(staging);
        throw;
    }
    spdlog::debug("staged {} entries into {}", staging.baseline.size(), staging.root.string());
    return staging;
}

void OverlayManager::materialize(const std::string& key, const fs::path& dest, Staging& staging) {
    // Other commands keep absorbing while this one stages. An entry removed
    // in the meantime is left out, as if staging had started after the removal.
    std::vector<DirEntry> entries;
    try {
        entries = list_directory(key);
    } catch (const OverlayIOError&) {
        if (key == "." || resolve_for_read(key)) throw;
        spdlog::debug("staging skips {}: removed while staging", key);
        return;
    }

    for (const auto& entry : entries) {
        auto child = join_key(key, entry.name);
        auto target = dest / entry.name;
        std::error_code ec;
        auto status = fs::symlink_status(entry.location, ec);
        if (vanished(ec) || (!ec && !fs::exists(status))) {
            spdlog::debug("staging skips {}: removed while staging", child);
            continue;
        }
        if (ec) throw OverlayIOError(with_reason("cannot stat", ec), entry.location);

        if (fs::is_symlink(status)) {
            std::string resolved;
            try {
                resolved = canonical_key(child);
            } catch (const PathEscapeError&) {
                spdlog::debug("staging skips {}: link target is outside the source root", child);
                continue;
            }
            fs::path link = key == "." ? fs::path(resolved) : fs::path(resolved).lexically_relative(key);
            fs::create_symlink(link, target, ec);
            if (ec) throw OverlayIOError(with_reason("cannot stage symlink", ec), target);
            staging.baseline[child] = { Staging::Kind::Symlink, 0, {} };
            continue;
        }

        if (entry.is_directory) {
            fs::create_directory(target, ec);
            if (ec) throw OverlayIOError(with_reason("cannot stage directory", ec), target);
            staging.baseline[child] = { Staging::Kind::Directory, 0, {} };
            materialize(child, target, staging);
            continue;
        }

        if (!fs::is_regular_file(status)) {
            spdlog::debug("staging skips {}: not a regular file", child);
            continue;
        }
        fs::copy_file(entry.location, target, ec);
        if (vanished(ec)) {
            spdlog::debug("staging skips {}: removed while staging", child);
            continue;
        }
        if (ec) throw OverlayIOError(with_reason("cannot stage file", ec), target);
        auto size = fs::file_size(target, ec);
        auto mtime = fs::last_write_time(target, ec);
        if (ec) throw OverlayIOError(with_reason("cannot stat staged file", ec), target);
        staging.baseline[child] = { Staging::Kind::File, size, mtime };
    }
}

void OverlayManager::absorb(const Staging& staging) {
    try {
        require_open("absorb");

        std::set<std::string> seen;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(staging.root, ec), end; !ec && it != end; it.increment(ec)) {
            auto key = it->path().lexically_relative(staging.root).generic_string();
            seen.insert(key);
            auto base = staging.baseline.find(key);
            bool known = base != staging.baseline.end();

            std::error_code st_ec;
            auto status = it->symlink_status(st_ec);
            if (st_ec) throw OverlayIOError(with_reason("cannot stat", st_ec), it->path());

            try {
                if (fs::is_symlink(status)) {
                    if (!known || base->second.kind != Staging::Kind::Symlink) {
                        spdlog::warn("ignoring symlink {} created by the command", key);
                    }
                } else if (fs::is_directory(status)) {
                    if (!known || base->second.kind != Staging::Kind::Directory) {
                        if (known) remove_if_present(key);
                        make_directory(key);
                    }
                } else if (fs::is_regular_file(status)) {
                    bool unchanged = known
                        && base->second.kind == Staging::Kind::File
                        && base->second.size == fs::file_size(it->path())
                        && base->second.mtime == fs::last_write_time(it->path());
                    if (!unchanged) {
                        if (known && base->second.kind != Staging::Kind::File) remove_if_present(key);
                        commit_file(canonical_key(key), it->path());
                    }
                }
            } catch (const PathEscapeError& e) {
                spdlog::warn("command output {} not kept: {}", key, e.what());
            }
        }
        if (ec) throw OverlayIOError(with_reason("cannot scan staging directory", ec), staging.root);

        for (const auto& item : staging.baseline) {
            if (seen.count(item.first)) continue;
            remove_if_present(item.first);
        }
    } catch (...) {
        discard(staging);
        throw;
    }
    discard(staging);
}

void OverlayManager::discard(const Staging& staging) noexcept {
    std::error_code ec;
    fs::remove_all(staging.root, ec);
    if (ec) {
        spdlog::error("cannot remove staging directory {}: {}", staging.root.string(), ec.message());
    }
}

} // namespace shellguard
