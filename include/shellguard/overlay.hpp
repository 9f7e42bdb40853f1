#pragma once

#include "shellguard/types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace shellguard {

enum class ChangeKind { Added, Modified, Deleted };

inline std::ostream& operator<<(std::ostream& os, ChangeKind k) {
    switch (k) {
        case ChangeKind::Added:    return os << "Added";
        case ChangeKind::Modified: return os << "Modified";
        case ChangeKind::Deleted:  return os << "Deleted";
        default:                   return os << "Unknown";
    }
}

struct Change {
    std::string path;
    ChangeKind  kind;
};

struct DirEntry {
    std::string           name;
    bool                  is_directory = false;
    std::filesystem::path location;   // where the content lives right now
};

/// One mutex per logical path. Entries are created on first use and kept
/// for the lifetime of the table.
class PathLockTable {
public:
    std::unique_lock<std::mutex> lock(const std::string& key);

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

/**
 * Staging
 *
 * A private materialization of the merged view in which one spawned process
 * runs. The baseline records what was copied in so that absorb() can tell
 * which entries the process created, changed or removed.
 */
struct Staging {
    enum class Kind { File, Directory, Symlink };

    struct Baseline {
        Kind                            kind;
        std::uintmax_t                  size = 0;
        std::filesystem::file_time_type mtime;
    };

    std::filesystem::path           root;
    std::map<std::string, Baseline> baseline;
};

/**
 * OverlayManager
 *
 * Copy-on-write shadow layer over a source directory. The path index is the
 * only authority on where a logical path lives:
 *
 *   absent    -> unchanged, served from the source root
 *   Overlaid  -> served from the shadow copy
 *   Deleted   -> reported as not found
 *
 * Keys are canonical paths relative to the source root ("." for the root).
 * Symlinks are resolved before indexing, so two spellings of one file share
 * an entry, and anything resolving outside the root is a PathEscapeError.
 * The source root is never written.
 */
class OverlayManager {
public:
    explicit OverlayManager(std::filesystem::path source_root);
    ~OverlayManager();

    OverlayManager(const OverlayManager&) = delete;
    OverlayManager& operator=(const OverlayManager&) = delete;

    void open();
    void close();

    std::optional<std::filesystem::path> resolve_for_read(const std::string& path) const;
    std::filesystem::path resolve_for_write(const std::string& path);
    void remove(const std::string& path);
    void make_directory(const std::string& path);

    std::string read_file(const std::string& path) const;
    void write_file(const std::string& path, const std::string& content);

    std::vector<DirEntry> list_directory(const std::string& path) const;
    std::vector<Change> diff() const;

    Staging stage();
    void absorb(const Staging& staging);
    void discard(const Staging& staging) noexcept;

    /// Canonical key for `path`; throws PathEscapeError when it leaves the root.
    /// Source symlinks are resolved unless the overlay has replaced or deleted
    /// them. With `follow_final` false the last component names the link itself.
    std::string canonical_key(const std::string& path, bool follow_final = true) const;

    bool is_open() const { return state_ == LifecycleState::Open; }
    const std::filesystem::path& source_root() const { return source_root_; }
    const std::filesystem::path& shadow_root() const { return shadow_root_; }

private:
    struct Entry {
        enum class Kind { Overlaid, Deleted };
        Kind                  kind = Kind::Overlaid;
        std::filesystem::path shadow;
        bool                  is_directory = false;
        bool                  opaque = false;     // hides the source directory's children
        bool                  implicit = false;   // created only to hold a descendant
    };

    void require_open(const char* operation) const;
    std::filesystem::path relative_to_root(const std::filesystem::path& absolute,
                                           const std::string& path) const;

    // *_locked members expect index_mutex_ to be held by the caller.
    std::optional<std::filesystem::path> lookup_locked(const std::string& key) const;
    bool source_visible_locked(const std::string& key) const;

    // Members below expect the per-path lock for `key` to be held.
    void ensure_parents(const std::string& key);
    std::filesystem::path prepare_shadow(const std::string& key, bool copy_current, bool directory);
    void remove_key(const std::string& key, bool must_exist);

    void commit_file(const std::string& key, const std::filesystem::path& content);
    void remove_if_present(const std::string& path);
    void replace_shadow(const std::filesystem::path& shadow, const std::filesystem::path& filled);
    std::filesystem::path temp_path();
    void materialize(const std::string& key, const std::filesystem::path& dest, Staging& staging);

    std::filesystem::path          source_root_;
    std::filesystem::path          shadow_root_;
    std::filesystem::path          upper_;
    std::filesystem::path          runs_;
    std::filesystem::path          tmp_;
    std::atomic<LifecycleState>    state_ { LifecycleState::Created };
    std::atomic<unsigned>          run_counter_ { 0 };
    std::atomic<unsigned>          temp_counter_ { 0 };

    mutable std::mutex             index_mutex_;
    std::map<std::string, Entry>   index_;
    PathLockTable                  path_locks_;
};

} // namespace shellguard
