#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct TreeEntry {
    enum class Kind : std::uint8_t {
        FILE,
        DIR,
        SYMLINK,
        OTHER,
    };

    Kind kind = Kind::OTHER;
    std::uint64_t size = 0;
    std::string link;
};

// Flat view of a directory tree keyed by path relative to its root.
// Symlinks are recorded, never followed.
class TreeSnapshot {
public:
    bool load(const std::string &root);

    const std::string &root() const { return root_; }
    const std::map<std::string, TreeEntry> &entries() const { return entries_; }

    // SHA-256 of a regular file, computed on first use.
    bool digest(const std::string &rel_path, std::string &out) const;

private:
    bool walk(const std::string &rel_dir);

    std::string root_;
    std::map<std::string, TreeEntry> entries_;
    mutable std::map<std::string, std::string> digests_;
};

struct TreeDiff {
    // '+' only in source, '-' only in destination, 'c' contents differ,
    // 't' entry type differs, 'l' symlink target differs.
    char code;
    std::string path;
};

// What a checksum-based sync from `src` to `dst` would change, sorted by path.
// Returns false when a file could not be read.
bool compare_trees(const TreeSnapshot &src, const TreeSnapshot &dst, std::vector<TreeDiff> &out);

// Dry-run comparison of two local directories, printed to stdout.
int compare_directories(const std::string &src, const std::string &dst);

// Dry-run comparison against `host:path` through rsync.
int compare_remote(const std::string &src, const std::string &dst);

// rsync-style remote destination: a ':' appears before any '/'.
bool is_remote_path(const std::string &path);
