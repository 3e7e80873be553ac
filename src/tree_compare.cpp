#include "tree_compare.hpp"

#include <cstdio>
#include <climits>

#include <dirent.h>

#include "base_host.hpp"
#include "digest.hpp"
#include "process.hpp"

namespace {

std::string join_path(const std::string &dir, const std::string &name) {
    if (dir.empty()) return name;
    return dir + "/" + name;
}

TreeEntry::Kind kind_of(mode_t mode) {
    if (S_ISREG(mode)) return TreeEntry::Kind::FILE;
    if (S_ISDIR(mode)) return TreeEntry::Kind::DIR;
    if (S_ISLNK(mode)) return TreeEntry::Kind::SYMLINK;
    return TreeEntry::Kind::OTHER;
}

}  // namespace

bool TreeSnapshot::load(const std::string &root) {
    entries_.clear();
    digests_.clear();
    root_ = root;
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
    if (!is_directory(root_.c_str())) {
        LOGE("Not a directory: %s\n", root_.c_str());
        return false;
    }
    return walk("");
}

bool TreeSnapshot::walk(const std::string &rel_dir) {
    std::string abs_dir = rel_dir.empty() ? root_ : join_path(root_, rel_dir);
    DIR *d = ::opendir(abs_dir.c_str());
    if (!d) {
        PLOGE("opendir %s", abs_dir.c_str());
        return false;
    }
    std::vector<std::string> subdirs;
    while (struct dirent *ent = ::readdir(d)) {
        if (ent->d_name[0] == '.' && (ent->d_name[1] == '\0' ||
            (ent->d_name[1] == '.' && ent->d_name[2] == '\0')))
            continue;
        std::string rel = join_path(rel_dir, ent->d_name);
        std::string abs = join_path(root_, rel);
        struct stat st{};
        if (::lstat(abs.c_str(), &st) < 0) {
            PLOGE("lstat %s", abs.c_str());
            ::closedir(d);
            return false;
        }
        TreeEntry entry;
        entry.kind = kind_of(st.st_mode);
        if (entry.kind == TreeEntry::Kind::FILE) {
            entry.size = static_cast<std::uint64_t>(st.st_size);
        } else if (entry.kind == TreeEntry::Kind::SYMLINK) {
            char target[PATH_MAX];
            ssize_t n = ::readlink(abs.c_str(), target, sizeof(target) - 1);
            if (n < 0) {
                PLOGE("readlink %s", abs.c_str());
                ::closedir(d);
                return false;
            }
            entry.link.assign(target, static_cast<std::size_t>(n));
        } else if (entry.kind == TreeEntry::Kind::DIR) {
            subdirs.push_back(rel);
        }
        entries_[rel] = std::move(entry);
    }
    ::closedir(d);

    for (const auto &sub : subdirs) {
        if (!walk(sub)) {
            return false;
        }
    }
    return true;
}

bool TreeSnapshot::digest(const std::string &rel_path, std::string &out) const {
    auto it = digests_.find(rel_path);
    if (it != digests_.end()) {
        out = it->second;
        return true;
    }
    std::string abs = join_path(root_, rel_path);
    if (!sha256_file(abs.c_str(), out)) {
        return false;
    }
    digests_[rel_path] = out;
    return true;
}

bool compare_trees(const TreeSnapshot &src, const TreeSnapshot &dst, std::vector<TreeDiff> &out) {
    out.clear();
    const auto &a = src.entries();
    const auto &b = dst.entries();
    auto ia = a.begin();
    auto ib = b.begin();

    // Both maps are sorted by path; walk them side by side.
    while (ia != a.end() || ib != b.end()) {
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            out.push_back({'+', ia->first});
            ++ia;
            continue;
        }
        if (ia == a.end() || ib->first < ia->first) {
            out.push_back({'-', ib->first});
            ++ib;
            continue;
        }

        const TreeEntry &ea = ia->second;
        const TreeEntry &eb = ib->second;
        if (ea.kind != eb.kind) {
            out.push_back({'t', ia->first});
        } else if (ea.kind == TreeEntry::Kind::SYMLINK && ea.link != eb.link) {
            out.push_back({'l', ia->first});
        } else if (ea.kind == TreeEntry::Kind::FILE) {
            if (ea.size != eb.size) {
                out.push_back({'c', ia->first});
            } else {
                std::string da, db;
                if (!src.digest(ia->first, da) || !dst.digest(ib->first, db)) {
                    return false;
                }
                if (da != db) {
                    out.push_back({'c', ia->first});
                }
            }
        }
        ++ia;
        ++ib;
    }
    return true;
}

int compare_directories(const std::string &src, const std::string &dst) {
    TreeSnapshot a, b;
    if (!a.load(src) || !b.load(dst)) {
        return 1;
    }
    LOGI("* Comparing %zu entries against %zu entries...\n", a.entries().size(), b.entries().size());

    std::vector<TreeDiff> diffs;
    if (!compare_trees(a, b, diffs)) {
        return 1;
    }
    for (const auto &d : diffs) {
        std::printf("%c %s\n", d.code, d.path.c_str());
    }
    LOGI("    Differences: %zu\n", diffs.size());
    return 0;
}

int compare_remote(const std::string &src, const std::string &dst) {
    std::string from = src;
    if (from.empty() || from.back() != '/') {
        from.push_back('/');
    }
    int status = exec_command({"rsync", "--recursive", "--links", "--dry-run", "--checksum",
                               "--delete", "--itemize-changes", from, dst});
    if (status != 0) {
        LOGE("rsync exited with status %d\n", status);
        return 1;
    }
    return 0;
}

bool is_remote_path(const std::string &path) {
    auto colon = path.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    auto slash = path.find('/');
    return slash == std::string::npos || colon < slash;
}
