#include <lode/walker.hpp>
#include <lode/log.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <utility>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace lode {

namespace {

using DevIno = std::pair<uint64_t, uint64_t>;

TimePoint mtime_of(const struct stat& st) {
    auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) +
                       std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

struct Walker {
    const WalkOptions& options;
    const WalkVisitor& visit;
    WalkStats stats;
    std::set<DevIno> visited;
    bool stopped = false;

    // Entries of one directory, sorted by name. Unreadable directories
    // produce an empty list and a warning.
    std::vector<fs::path> list_dir(const fs::path& dir) {
        std::vector<fs::path> entries;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            lode::log::warn("skipping unreadable directory %s: %s",
                            dir.string().c_str(), ec.message().c_str());
            stats.skipped++;
            return entries;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                lode::log::warn("error reading directory %s: %s",
                                dir.string().c_str(), ec.message().c_str());
                stats.skipped++;
                break;
            }
            entries.push_back(it->path());
        }
        std::sort(entries.begin(), entries.end(),
                  [](const fs::path& a, const fs::path& b) {
                      return a.filename().string() < b.filename().string();
                  });
        return entries;
    }

    bool keep_dir(const std::string& rel) {
        if (options.exclude && options.exclude->excludes_dir(rel)) {
            lode::log::trace("excluded directory %s", rel.c_str());
            stats.dirs_pruned++;
            return false;
        }
        if (options.prune_glob && !options.prune_glob->could_match_below(rel)) {
            lode::log::trace("pruned directory %s", rel.c_str());
            stats.dirs_pruned++;
            return false;
        }
        return true;
    }

    void emit_file(const fs::path& abs, const std::string& rel, const struct stat& st) {
        if (options.exclude && options.exclude->excludes_file(rel)) {
            lode::log::trace("excluded file %s", rel.c_str());
            return;
        }
        FileCandidate c;
        c.rel_path = rel;
        c.abs_path = abs;
        c.size = static_cast<uint64_t>(st.st_size);
        c.mtime = mtime_of(st);
        stats.files_yielded++;
        if (!visit(c)) stopped = true;
    }

    void walk_dir(const fs::path& dir, const std::string& rel_dir) {
        stats.dirs_visited++;

        for (const auto& abs : list_dir(dir)) {
            if (stopped) return;

            std::string name = abs.filename().string();
            std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;

            struct stat st;
            if (::lstat(abs.c_str(), &st) != 0) {
                // Vanished between listing and stat
                lode::log::warn("cannot stat %s: %s", rel.c_str(), std::strerror(errno));
                stats.skipped++;
                continue;
            }

            if (S_ISLNK(st.st_mode)) {
                struct stat target;
                if (::stat(abs.c_str(), &target) != 0) {
                    lode::log::debug("skipping broken symlink %s", rel.c_str());
                    stats.skipped++;
                    continue;
                }
                if (S_ISDIR(target.st_mode)) {
                    lode::log::debug("not following symlinked directory %s", rel.c_str());
                    stats.skipped++;
                    continue;
                }
                if (S_ISREG(target.st_mode)) emit_file(abs, rel, target);
                continue;
            }

            if (S_ISDIR(st.st_mode)) {
                if (!keep_dir(rel)) continue;
                DevIno id{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
                if (!visited.insert(id).second) {
                    lode::log::warn("directory cycle detected at %s", rel.c_str());
                    stats.skipped++;
                    continue;
                }
                walk_dir(abs, rel);
                continue;
            }

            if (S_ISREG(st.st_mode)) emit_file(abs, rel, st);
        }
    }
};

} // namespace

Result<WalkStats> walk_files(const fs::path& root,
                             const WalkOptions& options,
                             const WalkVisitor& visit) {
    struct stat st;
    if (::stat(root.c_str(), &st) != 0) {
        return LodeError{LodeError::RootNotFound,
            "search root does not exist: " + root.string()};
    }
    if (!S_ISDIR(st.st_mode)) {
        return LodeError{LodeError::RootNotFound,
            "search root is not a directory: " + root.string()};
    }
    // Unreadable subtrees are skipped, an unreadable root is fatal
    std::error_code ec;
    fs::directory_iterator listing(root, ec);
    if (ec) {
        return LodeError{LodeError::RootNotFound,
            "search root is not readable: " + root.string() + ": " + ec.message()};
    }

    Walker walker{options, visit, {}, {}, false};
    walker.visited.insert({static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)});
    walker.walk_dir(root, "");

    lode::log::debug("walked %s: %zu dirs, %zu files, %zu pruned, %zu skipped",
                     root.string().c_str(), walker.stats.dirs_visited,
                     walker.stats.files_yielded, walker.stats.dirs_pruned,
                     walker.stats.skipped);
    return Result<WalkStats>::ok(walker.stats);
}

} // namespace lode
