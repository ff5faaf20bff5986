#pragma once

#include <lode/criteria.hpp>
#include <lode/exclude.hpp>
#include <lode/glob.hpp>
#include <lode/result.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace lode {

// A regular file found under the search root.
struct FileCandidate {
    std::string rel_path;             // '/'-separated, relative to root
    std::filesystem::path abs_path;   // for I/O
    uint64_t size = 0;
    TimePoint mtime;
};

struct WalkStats {
    size_t dirs_visited = 0;
    size_t files_yielded = 0;
    size_t dirs_pruned = 0;    // skipped by glob or exclude rules
    size_t skipped = 0;        // unreadable entries, symlinked dirs, cycles
};

struct WalkOptions {
    // Optional; when set, subtrees that cannot contain a match are skipped.
    const CompiledGlob* prune_glob = nullptr;
    // Optional; excluded directories are pruned and excluded files dropped.
    const ExcludeRules* exclude = nullptr;
};

// Return false to stop the walk.
using WalkVisitor = std::function<bool(const FileCandidate&)>;

// Depth-first enumeration of every regular file under `root`, entries of
// each directory in name order. Symlinked directories are not descended
// into. Errors below the root are logged and skipped; only a missing,
// unreadable or non-directory root is an error (RootNotFound).
Result<WalkStats> walk_files(const std::filesystem::path& root,
                             const WalkOptions& options,
                             const WalkVisitor& visit);

} // namespace lode
