#pragma once

#include <lode/glob.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace lode {

// Paths the walker never reports. Empty by default; populated from the
// project's ignore files and/or explicit patterns.
class ExcludeRules {
public:
    ExcludeRules() = default;

    // Built-in directories plus patterns read from tags.ignore, .gitignore,
    // .bb/ignore and .bb/tags.ignore under `root`.
    static ExcludeRules from_ignore_files(const std::filesystem::path& root);

    // Read one ignore file: one pattern per line, '#' comments and blank
    // lines skipped, leading '/' removed. Missing files yield nothing.
    static std::vector<std::string> read_ignore_file(const std::filesystem::path& file);

    // Add a pattern with resource-pattern semantics ('|' alternatives, bare
    // names at any depth, "dir/" for everything below). '!' negations are
    // not supported and are dropped. Duplicates are ignored.
    void add_pattern(const std::string& pattern);

    bool excludes_dir(const std::string& rel_dir) const;
    bool excludes_file(const std::string& rel_path) const;

    bool empty() const { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
    std::vector<CompiledGlob> globs_;
    // "dir/" and "dir/**" also exclude the directory itself
    std::vector<CompiledGlob> dir_globs_;
};

} // namespace lode
