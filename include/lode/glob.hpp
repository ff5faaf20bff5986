#pragma once

#include <string>
#include <vector>

namespace lode {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
// The pattern is anchored at both ends; no '|' or bare-name handling.
bool glob_match(const std::string& pattern, const std::string& path);

// One '|'-separated alternative of a resource pattern.
struct GlobAlternative {
    std::string source;                 // trimmed, normalized text
    std::vector<std::string> segments;  // split on '/'
    bool bare = false;                  // no '/' in the alternative
};

// Resource pattern compiled into an ordered set of segment matchers.
// Compilation never fails: odd input degrades to literal segments, and a
// pattern with no usable alternative rejects every path.
//
// An alternative without '/' is bare and matches the file name at any
// depth ("*.ts", "Dockerfile"). An alternative with '/' is anchored at the
// search root: "src/*.js" matches "src/a.js" but not "pkg/src/a.js"; write
// "**/src/*.js" to match at any depth.
class CompiledGlob {
public:
    CompiledGlob() = default;

    static CompiledGlob compile(const std::string& pattern);

    // True if `rel_path` ('/'-separated, relative to the search root)
    // matches at least one alternative.
    bool matches(const std::string& rel_path) const;

    // True if some file strictly below directory `rel_dir` could match.
    // Used to prune the walk; a false answer is always safe to act on.
    bool could_match_below(const std::string& rel_dir) const;

    bool rejects_all() const { return alternatives_.empty(); }
    const std::string& source() const { return source_; }
    const std::vector<GlobAlternative>& alternatives() const { return alternatives_; }

private:
    std::string source_;
    std::vector<GlobAlternative> alternatives_;
};

// Split a resource pattern on top-level '|' (a '|' inside [...] is literal).
// Alternatives are trimmed; empty ones are dropped.
std::vector<std::string> split_alternatives(const std::string& pattern);

} // namespace lode
