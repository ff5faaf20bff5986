#pragma once

#include <lode/result.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace lode {

// Default read size and look-back window for streaming scans. A match that
// straddles a chunk boundary is guaranteed to be found as long as it is no
// longer than carry_over + 1 bytes.
constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr size_t DEFAULT_CARRY_OVER = 32 * 1024;

// A content regular expression, compiled once per search.
//
// Grammar is RE2's Perl-like syntax: classes, alternation, greedy and lazy
// quantifiers, groups, \b and inline flags. Matching runs in time linear in
// the input. Lookaround and backreferences are not supported and are
// rejected at compile time.
class ContentPattern {
public:
    // Fails with InvalidPattern; the message starts with
    // "Invalid regular expression: /<source>/<flags>: ".
    static Result<ContentPattern> compile(const std::string& source, bool case_sensitive);

    const std::string& source() const { return source_; }
    bool case_sensitive() const { return case_sensitive_; }

    const re2::RE2& regex() const { return *regex_; }

private:
    std::string source_;
    bool case_sensitive_ = false;
    std::shared_ptr<const re2::RE2> regex_;
};

// Incremental UTF-8 well-formedness check. Sequences may be split across
// feed() calls.
class Utf8Validator {
public:
    // Returns false once any ill-formed byte has been seen.
    bool feed(const char* data, size_t len);
    // True if everything fed so far is well formed and no sequence is open.
    bool complete() const { return ok_ && need_ == 0; }

private:
    bool ok_ = true;
    int need_ = 0;
    unsigned char lo_ = 0x80;
    unsigned char hi_ = 0xBF;
};

struct StreamOptions {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t carry_over = DEFAULT_CARRY_OVER;
};

// Decides whether a file contains at least one match without loading it
// whole. Each chunk is searched together with the tail of the previous
// one, so matches straddling a read boundary are found. After the first hit
// the rest of the file is only checked for UTF-8 well-formedness.
class StreamingContentSearcher {
public:
    StreamingContentSearcher() = default;
    explicit StreamingContentSearcher(StreamOptions options);

    // IO error if the file cannot be opened or read. Content that is not
    // valid UTF-8 is reported as no match.
    Result<bool> contains_match(const std::filesystem::path& file,
                                const ContentPattern& pattern) const;

    const StreamOptions& options() const { return options_; }

private:
    StreamOptions options_;
};

// One content hit with surrounding lines.
struct ContentMatch {
    size_t line_number = 0;                  // 1-based
    std::string content;                     // line the match starts on
    std::vector<std::string> context_before;
    std::vector<std::string> context_after;
    size_t match_start = 0;                  // byte offsets within `content`
    size_t match_end = 0;
};

// Collect up to `max_matches` hits with `context_lines` of context each.
// The pattern runs over the whole text, so hits may span lines; each hit is
// reported on the line it starts on, at most one per line.
Result<std::vector<ContentMatch>> find_matches(const std::filesystem::path& file,
                                               const ContentPattern& pattern,
                                               size_t context_lines,
                                               size_t max_matches);

} // namespace lode
