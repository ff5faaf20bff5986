#pragma once

#include <lode/content_search.hpp>
#include <lode/criteria.hpp>
#include <lode/exclude.hpp>
#include <lode/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lode {

// Upper bound on content scans in flight within one search.
constexpr size_t MAX_CONCURRENCY = 20;

// Hardware threads, clamped to [1, MAX_CONCURRENCY].
size_t default_concurrency();

// Runtime tunables for one search. Built from SearchConfig by the caller.
struct SearchOptions {
    StreamOptions stream;
    size_t max_concurrency = default_concurrency();  // 1 = sequential
    bool include_content = false;
    size_t context_lines = 2;
    size_t max_matches_per_file = 5;
    ExcludeRules exclude;
};

struct FileMatches {
    std::string path;
    std::vector<ContentMatch> matches;
};

struct SearchResult {
    std::vector<std::string> paths;     // walk order, '/'-separated
    std::string description;            // see describe_criteria()
    std::optional<std::string> error_message;
    std::vector<FileMatches> content_matches;  // only with include_content

    size_t count() const { return paths.size(); }
};

// Comma-joined list of the supplied criteria, in fixed order:
//   content pattern "<p>", case-insensitive|case-sensitive,
//   resource pattern "<p>", modified after <d>, modified before <d>,
//   minimum size <n> bytes, maximum size <n> bytes
std::string describe_criteria(const SearchCriteria& criteria);

// Composes the glob, walker, metadata filter and content searcher into one
// pass: path match, then size/date, then (only when a content pattern was
// given) a streaming content scan. Holds no state between runs.
class SearchCoordinator {
public:
    SearchCoordinator() = default;
    explicit SearchCoordinator(SearchOptions options);

    // Only a missing or non-directory root is an error. A bad content
    // pattern yields an empty result with error_message set.
    Result<SearchResult> run(const std::filesystem::path& root,
                             const SearchCriteria& criteria) const;

    const SearchOptions& options() const { return options_; }

private:
    SearchOptions options_;
};

inline Result<SearchResult> search(const std::filesystem::path& root,
                                   const SearchCriteria& criteria,
                                   SearchOptions options = {}) {
    return SearchCoordinator(std::move(options)).run(root, criteria);
}

// Text block for display:
//   [Error: <message>\n\n]<N> resources match the search criteria: <description>
//   [\n<resources>\n<path>\n...\n</resources>]
std::string format_report(const SearchResult& result);

} // namespace lode
