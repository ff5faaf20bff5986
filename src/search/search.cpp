#include <lode/search.hpp>
#include <lode/glob.hpp>
#include <lode/log.hpp>
#include <lode/metadata_filter.hpp>
#include <lode/walker.hpp>
#include <algorithm>
#include <future>
#include <thread>

namespace fs = std::filesystem;

namespace lode {

size_t default_concurrency() {
    size_t n = std::thread::hardware_concurrency();
    if (n == 0) n = 1;
    return std::min(n, MAX_CONCURRENCY);
}

std::string describe_criteria(const SearchCriteria& c) {
    std::vector<std::string> parts;
    if (c.content_pattern.has_value()) {
        parts.push_back("content pattern \"" + *c.content_pattern + "\"");
        parts.push_back(c.case_sensitive ? "case-sensitive" : "case-insensitive");
    }
    if (c.resource_pattern.has_value()) {
        parts.push_back("resource pattern \"" + *c.resource_pattern + "\"");
    }
    if (c.date_after.has_value()) {
        parts.push_back("modified after " + c.date_after->text);
    }
    if (c.date_before.has_value()) {
        parts.push_back("modified before " + c.date_before->text);
    }
    if (c.size_min.has_value()) {
        parts.push_back("minimum size " + std::to_string(*c.size_min) + " bytes");
    }
    if (c.size_max.has_value()) {
        parts.push_back("maximum size " + std::to_string(*c.size_max) + " bytes");
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

SearchCoordinator::SearchCoordinator(SearchOptions options)
    : options_(std::move(options)) {
    if (options_.max_concurrency == 0) options_.max_concurrency = 1;
}

namespace {

// Candidates that passed the cheap filters, waiting for a content scan.
struct ContentStage {
    const SearchOptions& options;
    const ContentPattern& pattern;
    StreamingContentSearcher searcher;
    std::vector<FileCandidate> pending;

    void flush(SearchResult& result) {
        if (pending.empty()) return;

        std::vector<Result<bool>> outcomes;
        outcomes.reserve(pending.size());
        if (options.max_concurrency <= 1 || pending.size() == 1) {
            for (const auto& c : pending) {
                outcomes.push_back(searcher.contains_match(c.abs_path, pattern));
            }
        } else {
            std::vector<std::future<Result<bool>>> futures;
            futures.reserve(pending.size());
            for (const auto& c : pending) {
                futures.push_back(std::async(std::launch::async, [this, &c] {
                    return searcher.contains_match(c.abs_path, pattern);
                }));
            }
            for (auto& f : futures) outcomes.push_back(f.get());
        }

        // Record in walk order regardless of completion order
        for (size_t i = 0; i < pending.size(); i++) {
            const auto& c = pending[i];
            auto& outcome = outcomes[i];
            if (outcome.is_err()) {
                lode::log::warn("skipping %s: %s", c.rel_path.c_str(),
                                outcome.error().message.c_str());
                continue;
            }
            if (!outcome.value()) {
                lode::log::trace("no content match in %s", c.rel_path.c_str());
                continue;
            }
            if (options.include_content && !collect(c, result)) continue;
            result.paths.push_back(c.rel_path);
        }
        pending.clear();
    }

    // A path is listed with excerpts only; a file that changed since the
    // scan and no longer yields any is dropped.
    bool collect(const FileCandidate& c, SearchResult& result) {
        auto found = find_matches(c.abs_path, pattern, options.context_lines,
                                  options.max_matches_per_file);
        if (found.is_err()) {
            lode::log::warn("cannot extract matches from %s: %s", c.rel_path.c_str(),
                            found.error().message.c_str());
            return false;
        }
        if (found.value().empty()) {
            lode::log::debug("no excerpts left in %s; dropping it", c.rel_path.c_str());
            return false;
        }
        result.content_matches.push_back(FileMatches{c.rel_path, std::move(found).value()});
        return true;
    }
};

} // namespace

Result<SearchResult> SearchCoordinator::run(const fs::path& root,
                                            const SearchCriteria& criteria) const {
    SearchResult result;
    result.description = describe_criteria(criteria);
    lode::log::info("searching %s: %s", root.string().c_str(), result.description.c_str());

    // Compile the content pattern before touching the filesystem
    std::optional<ContentPattern> pattern;
    if (criteria.content_pattern.has_value()) {
        auto compiled = ContentPattern::compile(*criteria.content_pattern,
                                                criteria.case_sensitive);
        if (compiled.is_err()) {
            lode::log::error("%s", compiled.error().message.c_str());
            result.error_message = compiled.error().message;
            return Result<SearchResult>::ok(std::move(result));
        }
        pattern = std::move(compiled).value();
    }

    std::optional<CompiledGlob> glob;
    if (criteria.resource_pattern.has_value()) {
        glob = CompiledGlob::compile(*criteria.resource_pattern);
    }

    WalkOptions walk_opts;
    if (glob.has_value()) walk_opts.prune_glob = &*glob;
    if (!options_.exclude.empty()) walk_opts.exclude = &options_.exclude;

    std::optional<ContentStage> stage;
    if (pattern.has_value()) {
        stage.emplace(ContentStage{options_, *pattern,
                                   StreamingContentSearcher(options_.stream), {}});
    }

    auto walked = walk_files(root, walk_opts, [&](const FileCandidate& c) {
        if (glob.has_value() && !glob->matches(c.rel_path)) return true;
        if (!passes_metadata(criteria, c.size, c.mtime)) {
            lode::log::trace("%s rejected by size/date", c.rel_path.c_str());
            return true;
        }
        if (!stage.has_value()) {
            result.paths.push_back(c.rel_path);
            return true;
        }
        stage->pending.push_back(c);
        if (stage->pending.size() >= options_.max_concurrency) stage->flush(result);
        return true;
    });
    if (walked.is_err()) {
        lode::log::error("%s", walked.error().message.c_str());
        return std::move(walked).error();
    }
    if (stage.has_value()) stage->flush(result);

    lode::log::info("found %zu resources matching %s", result.count(),
                    result.description.c_str());
    return Result<SearchResult>::ok(std::move(result));
}

std::string format_report(const SearchResult& result) {
    std::string out;
    if (result.error_message.has_value()) {
        out += "Error: " + *result.error_message + "\n\n";
    }
    out += std::to_string(result.count()) +
           " resources match the search criteria: " + result.description;
    if (result.count() > 0) {
        out += "\n<resources>\n";
        for (const auto& p : result.paths) {
            out += p;
            out += "\n";
        }
        out += "</resources>";
    }
    return out;
}

} // namespace lode
