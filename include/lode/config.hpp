#pragma once

#include <lode/log.hpp>
#include <lode/result.hpp>
#include <lode/search.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lode {

// Layered configuration: global (~/.lode/config.toml) then project
// (<root>/.lode.toml). Only keys present in a layer override earlier layers.
struct SearchConfig {
    // [search]
    std::optional<size_t> chunk_size;
    std::optional<size_t> carry_over;
    std::optional<size_t> max_concurrency;
    std::optional<bool> include_content;
    std::optional<size_t> context_lines;         // clamped to 0..10
    std::optional<size_t> max_matches_per_file;  // clamped to 1..20

    // [walk]
    std::optional<bool> use_ignore_files;
    std::vector<std::string> exclude;            // accumulates across layers

    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // Load from a TOML config file
    static Result<SearchConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<SearchConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const SearchConfig& other);

    // Global and project layers, each optional
    static SearchConfig effective(const std::optional<SearchConfig>& global,
                                  const std::optional<SearchConfig>& project);

    // Resolve defaults and build the options for a search under `root`.
    // Ignore files are read from `root` when use_ignore_files is set.
    SearchOptions to_options(const std::filesystem::path& root) const;

    // Push log level and color settings into lode::log.
    void apply_logging() const;
};

// ~/.lode/config.toml, or "" when no home directory is known
std::string global_config_path();

// <root>/.lode.toml
std::string project_config_path(const std::filesystem::path& root);

// Load whichever of the two layers exist and combine them. A layer that
// exists but fails to parse is an error.
Result<SearchConfig> load_layered_config(const std::filesystem::path& root);

} // namespace lode
