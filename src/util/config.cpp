#include <lode/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lode {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static LodeError type_error(const char* section, const char* key, const char* expected) {
    return LodeError{LodeError::Config,
        std::string("[") + section + "] " + key + " must be " + expected};
}

static Result<std::optional<size_t>> read_size(const toml::table& tbl,
                                               const char* section,
                                               const char* key,
                                               int64_t min_value) {
    auto view = tbl[key];
    if (!view) return Result<std::optional<size_t>>::ok(std::nullopt);

    auto v = view.value<int64_t>();
    if (!v) return type_error(section, key, "an integer");
    if (*v < min_value) {
        return LodeError{LodeError::Config,
            std::string("[") + section + "] " + key + " must be at least " +
            std::to_string(min_value) + " (got " + std::to_string(*v) + ")"};
    }
    return Result<std::optional<size_t>>::ok(static_cast<size_t>(*v));
}

static Result<std::optional<bool>> read_bool(const toml::table& tbl,
                                             const char* section,
                                             const char* key) {
    auto view = tbl[key];
    if (!view) return Result<std::optional<bool>>::ok(std::nullopt);

    auto v = view.value<bool>();
    if (!v) return type_error(section, key, "a boolean");
    return Result<std::optional<bool>>::ok(*v);
}

#define LODE_READ(target, expr) \
    do { \
        auto _lode_field = (expr); \
        if (_lode_field.is_err()) return std::move(_lode_field).error(); \
        target = _lode_field.value(); \
    } while (0)

// ---------------------------------------------------------------------------
// SearchConfig
// ---------------------------------------------------------------------------

Result<SearchConfig> SearchConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LodeError{LodeError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    SearchConfig cfg;

    // [search] section
    if (auto search = doc["search"].as_table()) {
        LODE_READ(cfg.chunk_size, read_size(*search, "search", "chunk-size", 1));
        LODE_READ(cfg.carry_over, read_size(*search, "search", "carry-over", 0));
        LODE_READ(cfg.max_concurrency, read_size(*search, "search", "max-concurrency", 1));
        LODE_READ(cfg.include_content, read_bool(*search, "search", "include-content"));
        LODE_READ(cfg.context_lines, read_size(*search, "search", "context-lines", 0));
        LODE_READ(cfg.max_matches_per_file,
                  read_size(*search, "search", "max-matches-per-file", 1));
    }

    // [walk] section
    if (auto walk = doc["walk"].as_table()) {
        LODE_READ(cfg.use_ignore_files, read_bool(*walk, "walk", "use-ignore-files"));
        if (auto view = (*walk)["exclude"]) {
            auto arr = view.as_array();
            if (!arr) return type_error("walk", "exclude", "an array of strings");
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) return type_error("walk", "exclude", "an array of strings");
                cfg.exclude.push_back(*s);
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto view = (*lg)["level"]) {
            auto s = view.value<std::string>();
            if (!s) return type_error("log", "level", "a string");
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
        LODE_READ(cfg.log_color, read_bool(*lg, "log", "color"));
    }

    return Result<SearchConfig>::ok(std::move(cfg));
}

Result<SearchConfig> SearchConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LodeError{LodeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return SearchConfig::parse(ss.str()).map_err([&](LodeError e) {
        e.file = path;
        return e;
    });
}

void SearchConfig::merge(const SearchConfig& other) {
    if (other.chunk_size) chunk_size = other.chunk_size;
    if (other.carry_over) carry_over = other.carry_over;
    if (other.max_concurrency) max_concurrency = other.max_concurrency;
    if (other.include_content) include_content = other.include_content;
    if (other.context_lines) context_lines = other.context_lines;
    if (other.max_matches_per_file) max_matches_per_file = other.max_matches_per_file;
    if (other.use_ignore_files) use_ignore_files = other.use_ignore_files;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;

    for (const auto& p : other.exclude) {
        if (std::find(exclude.begin(), exclude.end(), p) == exclude.end()) {
            exclude.push_back(p);
        }
    }
}

SearchConfig SearchConfig::effective(const std::optional<SearchConfig>& global,
                                     const std::optional<SearchConfig>& project) {
    SearchConfig result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

SearchOptions SearchConfig::to_options(const fs::path& root) const {
    SearchOptions opts;
    opts.stream.chunk_size = chunk_size.value_or(DEFAULT_CHUNK_SIZE);
    opts.stream.carry_over = carry_over.value_or(DEFAULT_CARRY_OVER);
    opts.max_concurrency = std::min(max_concurrency.value_or(default_concurrency()),
                                    MAX_CONCURRENCY);
    opts.include_content = include_content.value_or(false);
    opts.context_lines = std::min<size_t>(context_lines.value_or(2), 10);
    opts.max_matches_per_file =
        std::clamp<size_t>(max_matches_per_file.value_or(5), 1, 20);

    if (use_ignore_files.value_or(false)) {
        opts.exclude = ExcludeRules::from_ignore_files(root);
    }
    for (const auto& p : exclude) {
        opts.exclude.add_pattern(p);
    }
    return opts;
}

void SearchConfig::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.lode/config.toml";
}

std::string project_config_path(const fs::path& root) {
    return (root / ".lode.toml").string();
}

Result<SearchConfig> load_layered_config(const fs::path& root) {
    std::optional<SearchConfig> global;
    std::optional<SearchConfig> project;
    std::error_code ec;

    auto gpath = global_config_path();
    if (!gpath.empty() && fs::is_regular_file(gpath, ec)) {
        auto r = SearchConfig::load(gpath);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    auto ppath = project_config_path(root);
    if (fs::is_regular_file(ppath, ec)) {
        auto r = SearchConfig::load(ppath);
        if (r.is_err()) return std::move(r).error();
        project = std::move(r).value();
    }

    return Result<SearchConfig>::ok(SearchConfig::effective(global, project));
}

} // namespace lode
