#include <catch2/catch.hpp>
#include <lode/config.hpp>
#include "temp_dir.hpp"

using namespace lode;

// ===== Parsing =====

TEST_CASE("parse config with search section", "[config]") {
    auto r = SearchConfig::parse(R"(
[search]
chunk-size = 4096
carry-over = 1024
max-concurrency = 4
include-content = true
context-lines = 3
max-matches-per-file = 7
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.chunk_size == size_t(4096));
    REQUIRE(c.carry_over == size_t(1024));
    REQUIRE(c.max_concurrency == size_t(4));
    REQUIRE(c.include_content == true);
    REQUIRE(c.context_lines == size_t(3));
    REQUIRE(c.max_matches_per_file == size_t(7));
}

TEST_CASE("parse config with walk and log sections", "[config]") {
    auto r = SearchConfig::parse(R"(
[walk]
use-ignore-files = true
exclude = ["node_modules/", "*.min.js"]

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.use_ignore_files == true);
    REQUIRE(c.exclude == (std::vector<std::string>{"node_modules/", "*.min.js"}));
    REQUIRE(c.log_level == log::Debug);
    REQUIRE(c.log_color == false);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = SearchConfig::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().chunk_size.has_value());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE(r.value().exclude.empty());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = SearchConfig::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Parse);
}

TEST_CASE("parse rejects wrong value types", "[config]") {
    auto r = SearchConfig::parse(R"(
[search]
chunk-size = "big"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Config);
    REQUIRE(r.error().message == "[search] chunk-size must be an integer");

    auto b = SearchConfig::parse(R"(
[walk]
use-ignore-files = "yes"
)");
    REQUIRE(b.is_err());
    REQUIRE(b.error().message == "[walk] use-ignore-files must be a boolean");

    auto e = SearchConfig::parse(R"(
[walk]
exclude = ["a", 1]
)");
    REQUIRE(e.is_err());
    REQUIRE(e.error().code == LodeError::Config);
}

TEST_CASE("parse rejects out-of-range values", "[config]") {
    auto r = SearchConfig::parse(R"(
[search]
chunk-size = 0
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Config);
    REQUIRE(r.error().message.find("at least 1") != std::string::npos);
}

TEST_CASE("parse rejects unknown log level", "[config]") {
    auto r = SearchConfig::parse(R"(
[log]
level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Config);
}

// ===== Merge =====

TEST_CASE("merge overrides only keys present in the overlay", "[config]") {
    auto base = SearchConfig::parse(R"(
[search]
chunk-size = 8192
max-concurrency = 2

[walk]
exclude = ["dist/"]
)").value();

    auto overlay = SearchConfig::parse(R"(
[search]
max-concurrency = 8

[walk]
exclude = ["dist/", "coverage/"]
)").value();

    base.merge(overlay);
    REQUIRE(base.chunk_size == size_t(8192));     // preserved
    REQUIRE(base.max_concurrency == size_t(8));   // overridden
    REQUIRE(base.exclude == (std::vector<std::string>{"dist/", "coverage/"}));
}

TEST_CASE("effective() layers project over global", "[config]") {
    auto global = SearchConfig::parse(R"(
[search]
context-lines = 1
[log]
level = "warn"
)").value();
    auto project = SearchConfig::parse(R"(
[search]
context-lines = 4
)").value();

    auto eff = SearchConfig::effective(global, project);
    REQUIRE(eff.context_lines == size_t(4));
    REQUIRE(eff.log_level == log::Warn);

    auto none = SearchConfig::effective(std::nullopt, std::nullopt);
    REQUIRE_FALSE(none.context_lines.has_value());
}

// ===== Options =====

TEST_CASE("to_options() fills defaults", "[config]") {
    SearchConfig cfg;
    auto opts = cfg.to_options(".");
    REQUIRE(opts.stream.chunk_size == DEFAULT_CHUNK_SIZE);
    REQUIRE(opts.stream.carry_over == DEFAULT_CARRY_OVER);
    REQUIRE(opts.max_concurrency >= 1);
    REQUIRE(opts.max_concurrency <= MAX_CONCURRENCY);
    REQUIRE(opts.include_content == false);
    REQUIRE(opts.context_lines == 2);
    REQUIRE(opts.max_matches_per_file == 5);
    REQUIRE(opts.exclude.empty());
}

TEST_CASE("to_options() clamps out-of-range tunables", "[config]") {
    auto cfg = SearchConfig::parse(R"(
[search]
max-concurrency = 500
context-lines = 50
max-matches-per-file = 100
)").value();
    auto opts = cfg.to_options(".");
    REQUIRE(opts.max_concurrency == MAX_CONCURRENCY);
    REQUIRE(opts.context_lines == 10);
    REQUIRE(opts.max_matches_per_file == 20);
}

TEST_CASE("to_options() reads ignore files only when enabled", "[config]") {
    TempDir td;
    td.write_file(".gitignore", "node_modules/\n# comment\n\n/build\n");

    auto off = SearchConfig::parse("").value().to_options(td.path);
    REQUIRE(off.exclude.empty());

    auto on = SearchConfig::parse(R"(
[walk]
use-ignore-files = true
exclude = ["*.log"]
)").value().to_options(td.path);
    REQUIRE(on.exclude.excludes_dir(".git"));
    REQUIRE(on.exclude.excludes_dir("node_modules"));
    REQUIRE(on.exclude.excludes_dir("build"));
    REQUIRE(on.exclude.excludes_file("logs/server.log"));
    REQUIRE_FALSE(on.exclude.excludes_file("src/main.ts"));
}

TEST_CASE("apply_logging() pushes settings into the logger", "[config]") {
    auto cfg = SearchConfig::parse(R"(
[log]
level = "error"
color = false
)").value();
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

// ===== Loading =====

TEST_CASE("load() reports a missing file as IO", "[config]") {
    auto r = SearchConfig::load("/nonexistent/lode/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::IO);
}

TEST_CASE("load() tags parse errors with the file name", "[config]") {
    TempDir td;
    td.write_file("bad.toml", "[search\n");
    auto path = (td.path / "bad.toml").string();
    auto r = SearchConfig::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Parse);
    REQUIRE(r.error().file == path);
}

TEST_CASE("load_layered_config() picks up the project file", "[config]") {
    TempDir td;
    td.write_file(".lode.toml", "[search]\nchunk-size = 2048\n");
    REQUIRE(project_config_path(td.path) == (td.path / ".lode.toml").string());

    auto r = load_layered_config(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().chunk_size == size_t(2048));
}

TEST_CASE("load_layered_config() fails on a broken project file", "[config]") {
    TempDir td;
    td.write_file(".lode.toml", "chunk-size = = 1\n");
    auto r = load_layered_config(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::Parse);
}
