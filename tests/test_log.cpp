#include <catch2/catch.hpp>
#include <lode/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace lode::log;

// Helper: capture log output from a callable through a temporary sink
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_sink(tmp);

    fn();

    set_sink(nullptr);
    std::rewind(tmp);
    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);

    set_level(Warn);
    REQUIRE(get_level() == Warn);

    set_level(Error);
    REQUIRE(get_level() == Error);

    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level() accepts every level name", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("debug").value() == Debug);
    REQUIRE(parse_level("info").value() == Info);
    REQUIRE(parse_level("warn").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == lode::LodeError::Config);
    REQUIRE(r.error().message.find("verbose") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("skipping unreadable directory %s", "private");
        error("search root does not exist");
    });
    REQUIRE(output.find("warn: skipping unreadable directory private\n") != std::string::npos);
    REQUIRE(output.find("error: search root does not exist\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("found %zu resources matching %s", static_cast<size_t>(3), "resource pattern \"*.ts\"");
    });
    REQUIRE(output == "info: found 3 resources matching resource pattern \"*.ts\"\n");
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_log([] { warn("colored"); });
    REQUIRE(output.find("\033[33mwarn\033[0m: colored") != std::string::npos);

    set_color_enabled(false);
}
