#include <catch2/catch.hpp>
#include <lode/criteria.hpp>
#include "temp_dir.hpp"
#include <cstdint>

using namespace lode;

static std::time_t seconds_of(TimePoint t) {
    return std::chrono::system_clock::to_time_t(t);
}

// ===== Dates =====

TEST_CASE("parse_iso_date() yields UTC midnight", "[criteria]") {
    auto r = parse_iso_date("2024-01-01");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().text == "2024-01-01");
    REQUIRE(seconds_of(r.value().at) == 1704067200);

    REQUIRE(seconds_of(parse_iso_date("1970-01-01").value().at) == 0);
    REQUIRE(seconds_of(parse_iso_date("2000-03-01").value().at) == utc_midnight(2000, 3, 1));
}

TEST_CASE("parse_iso_date() accepts leap days", "[criteria]") {
    REQUIRE(parse_iso_date("2024-02-29").is_ok());
    REQUIRE(parse_iso_date("2000-02-29").is_ok());
    REQUIRE(parse_iso_date("1900-02-29").is_err());
    REQUIRE(parse_iso_date("2023-02-29").is_err());
}

TEST_CASE("parse_iso_date() rejects malformed input", "[criteria]") {
    for (const char* bad : {"", "2024", "2024-1-01", "2024/01/01", "24-01-01",
                            "2024-01-01T00:00", "yyyy-mm-dd", "2024-13-01",
                            "2024-00-10", "2024-04-31", "2024-01-00"}) {
        INFO(bad);
        auto r = parse_iso_date(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == LodeError::InvalidArg);
    }
}

TEST_CASE("parse_iso_date() saturates far-off years", "[criteria]") {
    auto far_future = parse_iso_date("3000-01-01");
    REQUIRE(far_future.is_ok());
    REQUIRE(far_future.value().text == "3000-01-01");
    REQUIRE(far_future.value().at == TimePoint::max());
    REQUIRE(std::chrono::system_clock::now() < far_future.value().at);

    auto far_past = parse_iso_date("1600-01-01");
    REQUIRE(far_past.is_ok());
    REQUIRE(far_past.value().at == TimePoint::min());

    REQUIRE(parse_iso_date("9999-12-31").value().at == TimePoint::max());
    REQUIRE(parse_iso_date("0000-01-01").value().at == TimePoint::min());
    REQUIRE(seconds_of(parse_iso_date("2200-01-01").value().at) == utc_midnight(2200, 1, 1));
}

// ===== Request validation =====

TEST_CASE("from_request() with nothing supplied", "[criteria]") {
    auto r = SearchCriteria::from_request(SearchRequest{});
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE_FALSE(c.content_pattern.has_value());
    REQUIRE_FALSE(c.resource_pattern.has_value());
    REQUIRE_FALSE(c.date_after.has_value());
    REQUIRE_FALSE(c.date_before.has_value());
    REQUIRE_FALSE(c.size_min.has_value());
    REQUIRE_FALSE(c.size_max.has_value());
    REQUIRE(c.case_sensitive == false);
}

TEST_CASE("from_request() copies supplied fields", "[criteria]") {
    SearchRequest req;
    req.content_pattern = "TODO";
    req.case_sensitive = true;
    req.resource_pattern = "*.ts";
    req.date_after = "2024-01-01";
    req.date_before = "2024-06-30";
    req.size_min = 10;
    req.size_max = 0;

    auto r = SearchCriteria::from_request(req);
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(*c.content_pattern == "TODO");
    REQUIRE(c.case_sensitive);
    REQUIRE(*c.resource_pattern == "*.ts");
    REQUIRE(c.date_after->text == "2024-01-01");
    REQUIRE(c.date_before->text == "2024-06-30");
    REQUIRE(*c.size_min == 10);
    REQUIRE(*c.size_max == 0);
}

TEST_CASE("from_request() treats empty strings as absent", "[criteria]") {
    SearchRequest req;
    req.content_pattern = "";
    req.resource_pattern = "";
    req.date_after = "";
    auto r = SearchCriteria::from_request(req);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().content_pattern.has_value());
    REQUIRE_FALSE(r.value().resource_pattern.has_value());
    REQUIRE_FALSE(r.value().date_after.has_value());
}

TEST_CASE("from_request() rejects negative sizes", "[criteria]") {
    SearchRequest req;
    req.size_min = -1;
    auto r = SearchCriteria::from_request(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::InvalidArg);
    REQUIRE(r.error().message.find("sizeMin") != std::string::npos);

    SearchRequest req2;
    req2.size_max = -5;
    auto r2 = SearchCriteria::from_request(req2);
    REQUIRE(r2.is_err());
    REQUIRE(r2.error().message.find("sizeMax") != std::string::npos);
}

TEST_CASE("from_request() names the bad date field", "[criteria]") {
    SearchRequest req;
    req.date_before = "last tuesday";
    auto r = SearchCriteria::from_request(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == LodeError::InvalidArg);
    REQUIRE(r.error().message.rfind("dateBefore: ", 0) == 0);
}

// ===== Size arguments =====

TEST_CASE("parse_size_arg() reads decimal integers", "[criteria]") {
    REQUIRE(parse_size_arg("--max", "1000").value() == 1000);
    REQUIRE(parse_size_arg("--min", "0").value() == 0);
    REQUIRE(parse_size_arg("--min", "-3").value() == -3);
    REQUIRE(parse_size_arg("--max", "9223372036854775807").value() == INT64_MAX);
}

TEST_CASE("parse_size_arg() rejects junk and overflow", "[criteria]") {
    for (const char* bad : {"", "12k", "ten", "1.5", " "}) {
        INFO(bad);
        auto r = parse_size_arg("--max", bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == LodeError::InvalidArg);
    }

    auto big = parse_size_arg("--max", "99999999999999999999");
    REQUIRE(big.is_err());
    REQUIRE(big.error().message == "--max is out of range: 99999999999999999999");

    auto small = parse_size_arg("--min", "-99999999999999999999");
    REQUIRE(small.is_err());
}
