#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "metrics_adapter/types.hpp"

using namespace metrics_adapter;

TEST_CASE("parse_duration accepts compound Go-style durations") {
    REQUIRE(parse_duration("10s") == std::chrono::seconds{10});
    REQUIRE(parse_duration("1m30s") == std::chrono::seconds{90});
    REQUIRE(parse_duration("250ms") == Duration{250});
    REQUIRE(parse_duration("2h") == std::chrono::hours{2});
    REQUIRE(parse_duration("0") == Duration{0});
    REQUIRE(parse_duration("-5s") == std::chrono::seconds{-5});
}

TEST_CASE("parse_duration rejects malformed input") {
    REQUIRE_THROWS_AS(parse_duration(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_duration("10"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_duration("s"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_duration("5d"), std::invalid_argument);
}

TEST_CASE("parse_duration rejects durations beyond the representable range") {
    REQUIRE_THROWS_AS(parse_duration("9999999999999h"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_duration("99999999999999999999ms"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_duration("9223372036854775807ms1ms"), std::invalid_argument);
    REQUIRE(parse_duration("9223372036854775807ms") == Duration{std::numeric_limits<std::int64_t>::max()});
}

TEST_CASE("format_duration renders what parse_duration reads") {
    REQUIRE(format_duration(std::chrono::seconds{10}) == "10s");
    REQUIRE(format_duration(std::chrono::minutes{10}) == "10m");
    REQUIRE(format_duration(std::chrono::seconds{3'690}) == "1h1m30s");
    REQUIRE(format_duration(Duration{1'500}) == "1500ms");
    REQUIRE(format_duration(Duration{0}) == "0s");
}

TEST_CASE("split_list drops empty items") {
    REQUIRE(split_list("a,b,,c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split_list("").empty());
    REQUIRE(join_list({"/healthz", "/readyz"}) == "/healthz,/readyz");
}

TEST_CASE("parse_ip recognizes both families and wildcard binds") {
    const auto wildcard_v4 = parse_ip("0.0.0.0");
    REQUIRE(wildcard_v4.has_value());
    REQUIRE(wildcard_v4->family == IpFamily::V4);
    REQUIRE(wildcard_v4->unspecified);

    const auto loopback_v6 = parse_ip("0:0:0:0:0:0:0:1");
    REQUIRE(loopback_v6.has_value());
    REQUIRE(loopback_v6->family == IpFamily::V6);
    REQUIRE(loopback_v6->text == "::1");
    REQUIRE_FALSE(loopback_v6->unspecified);

    REQUIRE(parse_ip("::")->unspecified);
    REQUIRE_FALSE(parse_ip("localhost").has_value());
    REQUIRE_FALSE(parse_ip("300.1.1.1").has_value());
}
