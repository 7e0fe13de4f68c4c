#include <catch2/catch.hpp>
#include <httpconf/util/units.hpp>

using namespace httpconf;
using namespace std::chrono_literals;

TEST_CASE("Duration parsing", "[units]") {
    SECTION("unit names") {
        REQUIRE(*units::parse_duration("30 seconds") == 30s);
        REQUIRE(*units::parse_duration("5 minutes") == 5min);
        REQUIRE(*units::parse_duration("5m") == 5min);
        REQUIRE(*units::parse_duration("100ms") == 100ms);
        REQUIRE(*units::parse_duration("2h") == 2h);
        REQUIRE(*units::parse_duration("1 day") == 24h);
        REQUIRE(*units::parse_duration("250us") == 250us);
        REQUIRE(*units::parse_duration("7ns") == 7ns);
    }

    SECTION("bare number is milliseconds") {
        REQUIRE(*units::parse_duration("1500") == 1500ms);
    }

    SECTION("fractions") {
        REQUIRE(*units::parse_duration("1.5h") == 90min);
        REQUIRE(*units::parse_duration(" 0.5 s ") == 500ms);
    }

    SECTION("invalid") {
        REQUIRE(!units::parse_duration(""));
        REQUIRE(!units::parse_duration("soon"));
        REQUIRE(!units::parse_duration("10 fortnights"));
    }

    SECTION("2^63 nanoseconds is out of range") {
        auto d = units::parse_duration("9223372036854775808ns");
        REQUIRE(!d);
        REQUIRE(d.error().find("out of range") != std::string::npos);
        REQUIRE(!units::parse_duration("-9223372036854775808ns"));
    }
}

TEST_CASE("Memory size parsing", "[units]") {
    SECTION("binary units") {
        REQUIRE(units::parse_memory_size("100k")->to_bytes() == 102400);
        REQUIRE(units::parse_memory_size("10m")->to_bytes() == 10485760);
        REQUIRE(units::parse_memory_size("1 KiB")->to_bytes() == 1024);
        REQUIRE(units::parse_memory_size("2G")->to_bytes() == 2147483648LL);
    }

    SECTION("SI units") {
        REQUIRE(units::parse_memory_size("1kB")->to_bytes() == 1000);
        REQUIRE(units::parse_memory_size("3 megabytes")->to_bytes() == 3000000);
    }

    SECTION("bare number is bytes") {
        REQUIRE(units::parse_memory_size("512")->to_bytes() == 512);
    }

    SECTION("invalid") {
        REQUIRE(!units::parse_memory_size("-1k"));
        REQUIRE(!units::parse_memory_size("lots"));
        REQUIRE(!units::parse_memory_size("10 parsecs"));
    }

    SECTION("2^63 bytes is out of range") {
        auto size = units::parse_memory_size("8589934592G");
        REQUIRE(!size);
        REQUIRE(size.error().find("out of range") != std::string::npos);
        REQUIRE(!units::parse_memory_size("9223372036854775807"));
    }
}

TEST_CASE("Duration formatting", "[units]") {
    REQUIRE(units::format_duration(30s) == "30 seconds");
    REQUIRE(units::format_duration(5min) == "5 minutes");
    REQUIRE(units::format_duration(1h) == "1 hour");
    REQUIRE(units::format_duration(1500ms) == "1500 milliseconds");
    REQUIRE(units::format_duration(0s) == "0 seconds");
}
