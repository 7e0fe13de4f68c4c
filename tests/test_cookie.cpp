#include <catch2/catch.hpp>
#include <httpconf/http/cookie.hpp>

using namespace httpconf;

TEST_CASE("SameSite values", "[cookie]") {
    SECTION("parse is case-insensitive") {
        REQUIRE(parse_same_site_value("strict") == SameSite::Strict);
        REQUIRE(parse_same_site_value("LAX") == SameSite::Lax);
        REQUIRE(parse_same_site_value("None") == SameSite::None);
    }

    SECTION("unknown values") {
        REQUIRE(!parse_same_site_value("sometimes"));
        REQUIRE(!parse_same_site_value(""));
    }

    SECTION("names") {
        REQUIRE(same_site_name(SameSite::Strict) == "Strict");
        REQUIRE(same_site_name(SameSite::Lax) == "Lax");
        REQUIRE(same_site_name(SameSite::None) == "None");
        REQUIRE(same_site_values() == "strict, lax, none");
    }
}

TEST_CASE("Set-Cookie rendering", "[cookie]") {
    SECTION("name and value only") {
        Cookie c{"APP_SESSION", "abc"};
        REQUIRE(c.to_header() == "APP_SESSION=abc");
    }

    SECTION("all attributes") {
        Cookie c{"APP_SESSION", "abc"};
        c.set_domain("example.com")
         .set_path("/app")
         .set_max_age(std::chrono::seconds(3600))
         .set_secure()
         .set_http_only()
         .set_same_site(SameSite::Strict)
         .set_partitioned();
        REQUIRE(c.to_header() ==
            "APP_SESSION=abc; Domain=example.com; Path=/app; Max-Age=3600; Secure; HttpOnly; SameSite=Strict; Partitioned");
    }

    SECTION("no SameSite attribute when unset") {
        Cookie c{"APP_FLASH", "x"};
        c.set_same_site(std::nullopt);
        REQUIRE(c.to_header().find("SameSite") == std::string::npos);
    }

    SECTION("expired cookie") {
        Cookie c = Cookie::expired("APP_FLASH");
        std::string header = c.to_header();
        REQUIRE(header.find("APP_FLASH=;") == 0);
        REQUIRE(header.find("Max-Age=0") != std::string::npos);
        REQUIRE(header.find("Expires=Thu, 01 Jan 1970 00:00:00 GMT") != std::string::npos);
    }
}
