#include <catch2/catch.hpp>
#include <httpconf/crypto/codecs.hpp>

using namespace httpconf;

TEST_CASE("MD5 digests", "[codecs]") {
    SECTION("known vectors") {
        REQUIRE(codecs::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
        REQUIRE(codecs::md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
        REQUIRE(codecs::md5_hex("The quick brown fox jumps over the lazy dog") ==
                "9e107d9d372bb6826bd81d3542a419d6");
    }

    SECTION("raw digest matches hex form") {
        auto digest = codecs::md5("abc");
        REQUIRE(digest.size() == 16);
        REQUIRE(digest[0] == 0x90);
        REQUIRE(codecs::to_hex(digest) == codecs::md5_hex("abc"));
    }
}

TEST_CASE("Hex encoding", "[codecs]") {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    REQUIRE(codecs::to_hex(bytes, sizeof(bytes)) == "000fa0ff");
    REQUIRE(codecs::to_hex(bytes, 0).empty());
}
