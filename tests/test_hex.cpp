#include <doctest/doctest.h>
#include "pumplink/hex.hpp"

using namespace pumplink;

TEST_CASE("to_hex renders uppercase with a separator") {
    const std::vector<uint8_t> b{0x5C, 0x00, 0xab};
    CHECK(to_hex(b) == "5C 00 AB");
    CHECK(to_hex(b, '\0') == "5C00AB");
    CHECK(to_hex(std::vector<uint8_t>{}).empty());
}

TEST_CASE("from_hex accepts spaced, contiguous and prefixed input") {
    std::vector<uint8_t> out;

    REQUIRE(from_hex("5C 00 20 69 00 49", out));
    CHECK(out == std::vector<uint8_t>{0x5C, 0x00, 0x20, 0x69, 0x00, 0x49});

    REQUIRE(from_hex("c0690234128d", out));
    CHECK(out == std::vector<uint8_t>{0xC0, 0x69, 0x02, 0x34, 0x12, 0x8D});

    REQUIRE(from_hex("0x06, 0x15:aa", out));
    CHECK(out == std::vector<uint8_t>{0x06, 0x15, 0xAA});

    REQUIRE(from_hex("  ", out));
    CHECK(out.empty());
}

TEST_CASE("from_hex rejects odd digit counts and bad characters") {
    std::vector<uint8_t> out{1, 2, 3};
    CHECK_FALSE(from_hex("5C 0", out));
    CHECK(out.empty());
    CHECK_FALSE(from_hex("5G", out));
    CHECK_FALSE(from_hex("12 345", out));
}
