// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <cstdint>
#include <vector>

using namespace blockdag::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }

    SECTION("Leading zeros and plus sign") {
        REQUIRE(SafeParseInt("0042", 0, 100) == 42);
        REQUIRE(SafeParseInt("+42", 0, 100) == 42);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Stray characters") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4x2", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("--42", -100, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("0x10", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 - simulator sized values", "[util][string_parsing]") {
    SECTION("Values above 32 bits") {
        auto result = SafeParseInt64("4294967295", 0, 4294967295LL);
        REQUIRE(result.has_value());
        REQUIRE(*result == 4294967295LL);
    }

    SECTION("Simulation seconds") {
        REQUIRE(SafeParseInt64("86400", 0, 1000000) == 86400);
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(SafeParseInt64("", 0, 1000).has_value());
        REQUIRE_FALSE(SafeParseInt64("4294967296", 0, 4294967295LL).has_value());
        REQUIRE_FALSE(SafeParseInt64("999999999999999999999", 0, INT64_MAX).has_value());
        REQUIRE_FALSE(SafeParseInt64("100x", 0, 1000).has_value());
        REQUIRE_FALSE(SafeParseInt64("1e10", 0, INT64_MAX).has_value());
    }
}

TEST_CASE("SafeParseDouble - rates and delays", "[util][string_parsing]") {
    SECTION("Fractional values") {
        auto result = SafeParseDouble("2.5", 0.0, 10.0);
        REQUIRE(result.has_value());
        REQUIRE(*result == 2.5);
    }

    SECTION("Integers are accepted") {
        REQUIRE(SafeParseDouble("1", 0.0, 10.0) == 1.0);
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(SafeParseDouble("", 0.0, 10.0).has_value());
        REQUIRE_FALSE(SafeParseDouble("2.5s", 0.0, 10.0).has_value());
        REQUIRE_FALSE(SafeParseDouble("-0.5", 0.0, 10.0).has_value());
        REQUIRE_FALSE(SafeParseDouble("11", 0.0, 10.0).has_value());
        REQUIRE_FALSE(SafeParseDouble("nan", 0.0, 10.0).has_value());
        REQUIRE_FALSE(SafeParseDouble("inf", 0.0, 1e300).has_value());
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("deadbeef"));
    REQUIRE(IsValidHex("DeAdBeEf"));
    REQUIRE(IsValidHex("0"));
    REQUIRE(IsValidHex(std::string(1000, 'a')));

    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("deadbeefg"));
    REQUIRE_FALSE(IsValidHex("dead beef"));
    REQUIRE_FALSE(IsValidHex("0x123"));
}

TEST_CASE("SafeParseHash", "[util][string_parsing]") {
    SECTION("Valid 64-character hex hash") {
        auto result = SafeParseHash(std::string(64, '0'));
        REQUIRE(result.has_value());
        REQUIRE(result->IsNull());
    }

    SECTION("Round trips through GetHex") {
        const std::string hex = "00000000000000000001e3d0c625c15b9e7e8d9f3c0b2a1f8e7d6c5b4a3d2e1f";
        auto result = SafeParseHash(hex);
        REQUIRE(result.has_value());
        REQUIRE(result->GetHex() == hex);
    }

    SECTION("Wrong length or characters") {
        REQUIRE_FALSE(SafeParseHash("").has_value());
        REQUIRE_FALSE(SafeParseHash(std::string(63, '0')).has_value());
        REQUIRE_FALSE(SafeParseHash(std::string(65, '0')).has_value());
        REQUIRE_FALSE(SafeParseHash(std::string(63, '0') + "g").has_value());
    }
}

TEST_CASE("HexStr and ParseHex", "[util][string_parsing]") {
    const std::vector<uint8_t> script{0x51, 0x00, 0xab, 0xff};

    REQUIRE(HexStr(script) == "5100abff");
    REQUIRE(HexStr(std::vector<uint8_t>{}).empty());

    auto parsed = ParseHex("5100ABff");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == script);

    auto empty = ParseHex("");
    REQUIRE(empty.has_value());
    REQUIRE(empty->empty());

    REQUIRE_FALSE(ParseHex("abc").has_value());
    REQUIRE_FALSE(ParseHex("zz").has_value());
}
