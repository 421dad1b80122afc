// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for uint256, arith_uint256 conversions and hashing

#include <catch2/catch_test_macros.hpp>
#include "util/arith_uint256.hpp"
#include "util/hash.hpp"
#include "util/string_parsing.hpp"
#include "util/uint.hpp"
#include <set>
#include <stdexcept>
#include <unordered_set>

using blockdag::util::HashWriter;
using blockdag::util::HexStr;

TEST_CASE("uint256 basic operations", "[uint]")
{
    SECTION("Default constructor creates zero") {
        uint256 zero;
        REQUIRE(zero.IsNull());
        REQUIRE(zero == uint256::ZERO);
        REQUIRE(zero.GetHex() == std::string(64, '0'));
    }

    SECTION("Single byte constructor") {
        uint256 one(1);
        REQUIRE_FALSE(one.IsNull());
        REQUIRE(one == uint256::ONE);
        REQUIRE(one.data()[0] == 1);
        REQUIRE(one.GetHex() == std::string(63, '0') + "1");
    }

    SECTION("SetNull") {
        uint256 value = uint256S("0xabcdef");
        REQUIRE_FALSE(value.IsNull());
        value.SetNull();
        REQUIRE(value.IsNull());
    }

    SECTION("ToShortString is the hex prefix") {
        uint256 value = uint256S("1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef");
        REQUIRE(value.ToShortString() == "12345678");
    }
}

TEST_CASE("uint256S helper function", "[uint]")
{
    SECTION("Hex round trip") {
        const std::string hex = "00000000000000000001e3d0c625c15b9e7e8d9f3c0b2a1f8e7d6c5b4a3d2e1f";
        REQUIRE(uint256S(hex).GetHex() == hex);
        REQUIRE(uint256S("0x" + hex) == uint256S(hex));
    }

    SECTION("Short strings fill the low bytes") {
        uint256 value = uint256S("0x1234");
        REQUIRE(value.data()[0] == 0x34);
        REQUIRE(value.data()[1] == 0x12);
        REQUIRE(value.data()[2] == 0x00);
    }
}

TEST_CASE("uint256 ordering and hashing", "[uint]")
{
    uint256 a = uint256S("01");
    uint256 b = uint256S("02");

    // Ordering is lexicographic over the stored bytes
    REQUIRE(a < b);
    REQUIRE(b > a);
    REQUIRE(a != b);
    REQUIRE(a.Compare(a) == 0);

    std::set<uint256> ordered{b, a};
    REQUIRE(*ordered.begin() == a);

    std::unordered_set<uint256, blockdag::util::Uint256Hasher> hashed{a, b, a};
    REQUIRE(hashed.size() == 2);
}

TEST_CASE("UintToArith256 and ArithToUint256 conversion", "[uint][arith_uint]")
{
    SECTION("Little-endian interpretation") {
        uint256 blob = uint256S("0x0102");
        REQUIRE(UintToArith256(blob) == 0x0102);
    }

    SECTION("Round trip") {
        uint256 hash = uint256S("7fffff0000000000000000000000000000000000000000000000000000000000");
        REQUIRE(ArithToUint256(UintToArith256(hash)) == hash);
    }

    SECTION("Maximum value") {
        uint256 all_ones = uint256S(std::string(64, 'f'));
        arith_uint256 max = UintToArith256(all_ones);
        REQUIRE(max == ~arith_uint256(0));
        REQUIRE(ArithToUint256(max) == all_ones);
    }
}

TEST_CASE("arith_uint256 hex conversion", "[arith_uint]")
{
    REQUIRE(ArithToHex(0) == "0");
    REQUIRE(ArithToHex(255) == "ff");
    REQUIRE(ArithToHex(arith_uint256(1) << 200) == "1" + std::string(50, '0'));

    REQUIRE(ArithFromHex("ff") == 255);
    REQUIRE(ArithFromHex("0xFF") == 255);
    REQUIRE(ArithFromHex(ArithToHex(arith_uint256(12345678901234567ULL) * 1000003)) ==
            arith_uint256(12345678901234567ULL) * 1000003);

    REQUIRE_THROWS_AS(ArithFromHex(""), std::invalid_argument);
    REQUIRE_THROWS_AS(ArithFromHex("0x"), std::invalid_argument);
    REQUIRE_THROWS_AS(ArithFromHex("xyz"), std::invalid_argument);
    REQUIRE_THROWS_AS(ArithFromHex(std::string(65, '1')), std::invalid_argument);
}

TEST_CASE("Double SHA-256", "[hash]")
{
    SECTION("Empty input") {
        uint256 hash = blockdag::util::Hash(std::span<const uint8_t>());
        REQUIRE(HexStr(std::span<const uint8_t>(hash.begin(), hash.end())) ==
                "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    }

    SECTION("Writer output is the hash of its bytes") {
        HashWriter writer;
        writer.WriteU32(1).WriteU64(2);
        REQUIRE(writer.size() == 12);

        const std::vector<uint8_t> bytes{1, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0};
        REQUIRE(writer.GetHash() == blockdag::util::Hash(bytes));
    }

    SECTION("Length prefixes keep fields apart") {
        HashWriter ab_c;
        ab_c.WriteString("ab").WriteString("c");
        HashWriter a_bc;
        a_bc.WriteString("a").WriteString("bc");
        REQUIRE(ab_c.GetHash() != a_bc.GetHash());
    }

    SECTION("Merkle node hash is order sensitive") {
        uint256 left = uint256S("01");
        uint256 right = uint256S("02");
        REQUIRE(blockdag::util::Hash(left, right) != blockdag::util::Hash(right, left));
    }
}
