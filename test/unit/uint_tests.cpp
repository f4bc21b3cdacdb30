// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/uint.hpp"
#include <array>
#include <string>

using blockledger::uint256;
using blockledger::uint256S;

TEST_CASE("uint256 basic operations", "[uint]")
{
    SECTION("Default constructor creates zero")
    {
        uint256 zero;
        REQUIRE(zero.IsNull());
        REQUIRE(zero.GetHex() == std::string(64, '0'));
    }

    SECTION("SetNull works correctly")
    {
        uint256 test = uint256S("01");
        REQUIRE_FALSE(test.IsNull());
        test.SetNull();
        REQUIRE(test.IsNull());
    }

    SECTION("Hex conversion - basic")
    {
        uint256 test;
        test.SetHex("0000000000000000000000000000000000000000000000000000000000000001");
        REQUIRE(test.GetHex() == "0000000000000000000000000000000000000000000000000000000000000001");
    }

    SECTION("Hex conversion - with 0x prefix")
    {
        uint256 test;
        test.SetHex("0x00000000000000000000000000000000000000000000000000000000000000ff");
        REQUIRE(test.GetHex() == "00000000000000000000000000000000000000000000000000000000000000ff");
    }

    SECTION("Hex conversion - short input is right aligned")
    {
        REQUIRE(uint256S("abc").GetHex() ==
                "0000000000000000000000000000000000000000000000000000000000000abc");
    }
}

TEST_CASE("uint256 ordering", "[uint]")
{
    uint256 zero;
    uint256 one = uint256S("01");
    uint256 high = uint256S("8000000000000000000000000000000000000000000000000000000000000000");

    REQUIRE(zero < one);
    REQUIRE(one < high);
    REQUIRE_FALSE(high < one);
    REQUIRE(high.CompareTo(high) == 0);
    REQUIRE(one != high);

    SECTION("Most significant byte decides")
    {
        uint256 a = uint256S("0100000000000000000000000000000000000000000000000000000000000000");
        uint256 b = uint256S("00ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
        REQUIRE(b < a);
    }
}

TEST_CASE("uint256 SetBit", "[uint]")
{
    uint256 value;

    value.SetBit(0);
    REQUIRE(value == uint256S("01"));

    value.SetNull();
    value.SetBit(255);
    REQUIRE(value.GetHex() ==
            "8000000000000000000000000000000000000000000000000000000000000000");

    SECTION("Out of range bit is ignored")
    {
        uint256 untouched;
        untouched.SetBit(256);
        REQUIRE(untouched.IsNull());
    }
}

TEST_CASE("uint256 FromBigEndian", "[uint]")
{
    std::array<unsigned char, 32> bytes{};
    bytes[0] = 0xab;
    bytes[31] = 0x01;

    uint256 value = uint256::FromBigEndian(bytes);
    REQUIRE(value.GetHex() ==
            "ab00000000000000000000000000000000000000000000000000000000000001");
    REQUIRE(value.data()[0] == 0x01);
    REQUIRE(value.data()[31] == 0xab);
}
