// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <cstdint>
#include <limits>

using namespace blockledger::util;

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
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64", "[util][string_parsing]") {
    SECTION("Values beyond 32 bits") {
        auto result = SafeParseInt64("4294967296", 1, std::numeric_limits<int64_t>::max());
        REQUIRE(result.has_value());
        REQUIRE(*result == 4294967296LL);
    }

    SECTION("Overflow is rejected") {
        REQUIRE_FALSE(SafeParseInt64("999999999999999999999", 0,
                                     std::numeric_limits<int64_t>::max()).has_value());
    }

    SECTION("Zero rejected when minimum is one") {
        REQUIRE_FALSE(SafeParseInt64("0", 1, 100).has_value());
    }
}

TEST_CASE("SafeParseAmount", "[util][string_parsing]") {
    SECTION("Decimal forms") {
        REQUIRE(SafeParseAmount("10") == 10.0);
        REQUIRE(SafeParseAmount("0.25") == 0.25);
        REQUIRE(SafeParseAmount("-3") == -3.0);
        REQUIRE(SafeParseAmount("1e3") == 1000.0);
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(SafeParseAmount("").has_value());
        REQUIRE_FALSE(SafeParseAmount(" 1").has_value());
        REQUIRE_FALSE(SafeParseAmount("1.5btc").has_value());
        REQUIRE_FALSE(SafeParseAmount("nan").has_value());
        REQUIRE_FALSE(SafeParseAmount("inf").has_value());
        REQUIRE_FALSE(SafeParseAmount("0x10").has_value());
        REQUIRE_FALSE(SafeParseAmount("1e999").has_value());
    }
}

TEST_CASE("JSON error responses", "[util][string_parsing]") {
    REQUIRE(JsonError("Block not found") == "{\"error\":\"Block not found\"}\n");
    REQUIRE(JsonError("say \"hi\"\n") == "{\"error\":\"say \\\"hi\\\"\\n\"}\n");
    REQUIRE(EscapeJSONString(std::string("\x01", 1)) == "\\u0001");
}
