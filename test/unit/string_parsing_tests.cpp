// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <cstdint>
#include <limits>

using namespace draftops::util;

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
        REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4.2", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("\t42", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        // Larger than int but fits in long long
        REQUIRE_FALSE(SafeParseInt("3000000000", std::numeric_limits<int>::min(),
                                   std::numeric_limits<int>::max())
                          .has_value());
    }

    SECTION("Overflow of the widest type") {
        REQUIRE_FALSE(SafeParseInt("99999999999999999999999", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 - range handling", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("86400000", 0, 86400000) == 86400000);
    REQUIRE(SafeParseInt64("-1000000", -1000000, 1000000) == -1000000);
    REQUIRE_FALSE(SafeParseInt64("86400001", 0, 86400000).has_value());
    REQUIRE_FALSE(SafeParseInt64("999999999999999999999", 0, INT64_MAX).has_value());
    REQUIRE(SafeParseInt64("9223372036854775807", 0, INT64_MAX) == INT64_MAX);
}

TEST_CASE("SafeParsePort - valid and invalid", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("8080") == 8080);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-80").has_value());
    REQUIRE_FALSE(SafeParsePort("http").has_value());
}

TEST_CASE("SafeParseBool - accepted tokens", "[util][string_parsing]") {
    REQUIRE(SafeParseBool("true") == true);
    REQUIRE(SafeParseBool("TRUE") == true);
    REQUIRE(SafeParseBool("True") == true);
    REQUIRE(SafeParseBool("1") == true);
    REQUIRE(SafeParseBool("false") == false);
    REQUIRE(SafeParseBool("0") == false);
    REQUIRE_FALSE(SafeParseBool("yes").has_value());
    REQUIRE_FALSE(SafeParseBool("2").has_value());
    REQUIRE_FALSE(SafeParseBool("").has_value());
}

TEST_CASE("ToUpper and SplitWhitespace", "[util][string_parsing]") {
    REQUIRE(ToUpper("selected") == "SELECTED");
    REQUIRE(ToUpper("D/st 4") == "D/ST 4");

    SECTION("Runs of mixed whitespace collapse") {
        auto tokens = SplitWhitespace("  SELECTED\t3   4046 17 \r\n");
        REQUIRE(tokens == std::vector<std::string>{"SELECTED", "3", "4046", "17"});
    }

    SECTION("Blank input yields no tokens") {
        REQUIRE(SplitWhitespace("").empty());
        REQUIRE(SplitWhitespace(" \t ").empty());
    }
}
