#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace devicelink::util;

TEST_CASE("SafeParseInt", "[util][parsing]") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE(SafeParseInt("-5", -10, 10) == -5);
    REQUIRE_FALSE(SafeParseInt("999", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
}

TEST_CASE("SafeParseInt64", "[util][parsing]") {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    REQUIRE(SafeParseInt64("64000", 1, kMax) == 64000);
    REQUIRE(SafeParseInt64("9223372036854775807", 0, kMax) == kMax);
    REQUIRE_FALSE(SafeParseInt64("9223372036854775808", 0, kMax).has_value());
    REQUIRE_FALSE(SafeParseInt64("0", 1, kMax).has_value());
    REQUIRE_FALSE(SafeParseInt64("10ms", 0, kMax).has_value());
}
