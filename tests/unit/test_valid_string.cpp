#include <catch2/catch_test_macros.hpp>
#include "core/valid_string.hpp"

#include <map>
#include <sstream>
#include <unordered_set>

using namespace keel;

TEST_CASE("ValidString equality", "[valid_string]") {
    ValidString string1("abc123");
    ValidString string2("abc123");
    ValidString string3("def456");

    REQUIRE(string1.value() == "abc123");
    REQUIRE(string1 == string1);
    REQUIRE(string1 == string2);
    REQUIRE(string1 != string3);
}

TEST_CASE("ValidString comparison", "[valid_string]") {
    ValidString string1("123");
    ValidString string2("456");
    ValidString string3("abc");
    ValidString string4("def");

    REQUIRE(string1 <= string1);
    REQUIRE(string1 <= string2);
    REQUIRE(string1 < string2);
    REQUIRE(string2 > string1);
    REQUIRE(string2 >= string1);
    REQUIRE(string2 >= string2);
    REQUIRE(string3 <= string4);

    REQUIRE(string1.compare(string2) == std::strong_ordering::less);
    REQUIRE(string3.compare(string4) == std::strong_ordering::less);
    REQUIRE(string4.compare(string3) == std::strong_ordering::greater);
    REQUIRE(string1.compare(ValidString("123")) == std::strong_ordering::equal);
}

TEST_CASE("ValidString orders by code point, not by signed char", "[valid_string]") {
    // U+00E9 encodes as 0xC3 0xA9; it must sort after every ASCII letter.
    ValidString ascii("z");
    ValidString accented("\xC3\xA9");

    REQUIRE(ascii < accented);
    REQUIRE(ValidString("ab") < ValidString("abc"));
    REQUIRE(ValidString("B") < ValidString("a"));
}

TEST_CASE("ValidString hash is deterministic", "[valid_string]") {
    ValidString value("abc");

    REQUIRE(value.hash() == ValidString("abc").hash());
    REQUIRE(std::hash<ValidString>{}(value) == value.hash());

    // 64-bit FNV-1a of "abc", stable across runs.
    if constexpr (sizeof(size_t) == 8) {
        REQUIRE(value.hash() == static_cast<size_t>(0xe71fa2190541574bULL));
    }
}

TEST_CASE("ValidString to_string returns the payload verbatim", "[valid_string]") {
    REQUIRE(ValidString("abc").to_string() == "abc");
    REQUIRE(ValidString("  padded\t").to_string() == "  padded\t");
    REQUIRE(ValidString("MiXeD").to_string() == "MiXeD");
}

TEST_CASE("ValidString streams its payload", "[valid_string]") {
    std::ostringstream oss;
    oss << ValidString("abc");

    REQUIRE(oss.str() == "abc");
}

TEST_CASE("ValidString debug_string is decorated", "[valid_string]") {
    ValidString value("abc");
    const auto result = value.debug_string();

    REQUIRE(result.starts_with("<ValidString(abc) object at "));
    REQUIRE(result.ends_with(">"));
}

TEST_CASE("ValidString rejects empty and whitespace-only text", "[valid_string]") {
    SECTION("empty") {
        auto result = ValidString::create("");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ValidationErrorKind::Empty);
    }

    SECTION("spaces") {
        auto result = ValidString::create("   ");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ValidationErrorKind::WhitespaceOnly);
    }

    SECTION("mixed ASCII whitespace") {
        auto result = ValidString::create(" \t\r\n\v\f");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ValidationErrorKind::WhitespaceOnly);
    }

    SECTION("Unicode whitespace") {
        // NBSP, ideographic space
        auto result = ValidString::create("\xC2\xA0\xE3\x80\x80");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ValidationErrorKind::WhitespaceOnly);
    }

    SECTION("throwing constructor") {
        REQUIRE_THROWS_AS(ValidString(""), ValidationFailure);
        REQUIRE_THROWS_AS(ValidString("   "), ValidationFailure);
    }
}

TEST_CASE("ValidString error message names the parameter", "[valid_string]") {
    auto result = ValidString::create("", "symbol");

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message.find("'symbol'") != std::string::npos);
    REQUIRE(result.unwrap_err().message.find("empty") != std::string::npos);
}

TEST_CASE("ValidString accepts text with any non-whitespace content", "[valid_string]") {
    REQUIRE(ValidString::create(" x ").is_ok());
    REQUIRE(ValidString::create("\xE2\x82\xAC").is_ok());
    // Invalid UTF-8 counts as content.
    REQUIRE(ValidString::create(" \xFF ").is_ok());
}

TEST_CASE("ValidString works as a container key", "[valid_string]") {
    std::unordered_set<ValidString> set;
    set.insert(ValidString("AUD/USD"));
    set.insert(ValidString("AUD/USD"));
    set.insert(ValidString("EUR/USD"));
    REQUIRE(set.size() == 2);
    REQUIRE(set.contains(ValidString("EUR/USD")));

    std::map<ValidString, int> ordered;
    ordered.emplace(ValidString("b"), 2);
    ordered.emplace(ValidString("a"), 1);
    REQUIRE(ordered.begin()->first == ValidString("a"));
}

TEST_CASE("ValidString copies are independent and equal", "[valid_string]") {
    ValidString original("abc");
    ValidString copy = original;
    ValidString moved = std::move(copy);

    REQUIRE(moved == original);
    REQUIRE(moved.hash() == original.hash());
}
