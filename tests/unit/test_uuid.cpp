#include <catch2/catch_test_macros.hpp>
#include "core/uuid.hpp"

#include <unordered_set>

using namespace keel;

namespace {

constexpr auto CANONICAL = "123e4567-e89b-12d3-a456-426614174000";

} // namespace

TEST_CASE("Uuid default is nil", "[uuid]") {
    Uuid nil;

    REQUIRE(nil.is_nil());
    REQUIRE(nil.to_string() == "00000000-0000-0000-0000-000000000000");
}

TEST_CASE("Uuid::generate produces random version 4 values", "[uuid]") {
    auto a = Uuid::generate();
    auto b = Uuid::generate();

    REQUIRE_FALSE(a.is_nil());
    REQUIRE(a != b);
    REQUIRE(a.version() == 4);
    REQUIRE(a.variant() == Uuid::Variant::Rfc4122);

    std::unordered_set<Uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(Uuid::generate());
    }
    REQUIRE(seen.size() == 1000);
}

TEST_CASE("Uuid::parse accepts canonical and alternate forms", "[uuid]") {
    auto canonical = Uuid::parse(CANONICAL);
    REQUIRE(canonical.is_ok());
    REQUIRE(canonical.unwrap().to_string() == CANONICAL);
    REQUIRE(canonical.unwrap().bytes()[0] == 0x12);
    REQUIRE(canonical.unwrap().bytes()[15] == 0x00);
    REQUIRE(canonical.unwrap().version() == 1);

    SECTION("upper case") {
        auto parsed = Uuid::parse("123E4567-E89B-12D3-A456-426614174000");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == canonical.unwrap());
    }

    SECTION("undashed") {
        auto parsed = Uuid::parse("123e4567e89b12d3a456426614174000");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == canonical.unwrap());
    }

    SECTION("braced") {
        auto parsed = Uuid::parse("{123e4567-e89b-12d3-a456-426614174000}");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == canonical.unwrap());
    }

    SECTION("urn") {
        auto parsed = Uuid::parse("urn:uuid:123e4567-e89b-12d3-a456-426614174000");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == canonical.unwrap());
    }
}

TEST_CASE("Uuid::parse rejects malformed text", "[uuid]") {
    auto expect_malformed = [](std::string_view text) {
        auto parsed = Uuid::parse(text);
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().kind == ValidationErrorKind::MalformedUuid);
        return parsed.unwrap_err().message;
    };

    SECTION("empty") {
        REQUIRE(expect_malformed("").find("got 0 characters") != std::string::npos);
    }

    SECTION("too short") {
        expect_malformed("123e4567-e89b-12d3-a456-42661417400");
    }

    SECTION("too long") {
        expect_malformed("123e4567-e89b-12d3-a456-4266141740000");
    }

    SECTION("misplaced dash") {
        auto message = expect_malformed("123e456-7e89b-12d3-a456-426614174000");
        REQUIRE(message.find("position 7") != std::string::npos);
    }

    SECTION("non-hex digit") {
        auto message = expect_malformed("123e4567-e89b-12d3-a456-42661417400g");
        REQUIRE(message.find("hex digit") != std::string::npos);
    }

    SECTION("sign characters are not digits") {
        expect_malformed("+23e4567e89b12d3a456426614174000");
    }

    SECTION("unbalanced brace") {
        expect_malformed("{123e4567-e89b-12d3-a456-426614174000");
    }
}

TEST_CASE("Uuid round-trips through text", "[uuid]") {
    for (int i = 0; i < 100; ++i) {
        auto id = Uuid::generate();
        auto parsed = Uuid::parse(id.to_string());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap() == id);
    }
}
