#include <doctest/doctest.h>
#include <cliapp/coerce.hpp>

#include <cstdint>
#include <string>

using namespace cliapp;

// ============================================================================
// Successful coercion
// ============================================================================

TEST_CASE("coerce string is identity") {
    auto v = coerce("hello world", Kind::String);
    REQUIRE(v.isOk());
    CHECK(std::get<std::string>(v.value()) == "hello world");

    auto empty = coerce("", Kind::String);
    REQUIRE(empty.isOk());
    CHECK(std::get<std::string>(empty.value()).empty());
}

TEST_CASE("coerce int accepts signed base-10") {
    CHECK(std::get<int>(coerce("42", Kind::Int).value()) == 42);
    CHECK(std::get<int>(coerce("-7", Kind::Int).value()) == -7);
    CHECK(std::get<int>(coerce("+5", Kind::Int).value()) == 5);
    CHECK(std::get<int>(coerce("0", Kind::Int).value()) == 0);
}

TEST_CASE("coerce int64 covers the 64-bit range") {
    auto max = coerce("9223372036854775807", Kind::Int64);
    REQUIRE(max.isOk());
    CHECK(std::get<std::int64_t>(max.value()) == INT64_MAX);

    auto min = coerce("-9223372036854775808", Kind::Int64);
    REQUIRE(min.isOk());
    CHECK(std::get<std::int64_t>(min.value()) == INT64_MIN);
}

TEST_CASE("coerce float64 parses decimals and exponents") {
    CHECK(std::get<double>(coerce("3.5", Kind::Float64).value()) == doctest::Approx(3.5));
    CHECK(std::get<double>(coerce("1e3", Kind::Float64).value()) == doctest::Approx(1000.0));
    CHECK(std::get<double>(coerce("-0.25", Kind::Float64).value()) == doctest::Approx(-0.25));
}

TEST_CASE("coerce float64 accepts underflow and rejects overflow") {
    auto subnormal = coerce("4e-320", Kind::Float64);
    REQUIRE(subnormal.isOk());
    CHECK(std::get<double>(subnormal.value()) > 0.0);
    CHECK(std::get<double>(subnormal.value()) < 1e-300);

    auto rounded = coerce("1e-400", Kind::Float64);
    REQUIRE(rounded.isOk());
    CHECK(std::get<double>(rounded.value()) == 0.0);

    auto negative = coerce("-1e-400", Kind::Float64);
    REQUIRE(negative.isOk());
    CHECK(std::get<double>(negative.value()) == 0.0);

    CHECK(coerce("1e400", Kind::Float64).isErr());
    CHECK(coerce("-1e400", Kind::Float64).isErr());
    CHECK(coerce("1e-400x", Kind::Float64).isErr());
}

TEST_CASE("coerce bool recognizes canonical spellings") {
    for (const char* s : {"1", "t", "T", "TRUE", "true", "True"}) {
        auto v = coerce(s, Kind::Bool);
        REQUIRE(v.isOk());
        CHECK(std::get<bool>(v.value()) == true);
    }
    for (const char* s : {"0", "f", "F", "FALSE", "false", "False"}) {
        auto v = coerce(s, Kind::Bool);
        REQUIRE(v.isOk());
        CHECK(std::get<bool>(v.value()) == false);
    }
}

TEST_CASE("integer values survive a string round trip") {
    for (int v : {0, 1, -1, 12345, -99999, 2147483647}) {
        auto parsed = coerce(std::to_string(v), Kind::Int);
        REQUIRE(parsed.isOk());
        CHECK(std::get<int>(parsed.value()) == v);
    }
    for (std::int64_t v : {std::int64_t{0}, std::int64_t{-42}, std::int64_t{1} << 40}) {
        auto parsed = coerce(std::to_string(v), Kind::Int64);
        REQUIRE(parsed.isOk());
        CHECK(std::get<std::int64_t>(parsed.value()) == v);
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("coerce rejects malformed integers") {
    for (const char* s : {"", "abc", "5x", " 5", "1.5", "2147483648", "-2147483649"}) {
        auto v = coerce(s, Kind::Int);
        CHECK(v.isErr());
        if (v.isErr()) {
            CHECK(v.error().code() == ErrorCode::MALFORMED_VALUE);
        }
    }
    CHECK(coerce("9223372036854775808", Kind::Int64).isErr());
}

TEST_CASE("int is 32-bit; wider values need int64") {
    auto narrow = coerce("3000000000", Kind::Int);
    REQUIRE(narrow.isErr());
    CHECK(narrow.error().code() == ErrorCode::MALFORMED_VALUE);

    auto wide = coerce("3000000000", Kind::Int64);
    REQUIRE(wide.isOk());
    CHECK(std::get<std::int64_t>(wide.value()) == 3000000000LL);
}

TEST_CASE("coerce rejects malformed floats and bools") {
    CHECK(coerce("abc", Kind::Float64).isErr());
    CHECK(coerce("1.5x", Kind::Float64).isErr());
    CHECK(coerce("", Kind::Float64).isErr());
    CHECK(coerce("yes", Kind::Bool).isErr());
    CHECK(coerce("", Kind::Bool).isErr());
}

TEST_CASE("malformed value error names token and type") {
    auto v = coerce("abc", Kind::Int);
    REQUIRE(v.isErr());
    CHECK(v.error().message().find("\"abc\"") != std::string::npos);
    CHECK(v.error().message().find("<int>") != std::string::npos);
}

TEST_CASE("coerce to a record kind is unsupported") {
    auto v = coerce("x", Kind::Record);
    REQUIRE(v.isErr());
    CHECK(v.error().code() == ErrorCode::UNSUPPORTED_TYPE);
    CHECK(v.error().message().find("record") != std::string::npos);
}

TEST_CASE("kind labels") {
    CHECK(std::string(kind_label(Kind::String)) == "<string>");
    CHECK(std::string(kind_label(Kind::Int)) == "<int>");
    CHECK(std::string(kind_label(Kind::Int64)) == "<int64>");
    CHECK(std::string(kind_label(Kind::Float64)) == "<float64>");
    CHECK(std::string(kind_label(Kind::Bool)) == "<bool>");
    CHECK(std::string(kind_label(Kind::Record)) == "<value>");
}
