#include "catch2_custom.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/expected.hpp>

#include <string>
#include <string_view>
#include <system_error>

using namespace std::literals;
using junitgrader::ErrorKind;
using junitgrader::Expected;
using junitgrader::Result;

// Simple types
using Et = Expected<int, std::string>;

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());

    REQUIRE(Et{"Hello"}.error() == "Hello");
    REQUIRE(*Et{123} == 123);
}

TEST_CASE("Equality operators") {
    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("value_or") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);
}

TEST_CASE("Accessing the wrong alternative is an assertion failure") {
    // catch_main installs a libassert handler that throws
    REQUIRE_THROWS(Et{123}.error());
    REQUIRE_THROWS(Et{"A"}.value());
}

namespace {

Result<int> half_of_even(int num) {
    if (num % 2 != 0) {
        return ErrorKind::BadArgument;
    }

    return num / 2;
}

Result<int> quarter_of(int num) {
    int half = TRY(half_of_even(num));

    return TRY(half_of_even(half));
}

Result<int> half_or_crash(int num) {
    return TRYE(half_of_even(num), RunCrash);
}

} // namespace

TEST_CASE("TRY propagates errors and unwraps values") {
    REQUIRE(quarter_of(8) == 2);
    REQUIRE(quarter_of(6) == ErrorKind::BadArgument);
    REQUIRE(quarter_of(3) == ErrorKind::BadArgument);
}

TEST_CASE("TRYE replaces the propagated error") {
    REQUIRE(half_or_crash(4) == 2);
    REQUIRE(half_or_crash(5) == ErrorKind::RunCrash);
}

TEST_CASE("Expected is formattable") {
    REQUIRE(fmt::format("{}", Et{5}) == "Expected(5)");
    REQUIRE(fmt::format("{}", Et{"bad"}) == "Error(bad)");
    REQUIRE(fmt::format("{}", Expected<void, ErrorKind>{}) == "Expected(void)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::RunCrash}) == "Error(RunCrash)");
}
