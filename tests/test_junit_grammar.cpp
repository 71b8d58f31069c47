#include "catch2_custom.hpp"

#include <junitgrader/report/junit_grammar.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

using namespace junitgrader::grammar;
using namespace std::string_view_literals;

TEST_CASE("Version banner recognition") {
    REQUIRE(is_version_line("JUnit version 4.13.2"));
    REQUIRE(is_version_line("JUnit version 4.12"));
    REQUIRE(is_version_line("version4.8"));

    REQUIRE_FALSE(is_version_line("JUnit version four"));
    REQUIRE_FALSE(is_version_line("Time: 0.011"));
    REQUIRE_FALSE(is_version_line(""));
}

TEST_CASE("Failure headers") {
    REQUIRE(match_failure_header("1) testAdd(CalculatorTest)") == "testAdd(CalculatorTest)"sv);
    REQUIRE(match_failure_header("12)testDivide(CalculatorTest)") == "testDivide(CalculatorTest)"sv);
    REQUIRE(match_failure_header("3) ") == ""sv);

    REQUIRE_FALSE(match_failure_header("Tests run: 3,  Failures: 2").has_value());
    REQUIRE_FALSE(match_failure_header("  1) indented").has_value());
    REQUIRE_FALSE(match_failure_header("a) testAdd").has_value());
}

TEST_CASE("Comparison failures") {
    SECTION("Single comparison") {
        auto matches = match_comparison_failures("org.junit.ComparisonFailure: expected:<[5]> but was:<[6]>\n"
                                                 "\tat org.junit.Assert.assertEquals(Assert.java:117)\n");

        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].message == " ");
        REQUIRE(matches[0].expected == "[5]");
        REQUIRE(matches[0].actual == "[6]");
    }

    SECTION("Message and spacing around the delimiters") {
        auto matches = match_comparison_failures("java.lang.AssertionError: sum is wrong expected : <3> but was : <4>");

        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].message == " sum is wrong ");
        REQUIRE(matches[0].expected == "3");
        REQUIRE(matches[0].actual == "4");
    }

    SECTION("Nested angle brackets in the actual value") {
        auto matches = match_comparison_failures("AssertionError: expected:<List<a>> but was:<List<b>>\n");

        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].expected == "List<a>");
        REQUIRE(matches[0].actual == "List<b>");
    }

    SECTION("Values spanning lines") {
        auto matches = match_comparison_failures("ComparisonFailure: expected:<line one\nline two> but was:<other\nvalue>\n"
                                                 "\tat Foo.bar(Foo.java:1)");

        REQUIRE(matches.size() == 1);
        REQUIRE(matches[0].expected == "line one\nline two");
        REQUIRE(matches[0].actual == "other\nvalue");
    }

    SECTION("Several comparisons in one block") {
        auto matches = match_comparison_failures("AssertionError: first expected:<1> but was:<2>\n"
                                                 "AssertionError: second expected:<3> but was:<4>\n");

        REQUIRE(matches.size() == 2);
        REQUIRE(matches[0].actual == "2");
        REQUIRE(matches[1].message == " second ");
        REQUIRE(matches[1].expected == "3");
    }

    SECTION("Other exception kinds are not comparisons") {
        REQUIRE(match_comparison_failures("java.lang.ArithmeticException: / by zero").empty());
        REQUIRE(match_comparison_failures("IllegalStateException: expected:<1> but was:<2>").empty());
    }
}

TEST_CASE("Marker line recognition") {
    REQUIRE(is_marker_line("..E.E"));
    REQUIRE(is_marker_line(".e.I  "));
    REQUIRE(is_marker_line("I"));

    REQUIRE_FALSE(is_marker_line(""));
    REQUIRE_FALSE(is_marker_line("  "));
    REQUIRE_FALSE(is_marker_line("Could not find class: FooTest"));
    REQUIRE_FALSE(is_marker_line(".Hello"));
    REQUIRE_FALSE(is_marker_line(". ."));
    REQUIRE_FALSE(is_marker_line("..F"));
}

TEST_CASE("Long comparison values") {
    const std::string expected(100'000, 'a');
    const std::string actual(150'000, 'b');

    auto matches = match_comparison_failures("org.junit.ComparisonFailure: expected:<" + expected + "> but was:<" +
                                             actual + ">\n\tat org.junit.Assert.assertEquals(Assert.java:117)\n");

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].expected.size() == expected.size());
    REQUIRE(matches[0].expected == expected);
    REQUIRE(matches[0].actual == actual);
}

TEST_CASE("Comparisons that are never closed do not match") {
    std::string block = "java.lang.AssertionError: expected:<ok\n";
    for (int frame = 1; frame <= 4096; ++frame) {
        block += fmt::format("\tat Solution.recurse(Solution.java:{})\n", frame);
    }

    REQUIRE(block.size() > 100'000);
    REQUIRE(match_comparison_failures(block).empty());

    REQUIRE(match_comparison_failures("AssertionError: expected:<1 but was:<2>").empty());
    REQUIRE(match_comparison_failures("AssertionError: expected:<1> but was:<2 and nothing else").empty());
    REQUIRE(match_comparison_failures("AssertionError: expected:<").empty());
}

TEST_CASE("Long lines are neither banners nor failure headers by accident") {
    const std::string padding(200'000, ' ');

    REQUIRE_FALSE(is_version_line("version" + padding + "4.13"));
    REQUIRE(match_failure_header("1)" + padding + "testAdd") == "testAdd"sv);
    REQUIRE(strip_exception_prefixes(std::string(200'000, 'x')).size() == 200'000);
}

TEST_CASE("Exception prefix stripping") {
    REQUIRE(strip_exception_prefixes("java.lang.IllegalStateException: not ready") == "not ready");
    REQUIRE(strip_exception_prefixes("org.junit.runners.model.TestTimedOutException: test timed out after 10 ms") ==
            "test timed out after 10 ms");
    REQUIRE(strip_exception_prefixes("java.lang.RuntimeException: java.io.IOException: disk full") == "disk full");

    // Not fully qualified, so not an exception class name
    REQUIRE(strip_exception_prefixes("Error: something") == "Error: something");
    REQUIRE(strip_exception_prefixes("/ by zero") == "/ by zero");
}
