/// \file
/// Every textual pattern of the JUnit 4 `JUnitCore` console report that the grader
/// recognizes lives here, so that a change in the runner's output format is a one-place change.
///
/// A typical report looks like:
/// \code
///     JUnit version 4.13.2
///     ..E.E
///     Time: 0.011
///     There were 2 failures:
///     1) testAdd(CalculatorTest)
///     org.junit.ComparisonFailure: expected:<[5]> but was:<[6]>
///         at org.junit.Assert.assertEquals(Assert.java:117)
///     2) testDivide(CalculatorTest)
///     java.lang.ArithmeticException: / by zero
///         at Calculator.divide(Calculator.java:12)
///
///     FAILURES!!!
///     Tests run: 3,  Failures: 2
/// \endcode
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::grammar {

/// Glyph printed on the marker line for a passing test
inline constexpr char PASS_GLYPH = '.';

/// Glyph printed for a failing test, matched case-insensitively. Errors and assertion failures
/// are not distinguished.
inline constexpr char FAILURE_GLYPH = 'E';

/// Glyph printed for an `@Ignore`d test. It is part of the marker line, but is not a test that ran
inline constexpr char IGNORED_GLYPH = 'I';

constexpr bool is_failure_glyph(char chr) noexcept {
    return chr == FAILURE_GLYPH || chr == 'e';
}

/// Whether `chr` stands for a test that ran (passed or failed)
constexpr bool is_test_glyph(char chr) noexcept {
    return chr == PASS_GLYPH || is_failure_glyph(chr);
}

constexpr bool is_marker_glyph(char chr) noexcept {
    return is_test_glyph(chr) || chr == IGNORED_GLYPH;
}

/// Recognizes a marker line: one or more marker glyphs and nothing else, trailing whitespace aside.
///
/// Pattern: `^[.EeI]+\s*$`
bool is_marker_line(std::string_view line);

/// Recognizes the runner banner that immediately precedes the marker line.
///
/// Pattern: `version\s*\d+\.\d+(\.\d+)?` anywhere in the line (e.g., "JUnit version 4.13.2")
bool is_version_line(std::string_view line);

/// Recognizes a failure-block header and returns its description.
///
/// Pattern: `^\d+\)\s*(.*)$`, e.g. "1) testAdd(CalculatorTest)" => "testAdd(CalculatorTest)"
std::optional<std::string_view> match_failure_header(std::string_view line);

struct ComparisonMatch
{
    std::string message; ///< Raw (untrimmed) text between the exception kind and "expected"
    std::string expected;
    std::string actual;
};

/// Finds every value-comparison assertion in a failure block, in textual order.
///
/// Pattern: `(AssertionError|ComparisonFailure):(<message>)expected\s*:\s*<(<expected>)>\s*but was\s*:\s*<(<actual>)>`
///
/// <message> is confined to a single line. <expected> and <actual> may span lines; <expected>
/// ends at the first "> but was :<" and <actual> at the first '>' that ends a line (so
/// "but was:<List<a>>" => "List<a>"). A comparison that is never closed is not a match.
///
/// Scans iteratively, so there is no limit on the length of the block.
std::vector<ComparisonMatch> match_comparison_failures(std::string_view block);

/// Removes leading fully-qualified exception class names from a message line, e.g.
///   "java.lang.IllegalStateException: not ready"                                => "not ready"
///   "org.junit.runners.model.TestTimedOutException: test timed out after 10 ms" => "test timed out after 10 ms"
///
/// Pattern (applied repeatedly): `^(?:[A-Za-z_$][\w$]*\.)+[A-Za-z_$][\w$]*:\s*`
std::string_view strip_exception_prefixes(std::string_view line);

} // namespace junitgrader::grammar
