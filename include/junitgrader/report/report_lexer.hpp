#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// One numbered failure section of the runner output
struct FailureBlock
{
    /// Description from the block header, e.g. "testAdd(CalculatorTest)" from "1) testAdd(CalculatorTest)"
    std::string test_name;

    /// Text between this header line and the next one (or the end of the output), unmodified
    std::string text;
};

struct MarkerCounts
{
    int total;
    int failed;
};

/// Everything the lexer could find in one runner output
struct LexedReport
{
    /// The marker ("dot") line, verbatim. Empty if none was found
    std::string marker_line;

    /// Number of tests run. `nullopt` if it could not be determined at all
    std::optional<int> total_tests;
    int failed_tests = 0;

    std::vector<FailureBlock> failure_blocks;
};

/// Find the marker line: the line immediately following the runner's version banner.
/// Returns `nullopt` if there is no banner, or if the line after it is not made of marker glyphs
/// (e.g., it is empty, or output the submission printed before its first test).
std::optional<std::string> find_marker_line(std::string_view output);

/// Count the tests represented by a marker line: one glyph per test that ran, so the total is the number
/// of pass and failure glyphs. Ignored tests ('I') count towards neither.
MarkerCounts count_markers(std::string_view marker_line);

/// Split the output into failure blocks on every header line, preserving order.
/// Anything before the first header is discarded.
std::vector<FailureBlock> split_failure_blocks(std::string_view output);

/// Runs all of the above and reconciles the counts:
///   - marker line found              => counts from the marker line
///   - no marker line, but failures   => every test seen failed; total = failed = #blocks
///   - neither                        => total unknown
LexedReport lex_report(std::string_view output);

} // namespace junitgrader
