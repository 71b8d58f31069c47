#pragma once

#include <junitgrader/report/report_lexer.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// One parsed failure: either a value comparison (with expected/actual) or a generic error
struct FailureRecord
{
    /// Name of the failing test, as given by the block header
    std::string test_name;

    /// Human-readable cause
    std::string message;

    /// Both present or both absent
    std::optional<std::string> expected;
    std::optional<std::string> actual;

    bool is_structured() const noexcept { return expected.has_value() && actual.has_value(); }

    static FailureRecord structured(std::string test_name, std::string message, std::string expected,
                                    std::string actual);
    static FailureRecord unstructured(std::string test_name, std::string message);
};

/// Message used when a failure carries no usable description
inline constexpr std::string_view DEFAULT_FAILURE_MESSAGE = "Test failed";

/// Classify one failure block. Always returns at least one record:
///   - one structured record per "expected:<..> but was:<..>" comparison in the block, or
///   - a single unstructured record summarizing the block's first non-blank line.
/// Malformed or unexpected text is not an error; it falls through to the unstructured form.
std::vector<FailureRecord> classify_failure_block(const FailureBlock& block);

/// Classify every block, preserving textual order
std::vector<FailureRecord> classify_failure_blocks(std::span<const FailureBlock> blocks);

} // namespace junitgrader
