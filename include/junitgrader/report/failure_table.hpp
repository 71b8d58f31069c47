#pragma once

#include <junitgrader/report/failure_classifier.hpp>

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace junitgrader {

inline constexpr std::array<std::string_view, 3> FAILURE_TABLE_HEADERS = {"Message", "Expected", "Actual"};

/// Render failure records as a box-drawn table for terminals and logs:
///
///     ┌──────────────┬──────────┬────────┐
///     │ Message      │ Expected │ Actual │
///     ├──────────────┼──────────┼────────┤
///     │ Test failed  │ 5        │ 6      │
///     ├──────────────┴──────────┴────────┤
///     │ / by zero                        │
///     └──────────────────────────────────┘
///
/// Unstructured records occupy a single cell spanning all three columns. Multi-line values
/// are rendered as several physical lines within their cell.
std::string render_plain_text_table(std::span<const FailureRecord> records);

/// Render failure records as an HTML table (for markdown bodies). Cell text is HTML-escaped and
/// line breaks within a cell become `<br>`.
std::string render_html_table(std::span<const FailureRecord> records);

} // namespace junitgrader
