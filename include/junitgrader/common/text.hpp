#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Whitespace as understood by the JUnit report format: space, tab, CR, LF, VT, FF
constexpr bool is_space(char chr) noexcept {
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\v' || chr == '\f';
}

std::string_view trim(std::string_view str) noexcept;
std::string_view trim_right(std::string_view str) noexcept;

/// Split on any of "\r\n", "\r" or "\n". Terminators are not included.
/// A trailing terminator does not produce an extra empty line.
std::vector<std::string_view> split_lines(std::string_view str);

/// Conditionally make a word singular or plural based on `count`
/// Singular if and only if `count == 1`
///
/// Examples:
///  pluralize("test", 0) => "tests"
///  pluralize("test", 1) => "test"
std::string pluralize(std::string_view root, long long count, std::string_view suffix = "s");

/// Escape the characters that are significant in HTML text and attribute values
std::string html_escape(std::string_view str);

/// Number of terminal columns `str` occupies, counting each UTF-8 code point as one column
std::size_t display_width(std::string_view str) noexcept;

} // namespace junitgrader
