#include <junitgrader/common/text.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

std::string_view trim_right(std::string_view str) noexcept {
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }

    return str;
}

std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }

    return trim_right(str);
}

std::vector<std::string_view> split_lines(std::string_view str) {
    std::vector<std::string_view> lines;

    std::size_t line_start = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '\n' && str[i] != '\r') {
            continue;
        }

        lines.push_back(str.substr(line_start, i - line_start));

        // CRLF counts as a single terminator
        if (str[i] == '\r' && i + 1 < str.size() && str[i + 1] == '\n') {
            ++i;
        }

        line_start = i + 1;
    }

    if (line_start < str.size()) {
        lines.push_back(str.substr(line_start));
    }

    return lines;
}

std::string pluralize(std::string_view root, long long count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::string html_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (char chr : str) {
        switch (chr) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        default:
            result += chr;
        }
    }

    return result;
}

std::size_t display_width(std::string_view str) noexcept {
    // Continuation bytes are of the form 0b10xxxxxx
    auto is_lead_byte = [](char chr) { return (static_cast<unsigned char>(chr) & 0xC0U) != 0x80U; };

    return static_cast<std::size_t>(ranges::count_if(str, is_lead_byte));
}

} // namespace junitgrader
