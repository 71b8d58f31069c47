#include <junitgrader/report/junit_grammar.hpp>

#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>

#include <range/v3/algorithm/all_of.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::grammar {

namespace {

constexpr std::size_t NPOS = std::string_view::npos;

// The runner's banner is short; anything longer is not one, and is kept away from std::regex
constexpr std::size_t MAX_VERSION_LINE_LENGTH = 256;

constexpr std::array<std::string_view, 2> COMPARISON_KINDS = {"AssertionError:", "ComparisonFailure:"};

const std::regex& version_regex() {
    static const std::regex regex{R"(version\s*\d+\.\d+(\.\d+)?)", std::regex::optimize};
    return regex;
}

constexpr bool is_digit(char chr) noexcept {
    return chr >= '0' && chr <= '9';
}

constexpr bool is_identifier_start(char chr) noexcept {
    return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || chr == '_' || chr == '$';
}

constexpr bool is_identifier_char(char chr) noexcept {
    return is_identifier_start(chr) || is_digit(chr);
}

std::size_t skip_spaces(std::string_view text, std::size_t pos) {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }

    return pos;
}

/// If `text` continues at `pos` with `\s*<token>`, the position just past `token`
std::optional<std::size_t> consume(std::string_view text, std::size_t pos, std::string_view token) {
    pos = skip_spaces(text, pos);

    if (!text.substr(pos).starts_with(token)) {
        return std::nullopt;
    }

    return pos + token.size();
}

/// Position just past the earliest comparison kind token (with its colon) at or after `pos`
std::optional<std::size_t> find_comparison_kind(std::string_view text, std::size_t pos) {
    std::optional<std::size_t> result;
    std::size_t earliest = NPOS;

    for (std::string_view kind : COMPARISON_KINDS) {
        if (std::size_t found = text.find(kind, pos); found < earliest) {
            earliest = found;
            result = found + kind.size();
        }
    }

    return result;
}

struct Span
{
    std::size_t begin; // first character of the delimiter
    std::size_t next;  // just past the delimiter
};

/// The first `expected\s*:\s*<` starting on the line that contains `pos`
std::optional<Span> find_expected_label(std::string_view text, std::size_t pos) {
    constexpr std::string_view LABEL = "expected";

    const std::string_view line = text.substr(0, text.find_first_of("\r\n", pos));

    for (std::size_t label = line.find(LABEL, pos); label != NPOS; label = line.find(LABEL, label + 1)) {
        auto colon = consume(text, label + LABEL.size(), ":");
        if (!colon) {
            continue;
        }

        if (auto open = consume(text, *colon, "<")) {
            return Span{.begin = label, .next = *open};
        }
    }

    return std::nullopt;
}

/// The first `>\s*but was\s*:\s*<` at or after `pos`
std::optional<Span> find_expected_close(std::string_view text, std::size_t pos) {
    for (std::size_t close = text.find('>', pos); close != NPOS; close = text.find('>', close + 1)) {
        auto next = consume(text, close + 1, "but was");

        if (next) {
            next = consume(text, *next, ":");
        }

        if (next) {
            next = consume(text, *next, "<");
        }

        if (next) {
            return Span{.begin = close, .next = *next};
        }
    }

    return std::nullopt;
}

/// The first '>' at or after `pos` followed only by spaces or tabs up to the end of its line
std::optional<Span> find_actual_close(std::string_view text, std::size_t pos) {
    for (std::size_t close = text.find('>', pos); close != NPOS; close = text.find('>', close + 1)) {
        const std::size_t next = text.find_first_not_of(" \t", close + 1);

        if (next == NPOS) {
            return Span{.begin = close, .next = text.size()};
        }

        if (text[next] == '\r' || text[next] == '\n') {
            return Span{.begin = close, .next = next};
        }
    }

    return std::nullopt;
}

/// Length of the leading `pkg.Class:` prefix of `line` (including the spaces after the colon), or 0
std::size_t exception_prefix_length(std::string_view line) {
    std::size_t pos = 0;
    int segments = 0;

    while (true) {
        if (pos >= line.size() || !is_identifier_start(line[pos])) {
            return 0;
        }

        while (pos < line.size() && is_identifier_char(line[pos])) {
            ++pos;
        }
        ++segments;

        if (pos < line.size() && line[pos] == '.') {
            ++pos;
            continue;
        }

        break;
    }

    if (segments < 2 || pos >= line.size() || line[pos] != ':') {
        return 0;
    }

    return skip_spaces(line, pos + 1);
}

} // namespace

bool is_version_line(std::string_view line) {
    if (line.size() > MAX_VERSION_LINE_LENGTH) {
        return false;
    }

    return std::regex_search(line.begin(), line.end(), version_regex());
}

bool is_marker_line(std::string_view line) {
    line = trim_right(line);

    return !line.empty() && ranges::all_of(line, is_marker_glyph);
}

std::optional<std::string_view> match_failure_header(std::string_view line) {
    std::size_t pos = 0;
    while (pos < line.size() && is_digit(line[pos])) {
        ++pos;
    }

    if (pos == 0 || pos >= line.size() || line[pos] != ')') {
        return std::nullopt;
    }

    return line.substr(skip_spaces(line, pos + 1));
}

std::vector<ComparisonMatch> match_comparison_failures(std::string_view block) {
    std::vector<ComparisonMatch> result;

    std::size_t pos = 0;
    while (auto message_begin = find_comparison_kind(block, pos)) {
        auto label = find_expected_label(block, *message_begin);

        if (!label) {
            pos = *message_begin;
            continue;
        }

        // Any later kind token would resume the search at or after this point, so if either value
        // is never closed, nothing further in the block can match either
        auto expected_close = find_expected_close(block, label->next);
        if (!expected_close) {
            LOG_TRACE("Comparison at offset {} has no \"but was\" clause", label->begin);
            break;
        }

        auto actual_close = find_actual_close(block, expected_close->next);
        if (!actual_close) {
            LOG_TRACE("Comparison at offset {} has an unterminated actual value", label->begin);
            break;
        }

        result.push_back({.message = std::string{block.substr(*message_begin, label->begin - *message_begin)},
                          .expected = std::string{block.substr(label->next, expected_close->begin - label->next)},
                          .actual = std::string{block.substr(expected_close->next,
                                                             actual_close->begin - expected_close->next)}});

        pos = actual_close->next;
    }

    LOG_TRACE("Found {} comparison failure(s) in block", result.size());

    return result;
}

std::string_view strip_exception_prefixes(std::string_view line) {
    while (std::size_t length = exception_prefix_length(line)) {
        line.remove_prefix(length);
    }

    return line;
}

} // namespace junitgrader::grammar
