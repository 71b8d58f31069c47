#include <junitgrader/report/report_lexer.hpp>

#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/junit_grammar.hpp>

#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader {

namespace {

/// A line of `output`, along with where it (and its terminator) ends
struct LineSpan
{
    std::string_view line;
    std::size_t begin;
    std::size_t next; // index just past the terminator
};

/// Like split_lines, but retaining the positions needed to slice the original text
std::vector<LineSpan> line_spans(std::string_view output) {
    std::vector<LineSpan> spans;

    std::size_t begin = 0;
    while (begin < output.size()) {
        std::size_t end = output.find_first_of("\r\n", begin);

        if (end == std::string_view::npos) {
            spans.push_back({output.substr(begin), begin, output.size()});
            break;
        }

        std::size_t next = end + 1;
        if (output[end] == '\r' && next < output.size() && output[next] == '\n') {
            ++next;
        }

        spans.push_back({output.substr(begin, end - begin), begin, next});
        begin = next;
    }

    return spans;
}

} // namespace

std::optional<std::string> find_marker_line(std::string_view output) {
    const auto spans = line_spans(output);

    for (std::size_t i = 0; i + 1 < spans.size(); ++i) {
        if (!grammar::is_version_line(spans[i].line)) {
            continue;
        }

        std::string_view marker_line = spans[i + 1].line;

        if (!grammar::is_marker_line(marker_line)) {
            LOG_DEBUG("Found version banner {:?}, but it is followed by {:?} instead of a marker line", spans[i].line,
                      marker_line);
            return std::nullopt;
        }

        LOG_DEBUG("Found marker line {:?}", marker_line);
        return std::string{marker_line};
    }

    return std::nullopt;
}

MarkerCounts count_markers(std::string_view marker_line) {
    marker_line = trim_right(marker_line);

    return {.total = gsl::narrow_cast<int>(ranges::count_if(marker_line, grammar::is_test_glyph)),
            .failed = gsl::narrow_cast<int>(ranges::count_if(marker_line, grammar::is_failure_glyph))};
}

std::vector<FailureBlock> split_failure_blocks(std::string_view output) {
    struct Header
    {
        std::string_view description;
        std::size_t begin; // start of the header line
        std::size_t next;  // start of the block text
    };

    std::vector<Header> headers;
    for (const LineSpan& span : line_spans(output)) {
        if (auto description = grammar::match_failure_header(span.line)) {
            headers.push_back({.description = *description, .begin = span.begin, .next = span.next});
        }
    }

    std::vector<FailureBlock> blocks;
    blocks.reserve(headers.size());

    for (std::size_t i = 0; i < headers.size(); ++i) {
        const std::size_t text_end = (i + 1 < headers.size()) ? headers[i + 1].begin : output.size();
        const std::size_t text_begin = headers[i].next;

        blocks.push_back({.test_name = std::string{trim(headers[i].description)},
                          .text = std::string{output.substr(text_begin, text_end - text_begin)}});
    }

    LOG_DEBUG("Found {} failure block(s)", blocks.size());

    return blocks;
}

LexedReport lex_report(std::string_view output) {
    LexedReport report;

    report.failure_blocks = split_failure_blocks(output);

    if (auto marker_line = find_marker_line(output)) {
        auto counts = count_markers(*marker_line);

        report.marker_line = std::move(*marker_line);
        report.total_tests = counts.total;
        report.failed_tests = counts.failed;
    } else if (!report.failure_blocks.empty()) {
        LOG_DEBUG("No marker line found; deriving counts from {} failure block(s)", report.failure_blocks.size());

        report.total_tests = gsl::narrow_cast<int>(report.failure_blocks.size());
        report.failed_tests = gsl::narrow_cast<int>(report.failure_blocks.size());
    } else {
        LOG_DEBUG("Neither a marker line nor failure blocks were found");
    }

    return report;
}

} // namespace junitgrader
