#include <junitgrader/report/failure_table.hpp>

#include <junitgrader/common/text.hpp>
#include <junitgrader/report/failure_classifier.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

namespace {

constexpr std::size_t NUM_COLUMNS = FAILURE_TABLE_HEADERS.size();

// Cells are padded by one space on either side
constexpr std::size_t CELL_PADDING = 2;

namespace box {
constexpr std::string_view HORIZONTAL = "─";
constexpr std::string_view VERTICAL = "│";

constexpr std::string_view TOP_LEFT = "┌";
constexpr std::string_view TOP_RIGHT = "┐";
constexpr std::string_view BOTTOM_LEFT = "└";
constexpr std::string_view BOTTOM_RIGHT = "┘";
constexpr std::string_view LEFT_MID = "├";
constexpr std::string_view RIGHT_MID = "┤";

constexpr std::string_view CROSS = "┼";
constexpr std::string_view TEE_DOWN = "┬";
constexpr std::string_view TEE_UP = "┴";
} // namespace box

/// A table row. Either NUM_COLUMNS cells, or a single cell spanning every column.
struct Row
{
    std::vector<std::vector<std::string_view>> cells; // cell => lines

    bool is_spanning() const { return cells.size() == 1; }

    std::size_t height() const {
        return ranges::max(cells | ranges::views::transform([](const auto& lines) { return lines.size(); }));
    }
};

std::vector<std::string_view> cell_lines(std::string_view content) {
    auto lines = split_lines(content);

    if (lines.empty()) {
        lines.emplace_back();
    }

    return lines;
}

std::size_t content_width(const std::vector<std::string_view>& lines) {
    return ranges::max(lines | ranges::views::transform([](std::string_view line) { return display_width(line); }));
}

Row make_row(const FailureRecord& record) {
    if (!record.is_structured()) {
        return {.cells = {cell_lines(record.message)}};
    }

    return {.cells = {cell_lines(record.message), cell_lines(*record.expected), cell_lines(*record.actual)}};
}

/// Widths of each column, including padding but excluding borders
std::array<std::size_t, NUM_COLUMNS> compute_widths(std::span<const Row> rows) {
    std::array<std::size_t, NUM_COLUMNS> widths{};

    for (const Row& row : rows) {
        if (row.is_spanning()) {
            continue;
        }

        for (std::size_t col = 0; col < NUM_COLUMNS; ++col) {
            widths[col] = std::max(widths[col], content_width(row.cells[col]) + CELL_PADDING);
        }
    }

    // Spanning cells also cover the inner borders
    const std::size_t inner_borders = NUM_COLUMNS - 1;

    for (const Row& row : rows) {
        if (!row.is_spanning()) {
            continue;
        }

        const std::size_t needed = content_width(row.cells.front()) + CELL_PADDING;
        const std::size_t available = ranges::accumulate(widths, std::size_t{0}) + inner_borders;

        if (needed <= available) {
            continue;
        }

        // Distribute the extra space evenly, giving any remainder to the rightmost columns
        const std::size_t extra = needed - available;
        for (std::size_t col = 0; col < NUM_COLUMNS; ++col) {
            widths[col] += extra / NUM_COLUMNS + (col >= NUM_COLUMNS - extra % NUM_COLUMNS ? 1 : 0);
        }
    }

    return widths;
}

/// A horizontal border. `above` / `below` are the rows touching it (nullptr at the table edges)
std::string horizontal_rule(const std::array<std::size_t, NUM_COLUMNS>& widths, const Row* above, const Row* below) {
    std::string_view left = box::LEFT_MID;
    std::string_view right = box::RIGHT_MID;

    if (above == nullptr) {
        left = box::TOP_LEFT;
        right = box::TOP_RIGHT;
    } else if (below == nullptr) {
        left = box::BOTTOM_LEFT;
        right = box::BOTTOM_RIGHT;
    }

    const bool split_above = above != nullptr && !above->is_spanning();
    const bool split_below = below != nullptr && !below->is_spanning();

    std::string_view junction = box::HORIZONTAL;
    if (split_above && split_below) {
        junction = box::CROSS;
    } else if (split_above) {
        junction = box::TEE_UP;
    } else if (split_below) {
        junction = box::TEE_DOWN;
    }

    std::string rule{left};

    for (std::size_t col = 0; col < NUM_COLUMNS; ++col) {
        for (std::size_t i = 0; i < widths[col]; ++i) {
            rule += box::HORIZONTAL;
        }

        rule += (col + 1 < NUM_COLUMNS) ? junction : right;
    }

    rule += '\n';

    return rule;
}

std::string padded_cell(std::string_view content, std::size_t width) {
    const std::size_t inner = width - CELL_PADDING;

    return fmt::format(" {}{} ", content, std::string(inner - display_width(content), ' '));
}

std::string render_row(const std::array<std::size_t, NUM_COLUMNS>& widths, const Row& row) {
    std::string out;

    for (std::size_t line = 0; line < row.height(); ++line) {
        out += box::VERTICAL;

        if (row.is_spanning()) {
            const std::size_t width = ranges::accumulate(widths, std::size_t{0}) + (NUM_COLUMNS - 1);
            const auto& lines = row.cells.front();

            out += padded_cell(line < lines.size() ? lines[line] : std::string_view{}, width);
            out += box::VERTICAL;
        } else {
            for (std::size_t col = 0; col < NUM_COLUMNS; ++col) {
                const auto& lines = row.cells[col];

                out += padded_cell(line < lines.size() ? lines[line] : std::string_view{}, widths[col]);
                out += box::VERTICAL;
            }
        }

        out += '\n';
    }

    return out;
}

std::string html_cell(std::string_view content) {
    std::string out;

    bool first = true;
    for (std::string_view line : split_lines(content)) {
        if (!first) {
            out += "<br>";
        }
        out += html_escape(line);
        first = false;
    }

    return out;
}

} // namespace

std::string render_plain_text_table(std::span<const FailureRecord> records) {
    std::vector<Row> rows;
    rows.reserve(records.size() + 1);

    rows.push_back({.cells = {{FAILURE_TABLE_HEADERS[0]}, {FAILURE_TABLE_HEADERS[1]}, {FAILURE_TABLE_HEADERS[2]}}});

    for (const FailureRecord& record : records) {
        rows.push_back(make_row(record));
    }

    const auto widths = compute_widths(rows);

    std::string table = horizontal_rule(widths, nullptr, &rows.front());

    for (std::size_t i = 0; i < rows.size(); ++i) {
        table += render_row(widths, rows[i]);

        const Row* below = (i + 1 < rows.size()) ? &rows[i + 1] : nullptr;
        table += horizontal_rule(widths, &rows[i], below);
    }

    return table;
}

std::string render_html_table(std::span<const FailureRecord> records) {
    std::string table = "<table><thead><tr>";

    for (std::string_view header : FAILURE_TABLE_HEADERS) {
        table += fmt::format("<th>{}</th>", header);
    }

    table += "</tr></thead><tbody>";

    for (const FailureRecord& record : records) {
        if (record.is_structured()) {
            table += fmt::format("<tr><td>{}</td><td>{}</td><td>{}</td></tr>", html_cell(record.message),
                                 html_cell(*record.expected), html_cell(*record.actual));
        } else {
            table += fmt::format(R"(<tr><td colspan="{}">{}</td></tr>)", NUM_COLUMNS, html_cell(record.message));
        }
    }

    table += "</tbody></table>";

    return table;
}

} // namespace junitgrader
