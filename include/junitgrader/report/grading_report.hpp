#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader {

enum class ReportStatus { Pass, Error };

constexpr std::string_view format_as(ReportStatus status) {
    switch (status) {
    case ReportStatus::Pass:
        return "pass";
    case ReportStatus::Error:
        return "error";
    }

    return "<unknown>";
}

/// One entry of the report's `tests` array
struct TestEntry
{
    std::string name;
    ReportStatus status;
    std::string message;

    /// The command that was run for this entry (setup, build or test command)
    std::string test_code;

    std::string filename;
    int line_no = 0;
    double execution_time = 0;

    /// Absent when no score could be determined (execution errors)
    std::optional<double> score;
};

/// The complete, final result of grading one submission. Immutable once built.
class GradingReport
{
public:
    GradingReport(ReportStatus status, double max_score, std::string markdown_body, std::string plain_text_table,
                  std::vector<TestEntry> test_entries)
        : status_{status}
        , max_score_{max_score}
        , markdown_body_{std::move(markdown_body)}
        , plain_text_table_{std::move(plain_text_table)}
        , test_entries_{std::move(test_entries)} {}

    ReportStatus get_status() const { return status_; }
    double get_max_score() const { return max_score_; }

    /// Rendered summary (headline, HTML failure table, captured output), as shown to the student
    const std::string& get_markdown_body() const { return markdown_body_; }

    /// Box-drawn failure table for console logs. Empty if there were no failure records
    const std::string& get_plain_text_table() const { return plain_text_table_; }

    const std::vector<TestEntry>& get_test_entries() const { return test_entries_; }

    /// Score of the (first) entry, if one was determined
    std::optional<double> get_score() const {
        if (test_entries_.empty()) {
            return std::nullopt;
        }
        return test_entries_.front().score;
    }

private:
    ReportStatus status_;
    double max_score_;
    std::string markdown_body_;
    std::string plain_text_table_;
    std::vector<TestEntry> test_entries_;
};

} // namespace junitgrader
