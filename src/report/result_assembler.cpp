#include <junitgrader/report/result_assembler.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/failure_classifier.hpp>
#include <junitgrader/report/failure_table.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/run_outcome.hpp>
#include <junitgrader/report/scorer.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader {

namespace {

constexpr std::string_view UNKNOWN_COMMAND = "Unknown Command";

/// "```\n<text>```\n\n", preceded by an optional label line. `text` is kept verbatim; a line break is only
/// added when needed to put the closing fence on a line of its own.
std::string fenced_block(std::string_view text, std::string_view label = {}, std::string_view language = {}) {
    std::string out;

    if (!label.empty()) {
        out += fmt::format("{}\n\n", label);
    }

    out += fmt::format("```{}\n{}", language, text);

    if (text.empty() || text.back() != '\n') {
        out += '\n';
    }

    out += "```\n\n";

    return out;
}

std::string setup_error_markdown(const RunOutcome& outcome) {
    std::string markdown = fmt::format(":x: Error running setup command\n\n"
                                       "This is probably something that your teacher needs to fix\n\n"
                                       "```shell\n{}\n```\n\n"
                                       "Error: {}",
                                       outcome.get_command(), outcome.get_detail());

    if (!outcome.get_stdout().empty()) {
        markdown += "\n\n" + fenced_block(outcome.get_stdout(), "stdout:");
    }

    if (!outcome.get_stderr().empty()) {
        markdown += "\n\n" + fenced_block(outcome.get_stderr(), "stderr:");
    }

    return markdown;
}

std::string build_error_markdown(const RunOutcome& outcome) {
    std::string markdown = ":x: Error building Java code\n\n";

    if (!outcome.get_detail().empty()) {
        markdown += fmt::format("{}\n\n", outcome.get_detail());
    }

    if (!trim(outcome.get_stdout()).empty()) {
        markdown += fenced_block(outcome.get_stdout());
    }

    if (!trim(outcome.get_stderr()).empty()) {
        markdown += fenced_block(outcome.get_stderr());
    }

    return markdown;
}

std::string run_error_markdown(const RunOutcome& outcome) {
    std::string markdown = ":x: Error running tests\n\n";

    if (!outcome.get_detail().empty()) {
        markdown += fmt::format("{}\n\n", outcome.get_detail());
    }

    if (!outcome.get_stdout().empty()) {
        markdown += fenced_block(outcome.get_stdout(), "Standard Output:");
    }

    if (!outcome.get_stderr().empty()) {
        markdown += fenced_block(outcome.get_stderr(), "Error Output:");
    }

    return markdown;
}

} // namespace

ResultAssembler::ResultAssembler(GradingContext context)
    : context_{std::move(context)} {}

GradingReport ResultAssembler::assemble(const RunOutcome& outcome, std::vector<FailureRecord> records,
                                        std::optional<ScoreResult> score) const {
    using enum RunOutcome::Kind;

    switch (outcome.get_kind()) {
    case Passed:
        ASSERT(score.has_value(), "a passing run must be scored");
        return assemble_passed(outcome, *score);
    case PartiallyFailed:
    case AllFailed:
        ASSERT(score.has_value(), "a failing run must be scored");
        return assemble_failed(outcome, records, *score);
    case ExecutionError:
        return assemble_execution_error(outcome);
    }

    std::unreachable();
}

TestEntry ResultAssembler::make_entry(ReportStatus status, std::string message, std::string test_code,
                                      std::optional<double> score) const {
    if (test_code.empty()) {
        test_code = UNKNOWN_COMMAND;
    }

    return {.name = context_.display_name(),
            .status = status,
            .message = std::move(message),
            .test_code = std::move(test_code),
            .filename = "",
            .line_no = 0,
            .execution_time = 0,
            .score = score};
}

GradingReport ResultAssembler::assemble_passed(const RunOutcome& outcome, const ScoreResult& score) const {
    const int total = outcome.get_total_tests().value_or(0);

    std::string markdown = fmt::format("✅ {} {} passed", total, pluralize("test", total));

    TestEntry entry = make_entry(ReportStatus::Pass, "Tests passed", outcome.get_command(), score.max_score);

    return {ReportStatus::Pass, context_.max_score, std::move(markdown), /*plain_text_table=*/"", {std::move(entry)}};
}

GradingReport ResultAssembler::assemble_failed(const RunOutcome& outcome, const std::vector<FailureRecord>& records,
                                               const ScoreResult& score) const {
    const int total = outcome.get_total_tests().value_or(0);
    const int failed = outcome.get_failed_tests();

    std::string markdown;

    if (outcome.get_kind() == RunOutcome::Kind::AllFailed) {
        markdown = fmt::format(":x: All {} tests failed (0 of {} points)\n\n", total, score.max_score);
    } else {
        markdown = fmt::format(":x: {} of {} tests failed ({} of {} points)\n\n", failed, total, score.awarded,
                               score.max_score);
    }

    markdown += render_html_table(records);

    if (!trim(outcome.get_stderr()).empty()) {
        markdown += "\n\n" + fenced_block(trim(outcome.get_stderr()), "Error Output:");
    }

    std::string plain_text_table = render_plain_text_table(records);

    std::string message = fmt::format("Error running tests, see {} above for more details", context_.display_name());
    TestEntry entry = make_entry(ReportStatus::Error, std::move(message), outcome.get_command(), score.awarded);

    return {ReportStatus::Error, context_.max_score, std::move(markdown), std::move(plain_text_table),
            {std::move(entry)}};
}

GradingReport ResultAssembler::assemble_execution_error(const RunOutcome& outcome) const {
    const ErrorKind reason = outcome.get_reason().value_or(ErrorKind::RunCrash);
    const std::string name = context_.display_name();

    std::string markdown;
    std::string message;

    switch (reason) {
    case ErrorKind::ExternalToolUnavailable:
        markdown = setup_error_markdown(outcome);
        message = fmt::format("Error running setup command, see {} above for more details", name);
        break;
    case ErrorKind::BuildFailure:
        markdown = build_error_markdown(outcome);
        message = fmt::format("Error building submitted code, see {} above for more details", name);
        break;
    default:
        markdown = run_error_markdown(outcome);
        message = fmt::format("Error running tests, see {} above for more details", name);
        break;
    }

    LOG_DEBUG("Assembled execution error report ({})", reason);

    TestEntry entry = make_entry(ReportStatus::Error, std::move(message), outcome.get_command(), std::nullopt);

    return {ReportStatus::Error, context_.max_score, std::move(markdown), /*plain_text_table=*/"", {std::move(entry)}};
}

} // namespace junitgrader
