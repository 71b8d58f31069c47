#include "output/console_reporter.hpp"

#include "common/terminal_checks.hpp"
#include "output/sink.hpp"
#include "user/grader_options.hpp"
#include "version.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/run_outcome.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace junitgrader {

using namespace std::string_view_literals;

ConsoleReporter::ConsoleReporter(Sink& sink, GraderOptions::ColorizeOpt colorize_option)
    : sink_{sink}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void ConsoleReporter::on_run_metadata(const GraderOptions& opts) {
    std::string out = fmt::format("{}\n", std::string(terminal_width_, '='));

    out += fmt::format("JUnitGrader v{}\n", VERSION);
    out += fmt::format("Test:    {}\n", style(opts.to_grading_context().display_name(), VALUE_STYLE));
    out += fmt::format("Classes: {}\n", style(fmt::format("{}", fmt::join(opts.test_classes, ", ")), VALUE_STYLE));
    out += fmt::format("Scoring: {} points{}\n", opts.max_score, opts.partial_credit ? ", partial credit" : "");

    out += fmt::format("{}\n", std::string(terminal_width_, '='));

    sink_.write(out);
}

void ConsoleReporter::on_step_begin(std::string_view step_name, std::string_view command) {
    sink_.write(fmt::format("{} {}\n", style(fmt::format("==> {}:", step_name), HEADER_STYLE),
                            style(command, VALUE_STYLE)));
}

void ConsoleReporter::on_result(const GradingResult& result) {
    sink_.write("\n");

    switch (result.outcome.get_kind()) {
    case RunOutcome::Kind::Passed:
        output_passed(result);
        break;
    case RunOutcome::Kind::PartiallyFailed:
    case RunOutcome::Kind::AllFailed:
        output_failed(result);
        break;
    case RunOutcome::Kind::ExecutionError:
        output_execution_error(result.outcome);
        break;
    }

    output_score(result.report);
    sink_.flush();
}

void ConsoleReporter::on_warning(std::string_view what) {
    sink_.write(fmt::format("{}\n", style(what, WARNING_STYLE)));
}

void ConsoleReporter::on_error(std::string_view what) {
    sink_.write(fmt::format("{}\n", style(what, ERROR_STYLE)));
}

void ConsoleReporter::output_passed(const GradingResult& result) {
    const int total = result.outcome.get_total_tests().value_or(0);

    std::string headline = fmt::format("✅ {} {} passed", total, pluralize("test", total));
    sink_.write(fmt::format("{}\n", style(headline, SUCCESS_STYLE)));
}

void ConsoleReporter::output_failed(const GradingResult& result) {
    const RunOutcome& outcome = result.outcome;
    const int total = outcome.get_total_tests().value_or(0);
    const double max_score = result.report.get_max_score();

    std::string headline;
    if (outcome.get_kind() == RunOutcome::Kind::AllFailed) {
        headline = fmt::format("❌ All {} tests failed (0 of {} points)", total, max_score);
    } else {
        headline = fmt::format("❌ {} of {} tests failed ({} of {} points)", outcome.get_failed_tests(), total,
                               result.report.get_score().value_or(0), max_score);
    }

    sink_.write(fmt::format("{}\n", style(headline, ERROR_STYLE)));
    sink_.write(result.report.get_plain_text_table());

    output_captured("Error Output:", outcome.get_stderr());
}

void ConsoleReporter::output_execution_error(const RunOutcome& outcome) {
    const ErrorKind reason = outcome.get_reason().value_or(ErrorKind::RunCrash);

    switch (reason) {
    case ErrorKind::ExternalToolUnavailable:
        sink_.write(fmt::format("{}\n", style("❌ Error running setup command"sv, ERROR_STYLE)));
        sink_.write("This is probably something your teacher needs to fix\n\n");
        sink_.write(fmt::format("Command: {}\n", style(outcome.get_command(), VALUE_STYLE)));
        sink_.write(fmt::format("Error: {}\n", outcome.get_detail()));
        output_captured("stdout:", outcome.get_stdout());
        output_captured("stderr:", outcome.get_stderr());
        return;
    case ErrorKind::BuildFailure:
        sink_.write(fmt::format("{}\n", style("❌ Error building Java code"sv, ERROR_STYLE)));
        break;
    default:
        sink_.write(fmt::format("{}\n", style("❌ Error running tests"sv, ERROR_STYLE)));
        break;
    }

    if (!outcome.get_detail().empty()) {
        sink_.write(fmt::format("{}\n", outcome.get_detail()));
    }

    output_captured("Standard Output:", outcome.get_stdout());
    output_captured("Error Output:", outcome.get_stderr());
}

void ConsoleReporter::output_score(const GradingReport& report) {
    std::string score_text = "none";

    if (auto score = report.get_score()) {
        score_text = fmt::format("{} / {}", *score, report.get_max_score());
    }

    sink_.write(fmt::format("\nScore: {}\n", style(score_text, VALUE_STYLE)));
}

void ConsoleReporter::output_captured(std::string_view label, std::string_view text) {
    text = trim(text);

    if (text.empty()) {
        return;
    }

    sink_.write(fmt::format("\n{}\n{}\n", label, text));
}

bool ConsoleReporter::process_colorize_opt(GraderOptions::ColorizeOpt colorize_option) {
    using enum GraderOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    if (color_forced()) {
        LOG_DEBUG("Colors forced by FORCE_COLOR");
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t ConsoleReporter::get_terminal_width() {
    auto size = terminal_size(stdout);

    if (!size) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", size.error().message(),
                  DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return size->ws_col == 0 ? DEFAULT_WIDTH : size->ws_col;
}

} // namespace junitgrader
