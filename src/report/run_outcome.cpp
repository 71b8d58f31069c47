#include <junitgrader/report/run_outcome.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/report_lexer.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <optional>
#include <string>
#include <utility>

namespace junitgrader {

RunOutcome::RunOutcome(Kind kind, std::string command, std::optional<int> total_tests, int failed_tests,
                       std::string stdout_text, std::string stderr_text)
    : kind_{kind}
    , command_{std::move(command)}
    , total_tests_{total_tests}
    , failed_tests_{failed_tests}
    , stdout_{std::move(stdout_text)}
    , stderr_{std::move(stderr_text)} {}

RunOutcome RunOutcome::passed(std::string command, int total_tests, std::string stdout_text,
                              std::string stderr_text) {
    ASSERT(total_tests > 0, total_tests);

    return {Kind::Passed, std::move(command), total_tests, 0, std::move(stdout_text), std::move(stderr_text)};
}

RunOutcome RunOutcome::failed(std::string command, int total_tests, int failed_tests, std::string stdout_text,
                              std::string stderr_text) {
    ASSERT(failed_tests > 0 && failed_tests <= total_tests, failed_tests, total_tests);

    Kind kind = (failed_tests == total_tests) ? Kind::AllFailed : Kind::PartiallyFailed;

    return {kind, std::move(command), total_tests, failed_tests, std::move(stdout_text), std::move(stderr_text)};
}

RunOutcome RunOutcome::execution_error(ErrorKind reason, std::string command, std::string detail,
                                       std::string stdout_text, std::string stderr_text,
                                       std::optional<int> total_tests) {
    RunOutcome outcome{Kind::ExecutionError, std::move(command), total_tests, 0, std::move(stdout_text),
                       std::move(stderr_text)};

    outcome.reason_ = reason;
    outcome.detail_ = std::move(detail);

    return outcome;
}

namespace {

std::string describe_termination(const RunnerOutput& output) {
    if (output.timed_out) {
        return "timed out";
    }

    if (!output.exit_code) {
        return "was killed by a signal";
    }

    return fmt::format("exited with code {}", *output.exit_code);
}

} // namespace

RunOutcome RunOutcome::derive(const RunnerOutput& output, const LexedReport& lexed) {
    auto error = [&output](ErrorKind reason, std::string detail, std::optional<int> total = std::nullopt) {
        LOG_WARN("Test run classified as an execution error ({}): {}", reason, detail);
        return execution_error(reason, output.command, std::move(detail), output.stdout_text, output.stderr_text,
                               total);
    };

    if (output.timed_out || !output.exit_code) {
        return error(ErrorKind::RunCrash, fmt::format("The test runner {}", describe_termination(output)),
                     lexed.total_tests);
    }

    if (!lexed.total_tests) {
        if (output.exited_cleanly()) {
            return error(ErrorKind::AmbiguousScore, "No test results were found in the runner output");
        }

        return error(ErrorKind::RunCrash,
                     fmt::format("The test runner {} without reporting any test results", describe_termination(output)));
    }

    const int total = *lexed.total_tests;
    const int failed = lexed.failed_tests;

    if (total == 0) {
        return error(ErrorKind::AmbiguousScore, "No tests were run", total);
    }

    if (failed == 0) {
        if (!output.exited_cleanly()) {
            return error(ErrorKind::RunCrash,
                         fmt::format("The test runner {} although no test failed", describe_termination(output)),
                         total);
        }

        LOG_DEBUG("All {} tests passed", total);
        return passed(output.command, total, output.stdout_text, output.stderr_text);
    }

    LOG_DEBUG("{} of {} tests failed", failed, total);
    return RunOutcome::failed(output.command, total, failed, output.stdout_text, output.stderr_text);
}

} // namespace junitgrader
