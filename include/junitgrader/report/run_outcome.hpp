#pragma once

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/report_lexer.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace junitgrader {

/// What a step of the pipeline left behind: the command, its captured output and how it ended.
/// Exactly one of `exit_code` / `timed_out` describes the termination; if neither is set the
/// process was killed by a signal.
struct RunnerOutput
{
    std::string command;
    std::string stdout_text;
    std::string stderr_text;

    std::optional<int> exit_code;
    bool timed_out = false;

    bool exited_cleanly() const noexcept { return exit_code == 0; }
};

/// Classification of one test run
class RunOutcome
{
public:
    enum class Kind { Passed, PartiallyFailed, AllFailed, ExecutionError };

    /// All `total_tests` (> 0) tests passed
    static RunOutcome passed(std::string command, int total_tests, std::string stdout_text, std::string stderr_text);

    /// `0 < failed_tests <= total_tests`. Yields `AllFailed` iff every test failed.
    static RunOutcome failed(std::string command, int total_tests, int failed_tests, std::string stdout_text,
                             std::string stderr_text);

    /// Something prevented a meaningful score: setup/build failure, a crashed runner, or no tests.
    /// `detail` is a short human-readable cause ("exited with code 1", ...); it may be empty.
    static RunOutcome execution_error(ErrorKind reason, std::string command, std::string detail,
                                      std::string stdout_text, std::string stderr_text,
                                      std::optional<int> total_tests = std::nullopt);

    /// Classify a test run from the runner's termination and what the lexer found in its stdout.
    ///
    /// Rules (in order):
    ///   - timed out, or killed by a signal           => ExecutionError(RunCrash)
    ///   - test count unknown                         => ExecutionError(AmbiguousScore) on a clean
    ///                                                   exit, ExecutionError(RunCrash) otherwise
    ///   - zero tests                                 => ExecutionError(AmbiguousScore)
    ///   - no failures, clean exit                    => Passed
    ///   - no failures, non-zero exit                 => ExecutionError(RunCrash)
    ///   - failures                                   => AllFailed / PartiallyFailed
    static RunOutcome derive(const RunnerOutput& output, const LexedReport& lexed);

    Kind get_kind() const { return kind_; }
    bool is_execution_error() const { return kind_ == Kind::ExecutionError; }

    std::optional<int> get_total_tests() const { return total_tests_; }
    int get_failed_tests() const { return failed_tests_; }
    int get_passed_tests() const { return total_tests_.value_or(0) - failed_tests_; }

    /// The command whose output this outcome describes
    const std::string& get_command() const { return command_; }

    /// Only meaningful for `ExecutionError`
    std::optional<ErrorKind> get_reason() const { return reason_; }
    const std::string& get_detail() const { return detail_; }

    const std::string& get_stdout() const { return stdout_; }
    const std::string& get_stderr() const { return stderr_; }

private:
    RunOutcome(Kind kind, std::string command, std::optional<int> total_tests, int failed_tests,
               std::string stdout_text, std::string stderr_text);

    Kind kind_;
    std::string command_;
    std::optional<int> total_tests_;
    int failed_tests_;

    std::optional<ErrorKind> reason_;
    std::string detail_;

    std::string stdout_;
    std::string stderr_;
};

constexpr std::string_view format_as(RunOutcome::Kind kind) {
    using enum RunOutcome::Kind;

    switch (kind) {
    case Passed:
        return "Passed";
    case PartiallyFailed:
        return "PartiallyFailed";
    case AllFailed:
        return "AllFailed";
    case ExecutionError:
        return "ExecutionError";
    }

    return "<unknown>";
}

} // namespace junitgrader
