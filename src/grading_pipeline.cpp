#include "grading_pipeline.hpp"

#include "output/console_reporter.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/run_outcome.hpp>
#include <junitgrader/subprocess/run_result.hpp>
#include <junitgrader/subprocess/subprocess.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace junitgrader {

GradingPipeline::GradingPipeline(GraderOptions opts, std::vector<std::string> child_environment,
                                 const std::shared_ptr<ConsoleReporter>& reporter)
    : opts_{std::move(opts)}
    , child_environment_{std::move(child_environment)}
    , reporter_{reporter} {}

GradingResult GradingPipeline::run() const {
    const GradingEngine engine{opts_.to_grading_context()};

    std::optional<GradingResult> result = run_setup(engine);

    if (!result) {
        result = run_build(engine);
    }

    if (!result) {
        result = run_tests(engine);
    }

    LOG_INFO("Grading finished: {} (score: {})", result->report.get_status(), result->report.get_score());

    reporter_->on_result(*result);

    return std::move(*result);
}

Result<RunResult> GradingPipeline::run_command(const std::string& command) const {
    Subprocess proc{command, child_environment_, opts_.working_dir};

    LOG_INFO("Running {:?} (timeout {})", command, opts_.get_timeout());

    auto result = proc.run(opts_.get_timeout());

    if (result) {
        LOG_INFO("{:?} finished after {}", command, result->get_elapsed());
    }

    return result;
}

RunnerOutput GradingPipeline::to_runner_output(const std::string& command, const RunResult& result) {
    std::optional<int> exit_code;

    if (result.get_kind() == RunResult::Kind::Exited) {
        exit_code = result.get_code();
    }

    return {.command = command,
            .stdout_text = result.get_stdout(),
            .stderr_text = result.get_stderr(),
            .exit_code = exit_code,
            .timed_out = result.get_kind() == RunResult::Kind::TimedOut};
}

namespace {

/// Why a command that ran did not succeed, or empty for a plain non-zero exit
std::string describe_failure(const RunResult& result, double timeout_minutes) {
    switch (result.get_kind()) {
    case RunResult::Kind::TimedOut:
        return fmt::format("Command timed out after {} minutes", timeout_minutes);
    case RunResult::Kind::Killed:
        return fmt::format("Command was killed by signal {}", result.get_code());
    case RunResult::Kind::Exited:
        break;
    }

    return "";
}

} // namespace

std::optional<GradingResult> GradingPipeline::run_setup(const GradingEngine& engine) const {
    if (!opts_.setup_command) {
        return std::nullopt;
    }

    const std::string& command = *opts_.setup_command;
    reporter_->on_step_begin("Setup", command);

    auto result = run_command(command);

    if (!result) {
        LOG_ERROR("Could not start setup command: {}", result.error());
        return engine.report_execution_error(ErrorKind::ExternalToolUnavailable,
                                             RunnerOutput{.command = command},
                                             fmt::format("Could not start {} ({})", Subprocess::SHELL_PATH,
                                                         result.error()));
    }

    RunnerOutput output = to_runner_output(command, *result);

    if (std::string failure = describe_failure(*result, opts_.timeout_minutes); !failure.empty()) {
        LOG_WARN("Setup command did not complete: {}", failure);
        return engine.report_execution_error(ErrorKind::ExternalToolUnavailable, output, std::move(failure));
    }

    const int code = result->get_code();

    if (code == Subprocess::SHELL_NOT_FOUND_CODE || code == Subprocess::SHELL_NOT_EXECUTABLE_CODE) {
        LOG_WARN("Setup command could not be executed (exit code {})", code);
        return engine.report_execution_error(
            ErrorKind::ExternalToolUnavailable, output,
            fmt::format("Command not found or not executable (exit code {})", code));
    }

    // Only a failure to run the command at all stops grading; its exit status is otherwise ignored
    if (code != 0) {
        LOG_WARN("Setup command exited with code {}; continuing", code);
        reporter_->on_warning(fmt::format("Setup command exited with code {}", code));
    }

    return std::nullopt;
}

std::optional<GradingResult> GradingPipeline::run_build(const GradingEngine& engine) const {
    const std::string command = opts_.get_build_command();
    reporter_->on_step_begin("Build", command);

    auto result = run_command(command);

    if (!result) {
        LOG_ERROR("Could not start build command: {}", result.error());
        return engine.report_execution_error(ErrorKind::BuildFailure, RunnerOutput{.command = command},
                                             fmt::format("Could not start {} ({})", Subprocess::SHELL_PATH,
                                                         result.error()));
    }

    if (result->succeeded()) {
        return std::nullopt;
    }

    LOG_WARN("Build failed: {}", result->get_kind() == RunResult::Kind::Exited
                                     ? fmt::format("exit code {}", result->get_code())
                                     : describe_failure(*result, opts_.timeout_minutes));

    return engine.report_execution_error(ErrorKind::BuildFailure, to_runner_output(command, *result),
                                         describe_failure(*result, opts_.timeout_minutes));
}

GradingResult GradingPipeline::run_tests(const GradingEngine& engine) const {
    const std::string command = opts_.get_run_command();
    reporter_->on_step_begin("Test", command);

    auto result = run_command(command);

    if (!result) {
        LOG_ERROR("Could not start test command: {}", result.error());
        return engine.report_execution_error(ErrorKind::RunCrash, RunnerOutput{.command = command},
                                             fmt::format("Could not start {} ({})", Subprocess::SHELL_PATH,
                                                         result.error()));
    }

    if (result->get_kind() == RunResult::Kind::TimedOut) {
        LOG_WARN("Test run timed out after {} minutes", opts_.timeout_minutes);
        return engine.report_execution_error(ErrorKind::RunCrash, to_runner_output(command, *result),
                                             describe_failure(*result, opts_.timeout_minutes));
    }

    return engine.grade(to_runner_output(command, *result));
}

} // namespace junitgrader
