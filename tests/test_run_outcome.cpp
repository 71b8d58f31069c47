#include "catch2_custom.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/report_lexer.hpp>
#include <junitgrader/report/run_outcome.hpp>

#include <optional>
#include <string>

using namespace junitgrader;

namespace {

RunnerOutput exited(int code, std::string stdout_text = "", std::string stderr_text = "") {
    return {.command = "java -cp \"lib/*:.\" org.junit.runner.JUnitCore FooTest",
            .stdout_text = std::move(stdout_text),
            .stderr_text = std::move(stderr_text),
            .exit_code = code,
            .timed_out = false};
}

LexedReport counted(int total, int failed) {
    return {.marker_line = "", .total_tests = total, .failed_tests = failed, .failure_blocks = {}};
}

LexedReport nothing_found() {
    return {.marker_line = "", .total_tests = std::nullopt, .failed_tests = 0, .failure_blocks = {}};
}

} // namespace

TEST_CASE("Factories") {
    auto passed = RunOutcome::passed("cmd", 3, "out", "err");
    REQUIRE(passed.get_kind() == RunOutcome::Kind::Passed);
    REQUIRE(passed.get_total_tests() == 3);
    REQUIRE(passed.get_failed_tests() == 0);
    REQUIRE(passed.get_passed_tests() == 3);
    REQUIRE(passed.get_stdout() == "out");
    REQUIRE(passed.get_stderr() == "err");
    REQUIRE_FALSE(passed.get_reason().has_value());

    REQUIRE(RunOutcome::failed("cmd", 5, 2, "", "").get_kind() == RunOutcome::Kind::PartiallyFailed);
    REQUIRE(RunOutcome::failed("cmd", 5, 5, "", "").get_kind() == RunOutcome::Kind::AllFailed);
    REQUIRE(RunOutcome::failed("cmd", 5, 2, "", "").get_passed_tests() == 3);

    auto error = RunOutcome::execution_error(ErrorKind::BuildFailure, "javac", "detail", "o", "e");
    REQUIRE(error.is_execution_error());
    REQUIRE(error.get_reason() == ErrorKind::BuildFailure);
    REQUIRE(error.get_detail() == "detail");
    REQUIRE(error.get_command() == "javac");
    REQUIRE_FALSE(error.get_total_tests().has_value());
}

TEST_CASE("Factory preconditions are asserted") {
    REQUIRE_THROWS(RunOutcome::passed("cmd", 0, "", ""));
    REQUIRE_THROWS(RunOutcome::failed("cmd", 3, 0, "", ""));
    REQUIRE_THROWS(RunOutcome::failed("cmd", 3, 4, "", ""));
}

TEST_CASE("Deriving outcomes from counts") {
    REQUIRE(RunOutcome::derive(exited(0), counted(5, 0)).get_kind() == RunOutcome::Kind::Passed);
    REQUIRE(RunOutcome::derive(exited(1), counted(5, 2)).get_kind() == RunOutcome::Kind::PartiallyFailed);
    REQUIRE(RunOutcome::derive(exited(1), counted(5, 5)).get_kind() == RunOutcome::Kind::AllFailed);

    // The exit code does not override the report when failures were found
    REQUIRE(RunOutcome::derive(exited(0), counted(4, 1)).get_kind() == RunOutcome::Kind::PartiallyFailed);
}

TEST_CASE("Deriving execution errors") {
    SECTION("Nothing found, non-zero exit") {
        auto outcome = RunOutcome::derive(exited(1, "", "Error: Could not find or load main class"), nothing_found());

        REQUIRE(outcome.get_kind() == RunOutcome::Kind::ExecutionError);
        REQUIRE(outcome.get_reason() == ErrorKind::RunCrash);
        REQUIRE_FALSE(outcome.get_total_tests().has_value());
        REQUIRE(outcome.get_stderr() == "Error: Could not find or load main class");
    }

    SECTION("Nothing found, clean exit") {
        auto outcome = RunOutcome::derive(exited(0, "hello"), nothing_found());

        REQUIRE(outcome.get_reason() == ErrorKind::AmbiguousScore);
    }

    SECTION("Zero tests") {
        auto outcome = RunOutcome::derive(exited(0), counted(0, 0));

        REQUIRE(outcome.get_reason() == ErrorKind::AmbiguousScore);
        REQUIRE(outcome.get_total_tests() == 0);
    }

    SECTION("Everything passed, yet the runner failed") {
        auto outcome = RunOutcome::derive(exited(3), counted(5, 0));

        REQUIRE(outcome.get_reason() == ErrorKind::RunCrash);
        REQUIRE(outcome.get_detail() == "The test runner exited with code 3 although no test failed");
    }

    SECTION("Timed out") {
        RunnerOutput output = exited(0);
        output.exit_code.reset();
        output.timed_out = true;

        auto outcome = RunOutcome::derive(output, counted(5, 0));

        REQUIRE(outcome.get_reason() == ErrorKind::RunCrash);
        REQUIRE(outcome.get_detail() == "The test runner timed out");
    }

    SECTION("Killed by a signal") {
        RunnerOutput output = exited(0);
        output.exit_code.reset();

        auto outcome = RunOutcome::derive(output, counted(5, 1));

        REQUIRE(outcome.get_reason() == ErrorKind::RunCrash);
        REQUIRE(outcome.get_detail() == "The test runner was killed by a signal");
    }
}
