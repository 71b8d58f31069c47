#include "catch2_custom.hpp"

#include "app/grader_app.hpp"
#include "grading_pipeline.hpp"
#include "output/console_reporter.hpp"
#include "output/report_encoder.hpp"
#include "output/stream_sink.hpp"
#include "user/action_inputs.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/run_outcome.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

using namespace junitgrader;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr std::string_view PASSING_RUN = R"(printf 'JUnit version 4.13.2\n.....\nTime: 0.01\n\nOK (5 tests)\n')";

constexpr std::string_view FAILING_RUN = R"(printf 'JUnit version 4.13.2\n..E.E\n)"
                                         R"(1) testAdd(CalculatorTest)\n)"
                                         R"(org.junit.ComparisonFailure: expected:<5> but was:<6>\n)"
                                         R"(2) testSub(CalculatorTest)\n)"
                                         R"(java.lang.AssertionError: expected:<1> but was:<2>\n'; exit 1)";

GraderOptions make_options(std::string_view run_command) {
    GraderOptions opts;

    opts.test_name = "Calculator";
    opts.test_classes = {"CalculatorTest"};
    opts.max_score = 10;
    opts.partial_credit = true;
    opts.build_command_override = "true";
    opts.run_command_override = std::string{run_command};
    opts.colorize_option = GraderOptions::ColorizeOpt::Never;

    return opts;
}

struct PipelineFixture
{
    std::ostringstream console;
    StreamSink sink{console};
    std::shared_ptr<ConsoleReporter> reporter =
        std::make_shared<ConsoleReporter>(sink, GraderOptions::ColorizeOpt::Never);

    GradingResult run(const GraderOptions& opts) {
        GradingPipeline pipeline{opts, {"PATH=/usr/bin:/bin"}, reporter};
        return pipeline.run();
    }
};

} // namespace

TEST_CASE_METHOD(PipelineFixture, "All tests pass") {
    auto result = run(make_options(PASSING_RUN));

    REQUIRE(result.outcome.get_kind() == RunOutcome::Kind::Passed);
    REQUIRE(result.report.get_status() == ReportStatus::Pass);
    REQUIRE(result.report.get_score() == 10.0);

    REQUIRE_THAT(console.str(), ContainsSubstring("==> Build: true\n"));
    REQUIRE_THAT(console.str(), ContainsSubstring("==> Test: printf"));
    REQUIRE_THAT(console.str(), ContainsSubstring("✅ 5 tests passed"));
}

TEST_CASE_METHOD(PipelineFixture, "Some tests fail") {
    auto result = run(make_options(FAILING_RUN));

    REQUIRE(result.outcome.get_kind() == RunOutcome::Kind::PartiallyFailed);
    REQUIRE(result.report.get_score() == 6.0);
    REQUIRE_THAT(result.report.get_markdown_body(), StartsWith(":x: 2 of 5 tests failed (6 of 10 points)"));
}

TEST_CASE_METHOD(PipelineFixture, "Setup command") {
    SECTION("A missing setup tool stops grading") {
        auto opts = make_options(PASSING_RUN);
        opts.setup_command = "definitely-not-a-real-command-junitgrader";

        auto result = run(opts);

        REQUIRE(result.outcome.get_reason() == ErrorKind::ExternalToolUnavailable);
        REQUIRE_THAT(result.report.get_markdown_body(), StartsWith(":x: Error running setup command"));
        REQUIRE(result.report.get_test_entries().front().test_code == "definitely-not-a-real-command-junitgrader");

        // Neither the build nor the tests were run
        REQUIRE_THAT(console.str(), !ContainsSubstring("==> Build"));
    }

    SECTION("A failing setup command is only a warning") {
        auto opts = make_options(PASSING_RUN);
        opts.setup_command = "exit 2";

        auto result = run(opts);

        REQUIRE(result.outcome.get_kind() == RunOutcome::Kind::Passed);
        REQUIRE_THAT(console.str(), ContainsSubstring("Setup command exited with code 2"));
    }
}

TEST_CASE_METHOD(PipelineFixture, "Build failures stop grading") {
    auto opts = make_options(PASSING_RUN);
    opts.build_command_override = "echo 'Calculator.java:3: error: missing return statement' >&2; exit 1";

    auto result = run(opts);

    REQUIRE(result.outcome.get_reason() == ErrorKind::BuildFailure);
    REQUIRE_FALSE(result.report.get_score().has_value());
    REQUIRE(result.report.get_markdown_body() ==
            ":x: Error building Java code\n\n```\nCalculator.java:3: error: missing return statement\n```\n\n");
    REQUIRE_THAT(console.str(), !ContainsSubstring("==> Test"));
}

TEST_CASE_METHOD(PipelineFixture, "The test runner crashes") {
    auto result = run(make_options("echo 'Exception in thread \"main\" java.lang.OutOfMemoryError' >&2; exit 1"));

    REQUIRE(result.outcome.get_reason() == ErrorKind::RunCrash);
    REQUIRE_FALSE(result.report.get_score().has_value());
    REQUIRE_THAT(result.report.get_markdown_body(), ContainsSubstring("java.lang.OutOfMemoryError"));
}

TEST_CASE_METHOD(PipelineFixture, "The test runner times out") {
    auto opts = make_options("sleep 30");
    // 300ms
    opts.timeout_minutes = 0.005;

    auto result = run(opts);

    REQUIRE(result.outcome.get_reason() == ErrorKind::RunCrash);
    REQUIRE_THAT(result.report.get_markdown_body(), ContainsSubstring("timed out"));
}

TEST_CASE("The app appends the payload to the output file") {
    const std::filesystem::path output =
        std::filesystem::temp_directory_path() / fmt::format("junitgrader-app-test-{}", ::getpid());

    auto opts = make_options(PASSING_RUN);
    opts.output_file = output;

    EnvLookup env = [](std::string_view name) -> std::optional<std::string> {
        if (name == "PATH") {
            return "/usr/bin:/bin";
        }
        return std::nullopt;
    };

    GraderApp app{opts, env};
    REQUIRE(app.run() == 0);

    std::ifstream file{output};
    std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    std::error_code ec;
    std::filesystem::remove(output, ec);

    REQUIRE_THAT(contents, StartsWith("result="));
    REQUIRE(contents.back() == '\n');

    std::string_view payload{contents};
    payload.remove_prefix(std::string_view{"result="}.size());
    payload.remove_suffix(1);

    auto json = decode_payload(payload);
    REQUIRE(json.has_value());
    REQUIRE((*json)["status"] == "pass");
    REQUIRE((*json)["tests"][0]["score"] == 10.0);
}
