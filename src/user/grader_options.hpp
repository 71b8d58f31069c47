#pragma once

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/expected.hpp>
#include <junitgrader/report/result_assembler.hpp>

#include <fmt/base.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

struct GraderOptions
{

    // ###### Argument fields

    /// Display name of the test, used in the report's entries
    std::string test_name;

    /// Fully-qualified JUnit test classes to run, in order
    std::vector<std::string> test_classes;

    /// Shell command run once before building (e.g., to fetch dependencies). Its output is ignored
    std::optional<std::string> setup_command;

    /// Timeout for each external command, in minutes
    double timeout_minutes = DEFAULT_TIMEOUT_MINUTES;

    double max_score = DEFAULT_MAX_SCORE;

    /// Directory with the jars put on the classpath, relative to `working_dir`
    std::string lib_path = std::string{DEFAULT_LIB_PATH};

    /// Award a proportional score when some tests fail; otherwise any failure scores 0
    bool partial_credit = false;

    /// Directory containing the submitted sources. All commands run here
    std::filesystem::path working_dir = DEFAULT_WORKING_DIR;

    /// File to append `result=<payload>` to (GitHub Actions' `$GITHUB_OUTPUT`).
    /// If unset, the line is written to stdout.
    std::optional<std::filesystem::path> output_file;

    /// Replace the derived javac / JUnitCore command lines
    std::optional<std::string> build_command_override;
    std::optional<std::string> run_command_override;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr double DEFAULT_TIMEOUT_MINUTES = 5;
    static constexpr double DEFAULT_MAX_SCORE = 0;
    static constexpr std::string_view DEFAULT_LIB_PATH = "lib";
    static constexpr std::string_view DEFAULT_WORKING_DIR = ".";

    static constexpr std::string_view JUNIT_RUNNER_CLASS = "org.junit.runner.JUnitCore";

    /// `javac -cp "<lib>/*" -d . *.java`, unless overridden
    std::string get_build_command() const {
        if (build_command_override) {
            return *build_command_override;
        }

        return fmt::format(R"(javac -cp "{}/*" -d . *.java)", lib_path);
    }

    /// `java -cp "<lib>/*:." org.junit.runner.JUnitCore <classes...>`, unless overridden
    std::string get_run_command() const {
        if (run_command_override) {
            return *run_command_override;
        }

        return fmt::format(R"(java -cp "{}/*:." {} {})", lib_path, JUNIT_RUNNER_CLASS, fmt::join(test_classes, " "));
    }

    std::chrono::milliseconds get_timeout() const {
        using MinutesD = std::chrono::duration<double, std::chrono::minutes::period>;

        return std::chrono::duration_cast<std::chrono::milliseconds>(MinutesD{timeout_minutes});
    }

    GradingContext to_grading_context() const {
        return {.test_name = test_name, .max_score = max_score, .allow_partial_credit = partial_credit};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (test_name.empty()) {
            return std::string{"A test name is required"};
        }

        if (test_classes.empty()) {
            return std::string{"At least one test class is required"};
        }

        if (!std::isfinite(timeout_minutes) || timeout_minutes <= 0) {
            return fmt::format("Timeout must be a positive number of minutes (got {})", timeout_minutes);
        }

        if (!std::isfinite(max_score) || max_score < 0) {
            return fmt::format("Max score must be a non-negative number (got {})", max_score);
        }

        TRY(ensure_is_directory(working_dir, "Working directory {:?}"));

        return {};
    }
};

} // namespace junitgrader

template <>
struct fmt::formatter<::junitgrader::GraderOptions::ColorizeOpt> : formatter<std::string_view>
{
    auto format(::junitgrader::GraderOptions::ColorizeOpt opt, format_context& ctx) const {
        using enum ::junitgrader::GraderOptions::ColorizeOpt;

        std::string_view name = "<unknown>";
        switch (opt) {
        case Auto:
            name = "auto";
            break;
        case Always:
            name = "always";
            break;
        case Never:
            name = "never";
            break;
        }

        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<::junitgrader::GraderOptions> : formatter<std::string>
{
    auto format(const ::junitgrader::GraderOptions& opts, format_context& ctx) const {
        return formatter<std::string>::format(
            fmt::format("GraderOptions{{test_name={:?}, test_classes={}, setup_command={}, timeout_minutes={}, "
                        "max_score={}, lib_path={:?}, partial_credit={}, working_dir={}, output_file={}, "
                        "build_command={:?}, run_command={:?}, colorize_option={}}}",
                        opts.test_name, opts.test_classes, opts.setup_command, opts.timeout_minutes, opts.max_score,
                        opts.lib_path, opts.partial_credit, opts.working_dir, opts.output_file,
                        opts.get_build_command(), opts.get_run_command(), opts.colorize_option),
            ctx);
    }
};
