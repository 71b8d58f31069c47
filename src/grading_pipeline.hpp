#pragma once

#include "output/console_reporter.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/run_outcome.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace junitgrader {

/// Runs the setup, build and test commands of one submission and grades the result.
///
/// Stops at the first step that fails; whichever step ends the run determines the report,
/// so exactly one report is produced per run.
class GradingPipeline
{
public:
    /// `child_environment` entries are "KEY=VALUE"; see make_child_environment
    GradingPipeline(GraderOptions opts, std::vector<std::string> child_environment,
                    const std::shared_ptr<ConsoleReporter>& reporter);

    /// Never throws for failures of the graded code or the external tools
    GradingResult run() const;

    const GraderOptions& get_opts() const { return opts_; }

private:
    /// A report if the setup command prevents grading, otherwise nullopt
    std::optional<GradingResult> run_setup(const GradingEngine& engine) const;
    std::optional<GradingResult> run_build(const GradingEngine& engine) const;
    GradingResult run_tests(const GradingEngine& engine) const;

    Result<RunResult> run_command(const std::string& command) const;

    static RunnerOutput to_runner_output(const std::string& command, const RunResult& result);

    GraderOptions opts_;
    std::vector<std::string> child_environment_;
    std::shared_ptr<ConsoleReporter> reporter_;
};

} // namespace junitgrader
