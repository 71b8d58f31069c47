#pragma once

#include <junitgrader/report/failure_classifier.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/run_outcome.hpp>
#include <junitgrader/report/scorer.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// The parts of the grader's configuration that end up in every report
struct GradingContext
{
    /// Display name of the graded test; `DEFAULT_TEST_NAME` is used if empty
    std::string test_name;
    double max_score = 0;
    bool allow_partial_credit = false;

    static constexpr std::string_view DEFAULT_TEST_NAME = "Unknown Test";

    std::string display_name() const { return test_name.empty() ? std::string{DEFAULT_TEST_NAME} : test_name; }
};

class ResultAssembler
{
public:
    explicit ResultAssembler(GradingContext context);

    /// Build the final report.
    ///
    /// `score` must be present unless `outcome` is an execution error, in which case it is ignored
    /// and the report carries no score. `records` are rendered in the given order.
    GradingReport assemble(const RunOutcome& outcome, std::vector<FailureRecord> records,
                           std::optional<ScoreResult> score) const;

    const GradingContext& get_context() const { return context_; }

private:
    GradingReport assemble_passed(const RunOutcome& outcome, const ScoreResult& score) const;
    GradingReport assemble_failed(const RunOutcome& outcome, const std::vector<FailureRecord>& records,
                                  const ScoreResult& score) const;
    GradingReport assemble_execution_error(const RunOutcome& outcome) const;

    TestEntry make_entry(ReportStatus status, std::string message, std::string test_code,
                         std::optional<double> score) const;

    GradingContext context_;
};

} // namespace junitgrader
