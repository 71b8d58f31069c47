#pragma once

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/result_assembler.hpp>
#include <junitgrader/report/run_outcome.hpp>

#include <string>

namespace junitgrader {

struct GradingResult
{
    RunOutcome outcome;
    GradingReport report;
};

/// Turns the output of a JUnitCore run into a GradingReport.
///
/// Pure and synchronous: no I/O, no environment access. Every input, however malformed,
/// yields exactly one report.
class GradingEngine
{
public:
    explicit GradingEngine(GradingContext context);

    /// Lex -> classify -> score -> assemble
    GradingResult grade(const RunnerOutput& output) const;

    /// Report a step that failed before (or instead of) producing test results
    GradingResult report_execution_error(ErrorKind reason, const RunnerOutput& output, std::string detail) const;

    const GradingContext& get_context() const { return assembler_.get_context(); }

private:
    ResultAssembler assembler_;
};

} // namespace junitgrader
