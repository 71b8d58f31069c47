#include <junitgrader/report/grading_engine.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/failure_classifier.hpp>
#include <junitgrader/report/grading_report.hpp>
#include <junitgrader/report/report_lexer.hpp>
#include <junitgrader/report/result_assembler.hpp>
#include <junitgrader/report/run_outcome.hpp>
#include <junitgrader/report/scorer.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace junitgrader {

GradingEngine::GradingEngine(GradingContext context)
    : assembler_{std::move(context)} {}

GradingResult GradingEngine::grade(const RunnerOutput& output) const {
    const LexedReport lexed = DEBUG_TIME(lex_report(output.stdout_text));

    RunOutcome outcome = RunOutcome::derive(output, lexed);
    LOG_DEBUG("Run outcome: {}", outcome.get_kind());

    if (outcome.is_execution_error()) {
        GradingReport report = assembler_.assemble(outcome, {}, std::nullopt);
        return {.outcome = std::move(outcome), .report = std::move(report)};
    }

    std::vector<FailureRecord> records = classify_failure_blocks(lexed.failure_blocks);

    const GradingContext& context = get_context();
    auto score = compute_score(outcome.get_total_tests().value_or(0), outcome.get_failed_tests(), context.max_score,
                               context.allow_partial_credit);

    if (!score) {
        return report_execution_error(score.error(), output,
                                      fmt::format("Unable to compute a score ({})", score.error()));
    }

    GradingReport report = assembler_.assemble(outcome, std::move(records), score.value());
    return {.outcome = std::move(outcome), .report = std::move(report)};
}

GradingResult GradingEngine::report_execution_error(ErrorKind reason, const RunnerOutput& output,
                                                    std::string detail) const {
    LOG_DEBUG("Reporting execution error {} for {:?}: {}", reason, output.command, detail);

    RunOutcome outcome = RunOutcome::execution_error(reason, output.command, std::move(detail), output.stdout_text,
                                                     output.stderr_text);

    GradingReport report = assembler_.assemble(outcome, {}, std::nullopt);
    return {.outcome = std::move(outcome), .report = std::move(report)};
}

} // namespace junitgrader
