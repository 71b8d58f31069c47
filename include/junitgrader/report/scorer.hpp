#pragma once

#include <junitgrader/common/error_types.hpp>

namespace junitgrader {

struct ScoreResult
{
    double awarded;    ///< 0 <= awarded <= max_score
    double max_score;  ///< >= 0
    bool allow_partial_credit;
};

/// Round to 2 decimal places, halves rounded up
double round_to_hundredths(double value) noexcept;

/// Compute the score awarded for a run.
///
/// With partial credit, the score is proportional to the share of passing tests (rounded to
/// 2 decimal places); without it, the score is all-or-nothing.
///
/// Errors:
///   - AmbiguousScore : `total_tests == 0`; there is no meaningful score
///   - BadArgument    : negative counts, `failed_tests > total_tests`, or a negative/non-finite `max_score`
Result<ScoreResult> compute_score(int total_tests, int failed_tests, double max_score, bool allow_partial_credit);

} // namespace junitgrader
