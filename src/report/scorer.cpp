#include <junitgrader/report/scorer.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/logging.hpp>

#include <algorithm>
#include <cmath>

namespace junitgrader {

namespace {

constexpr double HUNDREDTHS = 100.0;

/// Round a value already scaled to hundredths to the nearest integer, halves up.
///
/// The tolerance is relative so that it still covers the error of the divide and multiply that
/// produced `scaled` (e.g., 49 * 143 * 100 / 88 = 7962.5 must not become 7962.4999...).
double round_half_up(double scaled) noexcept {
    constexpr double RELATIVE_TOLERANCE = 1e-9;

    return std::floor(scaled + 0.5 + (RELATIVE_TOLERANCE * std::max(1.0, std::fabs(scaled))));
}

} // namespace

double round_to_hundredths(double value) noexcept {
    return round_half_up(value * HUNDREDTHS) / HUNDREDTHS;
}

Result<ScoreResult> compute_score(int total_tests, int failed_tests, double max_score, bool allow_partial_credit) {
    if (total_tests < 0 || failed_tests < 0 || failed_tests > total_tests) {
        LOG_WARN("Invalid test counts for scoring: {} failed of {}", failed_tests, total_tests);
        return ErrorKind::BadArgument;
    }

    if (!std::isfinite(max_score) || max_score < 0) {
        LOG_WARN("Invalid max score: {}", max_score);
        return ErrorKind::BadArgument;
    }

    if (total_tests == 0) {
        LOG_DEBUG("No tests were detected; refusing to compute a score");
        return ErrorKind::AmbiguousScore;
    }

    double awarded = 0.0;

    if (failed_tests == 0) {
        awarded = max_score;
    } else if (allow_partial_credit) {
        // Scale before dividing, so the only inexact step is the final division
        const double scaled = (static_cast<double>(total_tests - failed_tests) * max_score * HUNDREDTHS) / total_tests;
        awarded = round_half_up(scaled) / HUNDREDTHS;
    }

    // Rounding can push the result just outside of the valid range
    awarded = std::clamp(awarded, 0.0, max_score);

    LOG_DEBUG("Score: {} of {} ({} of {} tests failed, partial credit: {})", awarded, max_score, failed_tests,
              total_tests, allow_partial_credit);

    return ScoreResult{.awarded = awarded, .max_score = max_score, .allow_partial_credit = allow_partial_credit};
}

} // namespace junitgrader
