#include "catch2_custom.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/report/scorer.hpp>

#include <limits>

using namespace junitgrader;

TEST_CASE("round_to_hundredths rounds halves up") {
    REQUIRE(round_to_hundredths(6.0) == 6.0);
    REQUIRE(round_to_hundredths(3.333333) == 3.33);
    REQUIRE(round_to_hundredths(6.666666) == 6.67);
    REQUIRE(round_to_hundredths(1.005) == 1.01);
    REQUIRE(round_to_hundredths(2.675) == 2.68);
    REQUIRE(round_to_hundredths(0.0) == 0.0);
}

TEST_CASE("Partial credit is proportional to the passing tests") {
    auto score = compute_score(5, 2, 10, true);

    REQUIRE(score);
    REQUIRE(score->awarded == 6.0);
    REQUIRE(score->max_score == 10.0);
    REQUIRE(score->allow_partial_credit);

    REQUIRE(compute_score(3, 1, 10, true)->awarded == 6.67);
    REQUIRE(compute_score(3, 2, 10, true)->awarded == 3.33);
    REQUIRE(compute_score(4, 4, 10, true)->awarded == 0.0);
    REQUIRE(compute_score(4, 0, 10, true)->awarded == 10.0);
}

TEST_CASE("Computed partial scores round halves up") {
    // 49 / 88 * 143 = 79.625 and 1 / 6 * 1.89 = 0.315 exactly
    REQUIRE(compute_score(88, 39, 143, true)->awarded == 79.63);
    REQUIRE(compute_score(6, 5, 1.89, true)->awarded == 0.32);
    REQUIRE(compute_score(8, 7, 0.1, true)->awarded == 0.01);   // 0.0125
    REQUIRE(compute_score(8, 5, 0.2, true)->awarded == 0.08);   // 0.075
    REQUIRE(compute_score(16, 15, 1, true)->awarded == 0.06);   // 0.0625
    REQUIRE(compute_score(40, 1, 0.1, true)->awarded == 0.1);   // 0.0975
    REQUIRE(compute_score(200, 199, 1, true)->awarded == 0.01); // 0.005
}

TEST_CASE("Without partial credit, scoring is all or nothing") {
    REQUIRE(compute_score(5, 0, 10, false)->awarded == 10.0);
    REQUIRE(compute_score(5, 1, 10, false)->awarded == 0.0);
    REQUIRE(compute_score(5, 5, 10, false)->awarded == 0.0);

    const int total = GENERATE(1, 2, 3, 7, 10, 64);
    const int failed = GENERATE_COPY(range(0, total + 1));
    const double max_score = GENERATE(0.0, 1.0, 2.5, 10.0, 143.0);

    auto score = compute_score(total, failed, max_score, false);

    REQUIRE(score);
    REQUIRE(score->awarded == (failed == 0 ? max_score : 0.0));
}

TEST_CASE("Partial credit boundaries") {
    const int total = GENERATE(1, 2, 3, 5, 7, 10, 64, 1000);
    const double max_score = GENERATE(0.0, 0.07, 1.0, 1.005, 10.0, 10.125, 143.0);

    SECTION("Every test passing awards the max score") {
        REQUIRE(compute_score(total, 0, max_score, true)->awarded == max_score);
    }

    SECTION("Every test failing awards nothing") {
        REQUIRE(compute_score(total, total, max_score, true)->awarded == 0.0);
    }
}

TEST_CASE("Scoring is a pure function") {
    const int total = GENERATE(3, 7, 88);
    const int failed = GENERATE_COPY(range(0, total + 1));

    auto first = compute_score(total, failed, 143, true);
    auto second = compute_score(total, failed, 143, true);

    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first->awarded == second->awarded);
}

TEST_CASE("A zero max score always awards zero") {
    REQUIRE(compute_score(5, 0, 0, false)->awarded == 0.0);
    REQUIRE(compute_score(5, 2, 0, true)->awarded == 0.0);
}

TEST_CASE("Awarded score never exceeds the max score") {
    for (int total = 1; total <= 7; ++total) {
        for (int failed = 0; failed <= total; ++failed) {
            auto score = compute_score(total, failed, 0.07, true);

            REQUIRE(score);
            REQUIRE(score->awarded >= 0.0);
            REQUIRE(score->awarded <= 0.07);
        }
    }
}

TEST_CASE("Zero tests have no meaningful score") {
    REQUIRE(compute_score(0, 0, 10, true) == ErrorKind::AmbiguousScore);
    REQUIRE(compute_score(0, 0, 10, false) == ErrorKind::AmbiguousScore);
}

TEST_CASE("Invalid arguments are rejected") {
    REQUIRE(compute_score(-1, 0, 10, true) == ErrorKind::BadArgument);
    REQUIRE(compute_score(3, -1, 10, true) == ErrorKind::BadArgument);
    REQUIRE(compute_score(3, 4, 10, true) == ErrorKind::BadArgument);
    REQUIRE(compute_score(3, 1, -1, true) == ErrorKind::BadArgument);
    REQUIRE(compute_score(3, 1, std::numeric_limits<double>::infinity(), true) == ErrorKind::BadArgument);
    REQUIRE(compute_score(3, 1, std::numeric_limits<double>::quiet_NaN(), true) == ErrorKind::BadArgument);
}
