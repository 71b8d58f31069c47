#pragma once

#include "output/sink.hpp"

#include <junitgrader/report/grading_report.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace junitgrader {

/// Name of the output the payload is published under
inline constexpr std::string_view RESULT_OUTPUT_NAME = "result";

void to_json(nlohmann::ordered_json& json, const TestEntry& entry);

/// The report as consumed by the autograding reporter:
///
///     {"version": 1, "status": "pass"|"error", "max_score": <num>, "markdown": <base64>,
///      "tests": [{"name", "status", "message", "test_code", "filename", "line_no",
///                 "execution_time", "score"?}]}
///
/// `score` is omitted for entries without one.
nlohmann::ordered_json report_to_json(const GradingReport& report);

/// base64 of the compact JSON form of `report`
std::string encode_report(const GradingReport& report);

/// Inverse of `encode_report`, with the markdown decoded as well.
/// `nullopt` if `payload` is not base64-encoded JSON.
std::optional<nlohmann::ordered_json> decode_payload(std::string_view payload);

/// Write "result=<payload>\n" to `sink` and flush it
void publish_report(Sink& sink, const GradingReport& report);

} // namespace junitgrader
