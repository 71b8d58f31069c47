#include "output/report_encoder.hpp"

#include "output/sink.hpp"
#include "version.hpp"

#include <junitgrader/common/base64.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/grading_report.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace junitgrader {

void to_json(nlohmann::ordered_json& json, const TestEntry& entry) {
    json = {
        {"name", entry.name},
        {"status", format_as(entry.status)},
        {"message", entry.message},
        {"test_code", entry.test_code},
        {"filename", entry.filename},
        {"line_no", entry.line_no},
        {"execution_time", entry.execution_time},
    };

    if (entry.score) {
        json["score"] = *entry.score;
    }
}

nlohmann::ordered_json report_to_json(const GradingReport& report) {
    return {
        {"version", REPORT_FORMAT_VERSION},
        {"status", format_as(report.get_status())},
        {"max_score", report.get_max_score()},
        {"markdown", base64_encode(report.get_markdown_body())},
        {"tests", report.get_test_entries()},
    };
}

std::string encode_report(const GradingReport& report) {
    return base64_encode(report_to_json(report).dump());
}

std::optional<nlohmann::ordered_json> decode_payload(std::string_view payload) {
    auto json_text = base64_decode(payload);

    if (!json_text) {
        LOG_DEBUG("Payload is not valid base64");
        return std::nullopt;
    }

    auto json = nlohmann::ordered_json::parse(json_text.value(), /*cb=*/nullptr, /*allow_exceptions=*/false);

    if (json.is_discarded() || !json.is_object()) {
        LOG_DEBUG("Payload is not a JSON object");
        return std::nullopt;
    }

    if (auto markdown = json.find("markdown"); markdown != json.end() && markdown->is_string()) {
        auto markdown_text = base64_decode(markdown->get<std::string>());

        if (!markdown_text) {
            LOG_DEBUG("Payload markdown is not valid base64");
            return std::nullopt;
        }

        *markdown = markdown_text.value();
    }

    return json;
}

void publish_report(Sink& sink, const GradingReport& report) {
    std::string payload = encode_report(report);

    LOG_DEBUG("Publishing {} byte payload", payload.size());

    sink.write(fmt::format("{}={}\n", RESULT_OUTPUT_NAME, payload));
    sink.flush();
}

} // namespace junitgrader
