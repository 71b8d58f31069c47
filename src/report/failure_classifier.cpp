#include <junitgrader/report/failure_classifier.hpp>

#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/report/junit_grammar.hpp>
#include <junitgrader/report/report_lexer.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader {

FailureRecord FailureRecord::structured(std::string test_name, std::string message, std::string expected,
                                        std::string actual) {
    return {.test_name = std::move(test_name),
            .message = std::move(message),
            .expected = std::move(expected),
            .actual = std::move(actual)};
}

FailureRecord FailureRecord::unstructured(std::string test_name, std::string message) {
    return {.test_name = std::move(test_name), .message = std::move(message), .expected = {}, .actual = {}};
}

namespace {

std::string message_or_default(std::string_view message) {
    message = trim(message);

    if (message.empty()) {
        return std::string{DEFAULT_FAILURE_MESSAGE};
    }

    return std::string{message};
}

FailureRecord summarize_block(const FailureBlock& block) {
    const auto lines = split_lines(block.text);

    auto first_line = ranges::find_if(lines, [](std::string_view line) { return !trim(line).empty(); });

    if (first_line == lines.end()) {
        LOG_DEBUG("Failure block for {:?} has no text", block.test_name);
        return FailureRecord::unstructured(block.test_name, std::string{DEFAULT_FAILURE_MESSAGE});
    }

    std::string_view message = grammar::strip_exception_prefixes(trim(*first_line));

    return FailureRecord::unstructured(block.test_name, message_or_default(message));
}

} // namespace

std::vector<FailureRecord> classify_failure_block(const FailureBlock& block) {
    auto comparisons = grammar::match_comparison_failures(block.text);

    if (comparisons.empty()) {
        LOG_DEBUG("{:?}: no comparison failure found; summarizing as a generic error", block.test_name);
        return {summarize_block(block)};
    }

    std::vector<FailureRecord> records;
    records.reserve(comparisons.size());

    for (auto& comparison : comparisons) {
        records.push_back(FailureRecord::structured(block.test_name, message_or_default(comparison.message),
                                                    std::string{trim(comparison.expected)},
                                                    std::string{trim(comparison.actual)}));
    }

    return records;
}

std::vector<FailureRecord> classify_failure_blocks(std::span<const FailureBlock> blocks) {
    std::vector<FailureRecord> records;

    for (const FailureBlock& block : blocks) {
        auto block_records = classify_failure_block(block);

        records.insert(records.end(), std::make_move_iterator(block_records.begin()),
                       std::make_move_iterator(block_records.end()));
    }

    return records;
}

} // namespace junitgrader
