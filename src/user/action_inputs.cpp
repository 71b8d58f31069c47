#include "user/action_inputs.hpp"

#include "user/grader_options.hpp"

#include <junitgrader/common/expected.hpp>
#include <junitgrader/common/text.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace junitgrader {

EnvLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string{name}.c_str());

        if (value == nullptr) {
            return std::nullopt;
        }

        return std::string{value};
    };
}

std::string action_input_variable(std::string_view input_name) {
    std::string variable = "INPUT_";

    for (char chr : input_name) {
        variable += (chr == ' ') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(chr)));
    }

    return variable;
}

std::vector<std::string> split_list(std::string_view list) {
    std::vector<std::string> items;

    while (!list.empty()) {
        std::size_t comma = list.find(',');
        std::string_view item = trim(list.substr(0, comma));

        if (!item.empty()) {
            items.emplace_back(item);
        }

        if (comma == std::string_view::npos) {
            break;
        }

        list.remove_prefix(comma + 1);
    }

    return items;
}

namespace {

/// The value of an input, or `nullopt` if it is unset or blank (GitHub passes unset inputs as "")
std::optional<std::string> get_input(const EnvLookup& env, std::string_view input_name) {
    auto value = env(action_input_variable(input_name));

    if (!value || trim(*value).empty()) {
        return std::nullopt;
    }

    return std::string{trim(*value)};
}

Expected<double, std::string> parse_number(std::string_view input_name, std::string_view text) {
    double value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return fmt::format("Input {:?} must be a number (got {:?})", input_name, text);
    }

    return value;
}

} // namespace

Expected<GraderOptions, std::string> apply_action_inputs(GraderOptions opts, const EnvLookup& env) {
    if (auto test_name = get_input(env, "test-name")) {
        opts.test_name = std::move(*test_name);
    }

    if (auto test_classes = get_input(env, "test-class")) {
        opts.test_classes = split_list(*test_classes);
    }

    if (auto setup_command = get_input(env, "setup-command")) {
        opts.setup_command = std::move(*setup_command);
    }

    if (auto timeout = get_input(env, "timeout")) {
        opts.timeout_minutes = TRY(parse_number("timeout", *timeout));
    }

    if (auto max_score = get_input(env, "max-score")) {
        opts.max_score = TRY(parse_number("max-score", *max_score));
    }

    if (auto lib_path = get_input(env, "lib-path")) {
        opts.lib_path = std::move(*lib_path);
    }

    if (auto partial_credit = get_input(env, "partial-credit")) {
        opts.partial_credit = (*partial_credit == "true");
    }

    if (auto github_output = env("GITHUB_OUTPUT"); github_output && !github_output->empty()) {
        opts.output_file = *github_output;
    }

    LOG_DEBUG("Options after applying action inputs: {}", opts);

    return opts;
}

std::vector<std::string> make_child_environment(const EnvLookup& env) {
    static constexpr std::array<std::string_view, 2> INHERITED = {"PATH", "HOME"};
    static constexpr std::array<std::string_view, 3> FIXED = {"FORCE_COLOR=true", "DOTNET_CLI_HOME=/tmp",
                                                              "DOTNET_NOLOGO=true"};

    std::vector<std::string> environment;

    for (std::string_view name : INHERITED) {
        if (auto value = env(name)) {
            environment.push_back(fmt::format("{}={}", name, *value));
        } else {
            LOG_WARN("{} is not set; child processes will not inherit it", name);
        }
    }

    environment.insert(environment.end(), FIXED.begin(), FIXED.end());

    return environment;
}

} // namespace junitgrader
