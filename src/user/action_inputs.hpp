#pragma once

#include "user/grader_options.hpp"

#include <junitgrader/common/expected.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Looks up an environment variable by name; `nullopt` if unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Lookup backed by the environment of this process
EnvLookup process_environment();

/// Environment variable holding the value of a GitHub Actions input, e.g. "test-name" => "INPUT_TEST-NAME"
std::string action_input_variable(std::string_view input_name);

/// Split a comma separated list, trimming whitespace around each item and dropping empty items
std::vector<std::string> split_list(std::string_view list);

/// Overlay the GitHub Actions inputs found through `env` onto `opts`:
///
///   test-name, test-class, setup-command, timeout, max-score, lib-path, partial-credit
///
/// plus `GITHUB_OUTPUT` for the output file. Inputs that are unset or empty leave the corresponding
/// option untouched. Fails with a message if a numeric input does not parse.
Expected<GraderOptions, std::string> apply_action_inputs(GraderOptions opts, const EnvLookup& env);

/// Environment given to every child process: the PATH and HOME of `env`, plus fixed settings
/// that keep tool output predictable.
std::vector<std::string> make_child_environment(const EnvLookup& env);

} // namespace junitgrader
