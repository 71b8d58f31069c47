#pragma once

#include "user/action_inputs.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    /// `env` is consulted only if `--from-env` is given
    CommandLineArgs(std::span<const char*> args, EnvLookup env);

    /// Returns:
    ///   Success - Expected<GraderOptions> with parsed and validated options
    ///   Failure - Expected<std::string> with failure message
    Expected<GraderOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of GraderOptions
    void setup_parser();

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;
    EnvLookup env_;

    GraderOptions opts_buffer_ = {};
    bool from_env_ = false;
};

GraderOptions parse_args_or_exit(std::span<const char*> args, EnvLookup env, int exit_code = 1) noexcept;

} // namespace junitgrader
