#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "user/action_inputs.hpp"
#include "user/grader_options.hpp"
#include "version.hpp"

#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace junitgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args, EnvLookup env)
    : arg_parser_{get_basename(args[0]), JUNITGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()}
    , env_{std::move(env)} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("JUnitGrader v{}\nCompiles a Java submission, runs its JUnit 4 tests "
                                            "and reports a score.",
                                            JUNITGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(JUNITGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-n", "--test-name")
        .metavar("NAME")
        .store_into(opts_buffer_.test_name)
        .help("Display name of the graded test (required)");

    arg_parser_.add_argument("-t", "--test-class")
        .metavar("CLASSES")
        .action([this] (const std::string& opt) {
                auto classes = split_list(opt);
                opts_buffer_.test_classes.insert(opts_buffer_.test_classes.end(), classes.begin(), classes.end());
            })
        .append()
        .help("Comma separated JUnit test classes to run (required). May be repeated.");

    arg_parser_.add_argument("-s", "--setup-command")
        .metavar("COMMAND")
        .action([this] (const std::string& opt) {
                opts_buffer_.setup_command = opt;
            })
        .help("Shell command to run before building, e.g. to fetch dependencies");

    arg_parser_.add_argument("--timeout")
        .metavar("MINUTES")
        .default_value(GraderOptions::DEFAULT_TIMEOUT_MINUTES)
        .store_into(opts_buffer_.timeout_minutes)
        .help("Timeout for each command, in minutes");

    arg_parser_.add_argument("--max-score")
        .metavar("POINTS")
        .default_value(GraderOptions::DEFAULT_MAX_SCORE)
        .store_into(opts_buffer_.max_score)
        .help("Points awarded when every test passes");

    arg_parser_.add_argument("--lib-path")
        .metavar("PATH")
        .default_value(std::string{GraderOptions::DEFAULT_LIB_PATH})
        .store_into(opts_buffer_.lib_path)
        .help("Directory of jars to put on the classpath (JUnit, Hamcrest, ...)");

    arg_parser_.add_argument("--partial-credit")
        .flag()
        .store_into(opts_buffer_.partial_credit)
        .help("Award points in proportion to the passing tests");

    arg_parser_.add_argument("-C", "--working-dir")
        .metavar("DIR")
        .default_value(std::string{GraderOptions::DEFAULT_WORKING_DIR})
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.working_dir = opt;
            })
        .help("Directory containing the submitted sources");

    arg_parser_.add_argument("-o", "--output")
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.output_file = opt;
            })
        .help("Append \"result=<payload>\" to FILE instead of printing it");

    arg_parser_.add_argument("--build-command")
        .metavar("COMMAND")
        .action([this] (const std::string& opt) {
                opts_buffer_.build_command_override = opt;
            })
        .help("Override the javac command line");

    arg_parser_.add_argument("--run-command")
        .metavar("COMMAND")
        .action([this] (const std::string& opt) {
                opts_buffer_.run_command_override = opt;
            })
        .help("Override the JUnitCore command line");

    arg_parser_.add_argument("--from-env")
        .flag()
        .store_into(from_env_)
        .help("Read GitHub Actions inputs (INPUT_TEST-NAME, INPUT_TEST-CLASS, ...) and GITHUB_OUTPUT from the "
              "environment. These take precedence over the options above.");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum GraderOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<GraderOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    GraderOptions opts = opts_buffer_;

    if (from_env_) {
        opts = TRY(apply_action_inputs(std::move(opts), env_));
    }

    TRY(opts.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts);

    return opts;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

GraderOptions parse_args_or_exit(std::span<const char*> args, EnvLookup env, int exit_code) noexcept {
    CommandLineArgs cl_args{args, std::move(env)};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace junitgrader
