#include "app/grader_app.hpp"
#include "user/action_inputs.hpp"
#include "user/cl_args.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/logging.hpp>

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    junitgrader::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    junitgrader::EnvLookup env = junitgrader::process_environment();
    junitgrader::GraderOptions options = junitgrader::parse_args_or_exit(args, env);

    junitgrader::GraderApp app{std::move(options), std::move(env)};

    return app.run();
}
