#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/sink.hpp"
#include "user/action_inputs.hpp"
#include "user/grader_options.hpp"

#include <memory>

namespace junitgrader {

/// Grades one submission and publishes the encoded report.
///
/// The console report goes to stdout; the `result=<payload>` line is appended to the output file
/// if one is configured, otherwise it follows the console report on stdout.
class GraderApp final : public App
{
public:
    GraderApp(GraderOptions opts, EnvLookup env);

private:
    int run_impl() override;

    std::unique_ptr<Sink> make_result_sink() const;

    EnvLookup env_;
};

} // namespace junitgrader
