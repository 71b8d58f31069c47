#include "app/grader_app.hpp"

#include "grading_pipeline.hpp"
#include "output/console_reporter.hpp"
#include "output/file_append_sink.hpp"
#include "output/report_encoder.hpp"
#include "output/sink.hpp"
#include "output/stream_sink.hpp"
#include "user/action_inputs.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/logging.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/grading_report.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <cstdlib>
#include <memory>
#include <utility>

namespace junitgrader {

GraderApp::GraderApp(GraderOptions opts, EnvLookup env)
    : App{std::move(opts)}
    , env_{std::move(env)} {}

std::unique_ptr<Sink> GraderApp::make_result_sink() const {
    if (OPTS.output_file) {
        LOG_DEBUG("Publishing result to {}", *OPTS.output_file);
        return std::make_unique<FileAppendSink>(*OPTS.output_file);
    }

    return std::make_unique<StreamSink>();
}

int GraderApp::run_impl() {
    StreamSink console_sink;
    auto reporter = std::make_shared<ConsoleReporter>(console_sink, OPTS.colorize_option);

    reporter->on_run_metadata(OPTS);

    GradingPipeline pipeline{OPTS, make_child_environment(env_), reporter};
    GradingResult result = pipeline.run();

    std::unique_ptr<Sink> result_sink = make_result_sink();
    publish_report(*result_sink, result.report);

    // A failing submission is a successful grading run; the verdict is carried by the report
    return EXIT_SUCCESS;
}

} // namespace junitgrader
