#pragma once

#include "output/sink.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/report/grading_engine.hpp>
#include <junitgrader/report/run_outcome.hpp>

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace junitgrader {

/// Human-readable progress and results for the job log. The machine-readable payload
/// goes elsewhere (see report_encoder.hpp).
class ConsoleReporter : NonCopyable
{
public:
    ConsoleReporter(Sink& sink, GraderOptions::ColorizeOpt colorize_option);

    void on_run_metadata(const GraderOptions& opts);
    void on_step_begin(std::string_view step_name, std::string_view command);
    void on_result(const GradingResult& result);

    void on_warning(std::string_view what);
    void on_error(std::string_view what);

private:
    void output_passed(const GradingResult& result);
    void output_failed(const GradingResult& result);
    void output_execution_error(const RunOutcome& outcome);
    void output_score(const GradingReport& report);

    /// Labeled, trimmed copy of captured output. Nothing if `text` is blank
    void output_captured(std::string_view label, std::string_view text);

    static bool process_colorize_opt(GraderOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    template <fmt::formattable T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    // Basic styles for different kinds of output:
    //   error    - failure headlines, fatal errors, etc.
    //   success  - passing headlines
    //   header   - step headers (like "==> Building")
    //   value    - commands, scores and other literal values
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto HEADER_STYLE = fmt::emphasis::bold;
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    Sink& sink_;
    bool do_colorize_;
    std::size_t terminal_width_;
};

template <fmt::formattable T>
auto ConsoleReporter::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

} // namespace junitgrader
