#include <junitgrader/subprocess/run_result.hpp>

#include <chrono>
#include <string>
#include <utility>

namespace junitgrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal) {
    return {Kind::Killed, signal};
}

RunResult RunResult::make_timed_out() {
    return {Kind::TimedOut, 0};
}

RunResult& RunResult::with_output(std::string stdout_text, std::string stderr_text) {
    stdout_ = std::move(stdout_text);
    stderr_ = std::move(stderr_text);

    return *this;
}

RunResult& RunResult::with_elapsed(std::chrono::milliseconds elapsed) {
    elapsed_ = elapsed;

    return *this;
}

} // namespace junitgrader
