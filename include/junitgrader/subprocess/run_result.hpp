#pragma once

#include <chrono>
#include <string>

namespace junitgrader {

/// The outcome of running one external command to completion (or to its timeout)
class RunResult
{
public:
    enum class Kind { Exited, Killed, TimedOut };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal);
    static RunResult make_timed_out();

    Kind get_kind() const { return kind_; }

    /// Exit code for `Exited`, signal number for `Killed`, 0 for `TimedOut`
    int get_code() const { return code_; }

    /// Exited with code 0
    bool succeeded() const { return kind_ == Kind::Exited && code_ == 0; }

    const std::string& get_stdout() const { return stdout_; }
    const std::string& get_stderr() const { return stderr_; }
    std::chrono::milliseconds get_elapsed() const { return elapsed_; }

    RunResult& with_output(std::string stdout_text, std::string stderr_text);
    RunResult& with_elapsed(std::chrono::milliseconds elapsed);

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;

    std::string stdout_;
    std::string stderr_;
    std::chrono::milliseconds elapsed_{};
};

} // namespace junitgrader
