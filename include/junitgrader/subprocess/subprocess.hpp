#pragma once

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/linux.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace junitgrader {

/// Runs a shell command line (`/bin/sh -c <command>`) to completion, capturing
/// its stdout and stderr separately.
///
/// The child is placed in its own process group so that everything it spawns
/// (e.g., a JVM started by the shell) is killed together when the timeout expires.
class Subprocess : NonCopyable
{
public:
    /// Path of the shell used to interpret commands
    static constexpr const char* SHELL_PATH = "/bin/sh";

    /// Exit code a POSIX shell uses when a command could not be found
    static constexpr int SHELL_NOT_FOUND_CODE = 127;
    /// Exit code a POSIX shell uses when a command was found but is not executable
    static constexpr int SHELL_NOT_EXECUTABLE_CODE = 126;

    /// `environment` entries are of the form "KEY=VALUE" and fully replace the
    /// environment of the child. `working_dir` may be empty to inherit ours.
    Subprocess(std::string command, std::vector<std::string> environment, std::filesystem::path working_dir = {});

    ~Subprocess();

    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    /// Start the command and block until it exits or `timeout` elapses.
    /// On timeout the whole process group is killed and a `TimedOut` result
    /// (with whatever output was captured so far) is returned.
    ///
    /// Fails with SyscallFailure only if the process could not be created or observed.
    Result<RunResult> run(std::chrono::milliseconds timeout);

    const std::string& get_command() const { return command_; }

private:
    /// Arguments for the forked child, prepared in advance
    struct ExecArgs
    {
        const char* working_dir; ///< nullptr to inherit ours
        std::vector<char*> argv;
        std::vector<char*> envp;
    };

    Result<void> create();
    [[noreturn]] void exec_child(const ExecArgs& exec_args, int dev_null) const noexcept;

    /// Read from both pipes until they are closed (returns true) or `deadline` passes (returns false)
    Result<bool> pump_output(std::chrono::steady_clock::time_point deadline);
    Result<RunResult> reap(std::chrono::steady_clock::time_point deadline, bool timed_out);
    void close_pipes();

    std::string command_;
    std::vector<std::string> environment_;
    std::filesystem::path working_dir_;

    pid_t child_pid_{};
    bool reaped_ = false;

    linux::Pipe stdout_pipe_{.read_fd = -1, .write_fd = -1};
    linux::Pipe stderr_pipe_{.read_fd = -1, .write_fd = -1};

    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

} // namespace junitgrader
