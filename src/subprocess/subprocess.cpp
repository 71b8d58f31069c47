#include <junitgrader/subprocess/subprocess.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/linux.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <fmt/chrono.h>
#include <gsl/util>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace junitgrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

/// NULL-terminated array of pointers into `strings`, as execve(2) expects.
/// `strings` must outlive the result.
std::vector<char*> to_exec_array(std::vector<std::string>& strings) {
    std::vector<char*> array;
    array.reserve(strings.size() + 1);

    for (std::string& str : strings) {
        array.push_back(str.data());
    }
    array.push_back(nullptr);

    return array;
}

/// Milliseconds left until `deadline`, clamped to [0, INT_MAX] for poll(2)
int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;

    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();

    return gsl::narrow_cast<int>(std::clamp<decltype(remaining)>(remaining, 0, std::numeric_limits<int>::max()));
}

} // namespace

Subprocess::Subprocess(std::string command, std::vector<std::string> environment, std::filesystem::path working_dir)
    : command_{std::move(command)}
    , environment_{std::move(environment)}
    , working_dir_{std::move(working_dir)} {}

Subprocess::~Subprocess() {
    close_pipes();

    // if child_pid_ == 0, then the process was never started
    if (child_pid_ == 0 || reaped_) {
        return;
    }

    // Only reached if run() bailed out early; don't leave a zombie (or a runaway JVM) behind
    std::ignore = linux::kill(-child_pid_, SIGKILL);
    int status = 0;
    std::ignore = linux::waitpid(child_pid_, status);
}

Result<RunResult> Subprocess::run(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();
    const auto deadline = start_time + timeout;

    LOG_DEBUG("Running {:?} (timeout = {})", command_, timeout);

    TRY(create());

    bool finished = TRY(pump_output(deadline));

    auto result = TRY(reap(deadline, !finished));

    result.with_output(std::move(stdout_buffer_), std::move(stderr_buffer_))
        .with_elapsed(std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start_time));

    LOG_DEBUG("{:?} finished in {}", command_, result.get_elapsed());

    return result;
}

Result<void> Subprocess::create() {
    // Everything the child needs is prepared before forking; after the fork it may neither allocate nor log
    std::vector<std::string> args{SHELL_PATH, "-c", command_};
    const std::string working_dir = working_dir_.string();

    const ExecArgs exec_args{.working_dir = working_dir_.empty() ? nullptr : working_dir.c_str(),
                             .argv = to_exec_array(args),
                             .envp = to_exec_array(environment_)};

    const int dev_null = TRYE(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), SyscallFailure);
    auto close_dev_null = gsl::finally([dev_null] { std::ignore = linux::close(dev_null); });

    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        exec_child(exec_args, dev_null);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Also done in the child; whichever runs first wins, the other fails harmlessly
    ::setpgid(child_pid_, child_pid_);

    // Close the pipe ends being used in the child proc
    TRYE(linux::close(std::exchange(stdout_pipe_.write_fd, -1)), SyscallFailure);
    TRYE(linux::close(std::exchange(stderr_pipe_.write_fd, -1)), SyscallFailure);

    return {};
}

void Subprocess::exec_child(const ExecArgs& exec_args, int dev_null) const noexcept {
    ::setpgid(0, 0);

    if (exec_args.working_dir != nullptr && !linux::chdir(exec_args.working_dir)) {
        _exit(SHELL_NOT_FOUND_CODE);
    }

    // dup2 clears O_CLOEXEC on the new descriptors only; the originals are closed by execve
    if (!linux::dup2(dev_null, STDIN_FILENO) || !linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) ||
        !linux::dup2(stderr_pipe_.write_fd, STDERR_FILENO)) {
        _exit(SHELL_NOT_FOUND_CODE);
    }

    std::ignore = linux::execve(SHELL_PATH, exec_args.argv.data(), exec_args.envp.data());

    _exit(SHELL_NOT_FOUND_CODE);
}

Result<bool> Subprocess::pump_output(std::chrono::steady_clock::time_point deadline) {
    std::array<std::pair<linux::Pipe*, std::string*>, 2> streams{{
        {&stdout_pipe_, &stdout_buffer_},
        {&stderr_pipe_, &stderr_buffer_},
    }};

    auto is_open = [](const auto& stream) { return stream.first->read_fd != -1; };

    while (ranges::any_of(streams, is_open)) {
        std::vector<pollfd> fds;
        for (auto& [pipe, buffer] : streams) {
            if (pipe->read_fd != -1) {
                fds.push_back({.fd = pipe->read_fd, .events = POLLIN, .revents = 0});
            }
        }

        const int timeout_ms = remaining_ms(deadline);
        if (timeout_ms == 0) {
            LOG_WARN("{:?} timed out", command_);
            return false;
        }

        int num_ready = TRYE(linux::poll(fds, timeout_ms), SyscallFailure);
        if (num_ready == 0) {
            continue;
        }

        for (const pollfd& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }

            auto& [pipe, buffer] = *ranges::find_if(
                streams, [fd = pfd.fd](const auto& stream) { return stream.first->read_fd == fd; });

            std::string chunk = TRYE(linux::read(pipe->read_fd, READ_CHUNK_SIZE), SyscallFailure);

            // EOF
            if (chunk.empty()) {
                TRYE(linux::close(std::exchange(pipe->read_fd, -1)), SyscallFailure);
                continue;
            }

            *buffer += chunk;
        }
    }

    return true;
}

Result<RunResult> Subprocess::reap(std::chrono::steady_clock::time_point deadline, bool timed_out) {
    using namespace std::chrono_literals;

    int status = 0;

    if (!timed_out) {
        // Both pipes are closed, so the child should be just about done. It may have closed
        // its stdio early though, so keep polling rather than blocking past the deadline.
        constexpr auto REAP_POLL_PERIOD = 5ms;

        while (std::chrono::steady_clock::now() < deadline) {
            pid_t res = TRYE(linux::waitpid(child_pid_, status, WNOHANG), SyscallFailure);

            if (res == child_pid_) {
                reaped_ = true;
                break;
            }

            std::this_thread::sleep_for(REAP_POLL_PERIOD);
        }

        timed_out = !reaped_;
    }

    if (timed_out) {
        // Kill the whole process group
        if (!linux::kill(-child_pid_, SIGKILL)) {
            std::ignore = linux::kill(child_pid_, SIGKILL);
        }
        TRYE(linux::waitpid(child_pid_, status), SyscallFailure);
        reaped_ = true;

        return RunResult::make_timed_out();
    }

    if (WIFEXITED(status)) {
        LOG_DEBUG("{:?} exited with code {}", command_, WEXITSTATUS(status));
        return RunResult::make_exited(WEXITSTATUS(status));
    }

    LOG_DEBUG("{:?} was killed by signal {}", command_, WTERMSIG(status));
    return RunResult::make_killed(WTERMSIG(status));
}

void Subprocess::close_pipes() {
    for (linux::Pipe* pipe : {&stdout_pipe_, &stderr_pipe_}) {
        for (int* fd : {&pipe->read_fd, &pipe->write_fd}) {
            if (*fd != -1) {
                std::ignore = linux::close(std::exchange(*fd, -1));
            }
        }
    }
}

} // namespace junitgrader
