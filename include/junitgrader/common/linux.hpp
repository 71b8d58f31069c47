#pragma once

#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace junitgrader::linux {

inline std::error_code make_error_code(int err = errno) noexcept {
    return {err, std::generic_category()};
}

/// reads fromm a file descriptor. See read(2)
/// An empty result signals end-of-file.
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err);
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

/// see open(2)
/// returns the new file descriptor; logs failure at debug level
inline Expected<int> open(const std::string& path, int flags) {
    int res = ::open(path.c_str(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("open({:?}) failed: '{}'", path, err);
        return err;
    }

    return res;
}

/// `argv` and `envp` must be NULL-terminated. See execve(2)
/// Only returns on failure. Neither allocates nor logs, so it is safe to call in a forked child
inline std::error_code execve(const char* exec, char* const* argv, char* const* envp) noexcept {
    ::execve(exec, argv, envp);

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;
    pid_t pid; // Only valid if which == Parent
};

/// see fork(2) and ``Fork``
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see dup(2)
/// returns success/failure; not logged, safe to call in a forked child
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        return make_error_code(errno);
    }

    return {};
}

/// see waitpid(2)
/// returns the pid reported by waitpid (0 if WNOHANG and the child has not changed state)
/// and stores the raw status in ``status``; logs failure at debug level
inline Expected<pid_t> waitpid(pid_t pid, int& status, int options = 0) {
    pid_t res = -1;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err);

        return err;
    }

    return res;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see chdir(2)
/// returns success/failure; not logged, safe to call in a forked child
inline Expected<> chdir(const char* path) {
    if (::chdir(path) == -1) {
        return make_error_code(errno);
    }

    return {};
}

} // namespace junitgrader::linux
