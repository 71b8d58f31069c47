#include "catch2_custom.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/text.hpp>
#include <junitgrader/subprocess/run_result.hpp>
#include <junitgrader/subprocess/subprocess.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>

using namespace junitgrader;
using namespace std::chrono_literals;

namespace {

const std::vector<std::string> ENV = {"PATH=/usr/bin:/bin"};

} // namespace

TEST_CASE("Capture stdout and stderr separately") {
    Subprocess proc{"printf 'Hello world!'; echo oops >&2", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_kind() == RunResult::Kind::Exited);
    REQUIRE(result->succeeded());
    REQUIRE(result->get_stdout() == "Hello world!");
    REQUIRE(result->get_stderr() == "oops\n");
}

TEST_CASE("Exit codes are reported") {
    Subprocess proc{"exit 3", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_kind() == RunResult::Kind::Exited);
    REQUIRE(result->get_code() == 3);
    REQUIRE_FALSE(result->succeeded());
}

TEST_CASE("Unknown commands exit with the shell's not-found code") {
    Subprocess proc{"definitely-not-a-real-command-junitgrader", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_code() == Subprocess::SHELL_NOT_FOUND_CODE);
    REQUIRE_FALSE(result->get_stderr().empty());
}

TEST_CASE("Signals are reported") {
    Subprocess proc{"kill -TERM $$", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_kind() == RunResult::Kind::Killed);
    REQUIRE(result->get_code() == SIGTERM);
}

TEST_CASE("The environment is replaced") {
    Subprocess proc{"echo \"$PATH|$HOME\"", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_stdout() == "/usr/bin:/bin|\n");
}

TEST_CASE("Commands run in the working directory") {
    Subprocess proc{"pwd", ENV, "/"};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_stdout() == "/\n");
}

TEST_CASE("A missing working directory is reported like a missing command") {
    Subprocess proc{"pwd", ENV, "/definitely/not/a/real/directory"};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->get_code() == Subprocess::SHELL_NOT_FOUND_CODE);
    REQUIRE(result->get_stdout().empty());
}

TEST_CASE("Only the standard streams are inherited") {
    // Descriptors the test process itself already lets children inherit
    std::set<int> inheritable;
    for (int fd = 3; fd < 64; ++fd) {
        int flags = ::fcntl(fd, F_GETFD);
        if (flags != -1 && (flags & FD_CLOEXEC) == 0) {
            inheritable.insert(fd);
        }
    }

    // Shell builtins only, so that nothing else opens a descriptor
    Subprocess proc{"fd=3; while [ $fd -lt 64 ]; do if [ -e /proc/$$/fd/$fd ]; then echo $fd; fi; fd=$((fd+1)); done",
                    ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->succeeded());

    for (std::string_view line : split_lines(result->get_stdout())) {
        const int fd = std::stoi(std::string{line});

        INFO("descriptor " << fd);
        REQUIRE(inheritable.contains(fd));
    }
}

TEST_CASE("Standard input is empty") {
    Subprocess proc{"cat", ENV};

    auto result = proc.run(10s);

    REQUIRE(result);
    REQUIRE(result->succeeded());
    REQUIRE(result->get_stdout().empty());
}

TEST_CASE("Large output does not block the child") {
    // Well over the size of a pipe buffer, on both streams
    Subprocess proc{"i=0; while [ $i -lt 20000 ]; do echo 'some output line'; echo 'err line' >&2; i=$((i+1)); done",
                    ENV};

    auto result = proc.run(60s);

    REQUIRE(result);
    REQUIRE(result->succeeded());
    REQUIRE(result->get_stdout().size() == 20000 * std::string{"some output line\n"}.size());
    REQUIRE(result->get_stderr().size() == 20000 * std::string{"err line\n"}.size());
}

TEST_CASE("Timeouts kill the whole process group") {
    // The background sleep holds the pipes open; it must be killed too
    Subprocess proc{"echo started; sleep 30 & sleep 30", ENV};

    const auto start = std::chrono::steady_clock::now();
    auto result = proc.run(500ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result);
    REQUIRE(result->get_kind() == RunResult::Kind::TimedOut);
    REQUIRE(result->get_stdout() == "started\n");
    REQUIRE(elapsed < 10s);
}
