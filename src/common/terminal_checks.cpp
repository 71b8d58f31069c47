#include "common/terminal_checks.hpp"

#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include <sys/ioctl.h>
#include <unistd.h>

namespace junitgrader {

namespace {

/// Value of an environment variable, or empty if it is unset
std::string_view env_value(const char* name) noexcept {
    const char* value = std::getenv(name);

    return value == nullptr ? std::string_view{} : std::string_view{value};
}

} // namespace

// Term name matching based on: https://github.com/gabime/spdlog
// Which is subsequently based on: https://github.com/agauniyal/rang/
bool is_color_terminal() noexcept {
    static const bool RESULT = [] {
        // https://no-color.org
        if (!env_value("NO_COLOR").empty()) {
            return false;
        }

        if (!env_value("COLORTERM").empty()) {
            return true;
        }

        static constexpr std::array<std::string_view, 16> COLOR_TERMS = {
            "ansi",  "color", "console", "cygwin", "gnome",  "konsole", "kterm", "linux",
            "msys",  "putty", "rxvt",    "screen", "vt100",  "xterm",   "alacritty", "vt102"};

        std::string_view term = env_value("TERM");

        if (term.empty() || term == "dumb") {
            return false;
        }

        return ranges::any_of(COLOR_TERMS, [term](std::string_view name) { return term.contains(name); });
    }();

    return RESULT;
}

bool color_forced() noexcept {
    std::string_view force_color = env_value("FORCE_COLOR");

    return !force_color.empty() && force_color != "0" && force_color != "false";
}

bool in_terminal(FILE* file) noexcept {
    return ::isatty(fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    if (::ioctl(fileno(file), TIOCGWINSZ, &size) == -1) {
        auto err = errno;
        LOG_DEBUG("ioctl(TIOCGWINSZ) failed: {}", get_err_msg(err));
        return std::error_code{err, std::generic_category()};
    }

    return size;
}

} // namespace junitgrader
