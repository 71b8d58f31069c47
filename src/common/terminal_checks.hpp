#pragma once

#include <junitgrader/common/expected.hpp>

#include <cstdio>

#include <sys/ioctl.h>

namespace junitgrader {

/// Whether the terminal (according to $NO_COLOR, $COLORTERM and $TERM) supports ANSI colors
bool is_color_terminal() noexcept;

/// Whether $FORCE_COLOR asks for colors regardless of the terminal. CI log viewers
/// (e.g., GitHub Actions) render ANSI colors even though stdout is not a terminal.
bool color_forced() noexcept;

/// Whether `file` is attached to a terminal
bool in_terminal(FILE* file) noexcept;

Expected<winsize> terminal_size(FILE* file) noexcept;

} // namespace junitgrader
