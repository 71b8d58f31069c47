#pragma once

#include <junitgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>

#include <string_view>

namespace junitgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    ExternalToolUnavailable, ///< The setup command could not be started
    BuildFailure,            ///< The build step exited with a non-zero code (or timed out)
    RunCrash,                ///< The test runner died without producing a parsable report
    AmbiguousScore,          ///< Zero tests were detected; there is no valid score
    SyscallFailure,          ///< A Linux syscall failed
    BadArgument,             ///< An argument violated a documented precondition

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view format_as(ErrorKind kind) {
    using enum ErrorKind;

    switch (kind) {
    case ExternalToolUnavailable:
        return "ExternalToolUnavailable";
    case BuildFailure:
        return "BuildFailure";
    case RunCrash:
        return "RunCrash";
    case AmbiguousScore:
        return "AmbiguousScore";
    case SyscallFailure:
        return "SyscallFailure";
    case BadArgument:
        return "BadArgument";
    case MaxErrorNum:
        break;
    }

    return "<unknown>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace junitgrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::junitgrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
