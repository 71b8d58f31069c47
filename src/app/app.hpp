#pragma once

#include "app/trace_exception.hpp"
#include "user/grader_options.hpp"

#include <junitgrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace junitgrader {

class App : NonCopyable
{
public:
    explicit App(GraderOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const GraderOptions& get_opts() const noexcept { return OPTS; }

    /// Exit code of the application; -1 if an exception escaped
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(-1);
    }

    const GraderOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace junitgrader
