#pragma once

#include "executor_type.hpp"

#include <utility>

namespace opflow {

inline namespace v1 {

/**
 * @brief Executor type that executes the work inline
 *
 * Whenever a functor is given to this executor, the functor is directly called. The calling party
 * is blocked until the functor finishes execution.
 *
 * Mostly useful for tests and for tasks that only start asynchronous work, as the whole admission
 * chain of a scheduler runs on the submitting thread.
 */
struct inline_executor {
    template <typename F>
    void operator()(F&& f) const {
        std::forward<F>(f)();
    }

    friend inline bool operator==(inline_executor, inline_executor) { return true; }
    friend inline bool operator!=(inline_executor, inline_executor) { return false; }
};

} // namespace v1
} // namespace opflow
