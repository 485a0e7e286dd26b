#pragma once

#include "executor_type.hpp"
#include "detail/exec_context_if.hpp"
#include "detail/library_data.hpp"

#include <utility>

namespace opflow {

inline namespace v1 {

/**
 * @brief The default global executor type.
 *
 * Passes the work directly to the worker pool of the library. Whenever there is a worker
 * available, the work is executed. The first use initializes the library with default settings, if
 * it wasn't explicitly initialized before.
 *
 * This is the default executor of a scheduler.
 *
 * @see inline_executor, init()
 */
struct global_executor {
    void operator()(work_function f) const {
        detail::do_enqueue(detail::get_exec_context(), std::move(f));
    }

    friend inline bool operator==(global_executor, global_executor) { return true; }
    friend inline bool operator!=(global_executor, global_executor) { return false; }
};

} // namespace v1
} // namespace opflow
