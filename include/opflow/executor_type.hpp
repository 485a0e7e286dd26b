#pragma once

#include <functional>

namespace opflow {

inline namespace v1 {

//! A unit of work handed to an executor.
using work_function = std::function<void()>;

/**
 * @brief Generic executor type.
 *
 * An executor takes a work function and schedules its execution, typically at a later time, and
 * maybe on a different thread. Multiple threads can call the executor at the same time.
 *
 * Schedulers use an executor to run the tasks that were admitted for execution.
 *
 * @see global_executor, inline_executor, scheduler_options
 */
using executor_t = std::function<void(work_function)>;

} // namespace v1
} // namespace opflow
