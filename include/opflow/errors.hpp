#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace opflow {

inline namespace v1 {

//! The errors accumulated by a task, in the order in which they were reported
using error_list = std::vector<std::exception_ptr>;

/**
 * @brief      Marker for a task that was cancelled.
 *
 * Cancellation is reported through task::is_cancelled(); this type is never added to the error
 * list of a task. It can be used by user code that needs to turn a cancellation into an exception.
 */
struct task_cancelled : std::runtime_error {
    task_cancelled()
        : runtime_error("task cancelled") {}
};

/**
 * @brief      A condition of a task did not hold, and the task was not executed.
 *
 * Holds the category (the name) of the condition and the error that the condition reported.
 */
class condition_failed : public std::runtime_error {
public:
    condition_failed(std::string category, std::exception_ptr underlying);

    //! The name of the condition that failed
    const std::string& category() const noexcept { return category_; }
    //! The error reported by the condition
    const std::exception_ptr& underlying() const noexcept { return underlying_; }

private:
    std::string category_;
    std::exception_ptr underlying_;
};

//! An exception escaped from the execution of a task.
class execution_error : public std::runtime_error {
public:
    execution_error(const std::string& task_name, std::exception_ptr underlying);

    //! The exception thrown by the task
    const std::exception_ptr& underlying() const noexcept { return underlying_; }

private:
    std::exception_ptr underlying_;
};

//! A task was finished more than once. Thrown to the second caller.
struct double_finish : std::logic_error {
    explicit double_finish(const std::string& task_name)
        : logic_error("task '" + task_name + "' finished twice") {}
};

//! The verdict of a condition was reported more than once.
struct double_completion : std::logic_error {
    explicit double_completion(const std::string& condition_name)
        : logic_error("condition '" + condition_name + "' reported its result twice") {}
};

//! A condition released its completion without reporting a verdict.
struct verdict_dropped : std::logic_error {
    explicit verdict_dropped(const std::string& condition_name)
        : logic_error("condition '" + condition_name + "' did not report a verdict") {}
};

//! A negated condition failed because the wrapped condition was satisfied.
struct negation_failed : std::runtime_error {
    explicit negation_failed(const std::string& condition_name)
        : runtime_error("negated condition '" + condition_name + "' was satisfied") {}
};

//! A predicate-based condition evaluated to false.
struct block_condition_failed : std::runtime_error {
    explicit block_condition_failed(const std::string& condition_name)
        : runtime_error("block condition '" + condition_name + "' was not satisfied") {}
};

//! Some dependencies of a task finished with errors or were cancelled.
class failed_dependencies : public std::runtime_error {
public:
    explicit failed_dependencies(std::vector<std::string> names);

    //! The names of the dependencies that failed
    const std::vector<std::string>& names() const noexcept { return names_; }

private:
    std::vector<std::string> names_;
};

//! A task did not finish in the allowed time after it started executing.
struct task_timed_out : std::runtime_error {
    explicit task_timed_out(std::chrono::nanoseconds timeout);

    //! The allowed time
    std::chrono::nanoseconds timeout_;
};

/**
 * @brief      Returns a human-readable description of the given error.
 *
 * For exceptions derived from std::exception this is the result of `what()`. Nested errors of
 * @ref condition_failed and @ref execution_error are not expanded; their message already contains
 * the description of the underlying error.
 */
std::string describe(const std::exception_ptr& err);

//! Checks whether the given error is a @ref task_cancelled marker
bool is_cancellation(const std::exception_ptr& err);

} // namespace v1
} // namespace opflow
