#pragma once

#include "task.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace opflow {

inline namespace v1 {

/**
 * @brief      A task that finishes after a given time, without occupying a worker thread.
 *
 * The delay can be given as a duration, measured from the moment the task starts executing, or as
 * a point in time. A zero or negative duration, or a point in the past, makes the task finish
 * immediately when executed.
 *
 * Cancelling the task while it waits finishes it early, without errors. Cancelling it before it
 * starts prevents it from executing at all.
 *
 * Typically used as a dependency of other tasks, to delay their start.
 *
 * @see scheduler, task
 */
class delay_task : public task {
public:
    //! Creates a task that finishes the given duration after it starts executing
    template <typename Rep, typename Period>
    explicit delay_task(std::chrono::duration<Rep, Period> delay)
        : delay_task(std::chrono::duration_cast<std::chrono::nanoseconds>(delay), tag{}) {}

    //! Creates a task that finishes at the given point in time
    explicit delay_task(std::chrono::system_clock::time_point until);

    /**
     * @brief      The time left until the task finishes
     *
     * Before the task starts executing, for a duration-based delay, this is the full delay. Never
     * negative.
     */
    std::chrono::nanoseconds remaining() const;

protected:
    void execute() override;
    void on_cancel() override;

private:
    struct tag {};
    delay_task(std::chrono::nanoseconds delay, tag);

    //! The delay, for duration-based tasks
    const std::chrono::nanoseconds delay_{0};
    //! The target time, for tasks created from a point in time
    const std::chrono::system_clock::time_point until_{};
    //! True if the task was created from a point in time
    const bool absolute_{false};
    //! The moment the task started executing, as steady clock ticks; 0 before starting
    std::atomic<std::chrono::steady_clock::rep> started_at_{0};
    //! Set by whoever finishes the task first: the timer or the cancellation
    std::atomic<bool> fired_{false};

    void fire();
};

} // namespace v1
} // namespace opflow
