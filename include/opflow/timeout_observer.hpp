#pragma once

#include "observer.hpp"

#include <chrono>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Cancels a task that takes too long.
 *
 * When the observed task starts executing, a timer is started. If the task is not finished when
 * the timer fires, it's cancelled with a @ref task_timed_out error.
 *
 * The task decides how fast it reacts to the cancellation.
 */
class timeout_observer : public observer {
public:
    explicit timeout_observer(std::chrono::nanoseconds timeout);

    //! The time allowed for the task, after starting
    std::chrono::nanoseconds timeout() const noexcept { return timeout_; }

    void on_start(task& t) override;

private:
    std::chrono::nanoseconds timeout_;
};

} // namespace v1
} // namespace opflow
