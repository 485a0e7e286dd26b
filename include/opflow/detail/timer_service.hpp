#pragma once

#include "../executor_type.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace opflow {
namespace detail {

/**
 * @brief      One-shot timers, served by a dedicated thread.
 *
 * The thread sleeps until the earliest deadline, then runs the corresponding work function.
 * Timers with the same deadline run in the order in which they were scheduled. The work functions
 * are expected to be short; typically they just hand the real work to the worker pool.
 */
class timer_service {
public:
    using clock = std::chrono::steady_clock;

    timer_service();
    ~timer_service();

    timer_service(const timer_service&) = delete;
    timer_service& operator=(const timer_service&) = delete;

    //! Schedules `f` to be called at the given time point
    void schedule_at(clock::time_point when, work_function f);

    //! Schedules `f` to be called after the given delay
    void schedule_after(clock::duration delay, work_function f) {
        schedule_at(clock::now() + delay, std::move(f));
    }

    //! Returns the number of timers that haven't fired yet
    int num_pending() const;

    //! Stops the timer thread; the timers that haven't fired are dropped
    void shutdown();

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    //! The pending timers, ordered by deadline
    std::multimap<clock::time_point, work_function> timers_;
    //! Set when the timer thread needs to stop
    bool done_{false};
    //! The thread that waits for the deadlines
    std::thread thread_;

    void run();
};

} // namespace detail
} // namespace opflow
