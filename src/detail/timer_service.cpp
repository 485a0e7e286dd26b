#include "opflow/detail/timer_service.hpp"
#include "opflow/profiling.hpp"
#include "opflow/log.hpp"

#include <spdlog/spdlog.h>

namespace opflow {
namespace detail {

timer_service::timer_service()
    : thread_([this]() { run(); }) {}

timer_service::~timer_service() { shutdown(); }

void timer_service::schedule_at(clock::time_point when, work_function f) {
    bool is_first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.emplace(when, std::move(f));
        is_first = it == timers_.begin();
    }
    // The thread only needs to wake up if the earliest deadline changed
    if (is_first)
        cond_.notify_one();
}

int timer_service::num_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(timers_.size());
}

void timer_service::shutdown() {
    std::multimap<clock::time_point, work_function> to_drop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        to_drop.swap(timers_);
    }
    cond_.notify_one();
    if (thread_.joinable())
        thread_.join();
}

void timer_service::run() {
    OPFLOW_PROFILING_SETTHREADNAME("opflow_timer");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!done_) {
        if (timers_.empty()) {
            cond_.wait(lock);
            continue;
        }
        auto deadline = timers_.begin()->first;
        if (clock::now() < deadline) {
            cond_.wait_until(lock, deadline);
            continue;
        }

        {
            work_function f = std::move(timers_.begin()->second);
            timers_.erase(timers_.begin());
            lock.unlock();
            try {
                OPFLOW_PROFILING_SCOPE_N("timer fired");
                f();
            } catch (const std::exception& e) {
                SPDLOG_LOGGER_ERROR(logger(), "exception thrown by timer callback: {}", e.what());
            } catch (...) {
                SPDLOG_LOGGER_ERROR(logger(), "unknown exception thrown by timer callback");
            }
        }
        lock.lock();
    }
}

} // namespace detail
} // namespace opflow
