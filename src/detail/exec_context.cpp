#include "opflow/detail/exec_context.hpp"
#include "opflow/detail/exec_context_if.hpp"
#include "opflow/low_level/spin_backoff.hpp"
#include "opflow/init.hpp"
#include "opflow/log.hpp"

#include <spdlog/spdlog.h>

namespace opflow {
namespace detail {

int get_num_threads(int config_num_threads) {
    if (config_num_threads > 0)
        return config_num_threads;
    int res = static_cast<int>(std::thread::hardware_concurrency());
    return res > 0 ? res : 4;
}

exec_context::exec_context(const init_data& config)
    : count_(get_num_threads(config.num_workers_))
    , workers_data_(static_cast<size_t>(count_)) {
    OPFLOW_PROFILING_INIT();
    OPFLOW_PROFILING_FUNCTION();
    SPDLOG_LOGGER_DEBUG(logger(), "starting execution context with {} workers", count_);
    std::function<void()> worker_start_fun = config.worker_start_fun_;
    for (int i = 0; i < count_; i++) {
        workers_data_[i].thread_ = std::thread([this, i, worker_start_fun]() {
            // Call the worker start function, to perform user-defined actions on this thread
            if (worker_start_fun)
                worker_start_fun();
            worker_run(workers_data_[i]);
        });
    }
}

exec_context::~exec_context() {
    OPFLOW_PROFILING_FUNCTION();
    // No more timers; they would try to enqueue work into us
    timers_.shutdown();
    // Set the flag to mark shut down, and wake all the threads
    done_ = true;
    for (auto& worker_data : workers_data_)
        worker_data.has_data_.signal();
    for (auto& worker_data : workers_data_)
        worker_data.thread_.join();
    int dropped = static_cast<int>(enqueued_work_.clear());
    if (dropped > 0)
        SPDLOG_LOGGER_WARN(logger(), "execution context shut down with {} work items not executed",
                dropped);
}

void exec_context::enqueue(work_function&& f) {
    OPFLOW_PROFILING_FUNCTION();
    num_tasks_++;
    enqueued_work_.push(std::move(f));
    num_global_tasks_++;
    wakeup_workers();
}

void exec_context::schedule_after(std::chrono::nanoseconds delay, work_function&& f) {
    timers_.schedule_after(delay, [this, f = std::move(f)]() mutable { enqueue(std::move(f)); });
}

void exec_context::worker_run(worker_thread_data& worker_data) {
    OPFLOW_PROFILING_SETTHREADNAME("opflow_worker");
    num_active_workers_++;
    while (!done_) {
        if (!try_extract_execute_task())
            try_sleep(worker_data);
    }
    num_active_workers_--;
}

bool exec_context::try_extract_execute_task() {
    work_function f;
    if (!enqueued_work_.try_pop(f))
        return false;
    num_global_tasks_--;
    execute_task(f);
    return true;
}

void exec_context::try_sleep(worker_thread_data& worker_data) {
    num_active_workers_--;
    if (before_sleep(worker_data))
        worker_data.has_data_.wait();
    num_active_workers_++;
    worker_data.state_.store(worker_thread_data::running);
}

bool exec_context::before_sleep(worker_thread_data& worker_data) {
    worker_data.state_.store(worker_thread_data::waiting);

    // Spin for a bit, in the hope that new work is added; we'd rather not go to sleep just to be
    // woken up immediately
    spin_backoff spinner;
    constexpr int new_active_wait_iterations = 8;
    for (int i = 0; i < new_active_wait_iterations; i++) {
        if (num_global_tasks_.load() > 0 || done_)
            return false;
        spinner.pause();
    }

    int old = worker_thread_data::waiting;
    if (!worker_data.state_.compare_exchange_strong(old, worker_thread_data::idle))
        return false; // somebody prevented us to go to sleep

    return true;
}

void exec_context::wakeup_workers() {
    OPFLOW_PROFILING_FUNCTION();

    // A worker that is spinning in waiting state will pick up the work; that's enough
    int num_idle = 0;
    for (auto& wd : workers_data_) {
        int old = worker_thread_data::waiting;
        if (wd.state_.compare_exchange_strong(old, worker_thread_data::running))
            return;
        if (old == worker_thread_data::idle)
            num_idle++;
    }

    // All the workers are either running or idle; wake up one idle worker
    if (num_idle > 0) {
        for (auto& wd : workers_data_) {
            int old = worker_thread_data::idle;
            if (wd.state_.compare_exchange_strong(old, worker_thread_data::running)) {
                wd.has_data_.signal();
                return;
            }
        }
    }
}

void exec_context::execute_task(work_function& f) const {
    OPFLOW_PROFILING_FUNCTION();
    try {
        f();
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_ERROR(logger(), "exception escaped from work item: {}", e.what());
    } catch (...) {
        SPDLOG_LOGGER_ERROR(logger(), "unknown exception escaped from work item");
    }
    num_tasks_--;
}

void do_enqueue(exec_context& ctx, work_function&& f) { ctx.enqueue(std::move(f)); }
void do_schedule_after(exec_context& ctx, std::chrono::nanoseconds delay, work_function&& f) {
    ctx.schedule_after(delay, std::move(f));
}

int num_worker_threads(const exec_context& ctx) { return ctx.num_worker_threads(); }
bool is_active(const exec_context& ctx) { return ctx.is_active(); }
int num_active_tasks(const exec_context& ctx) { return ctx.num_active_tasks(); }
int num_pending_timers(const exec_context& ctx) { return ctx.num_pending_timers(); }

} // namespace detail
} // namespace opflow
