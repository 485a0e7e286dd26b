#pragma once

#include "../executor_type.hpp"
#include "../profiling.hpp"
#include "../low_level/semaphore.hpp"
#include "concurrent_queue.hpp"
#include "timer_service.hpp"

#include <vector>
#include <thread>
#include <atomic>
#include <chrono>

namespace opflow {

inline namespace v1 {
struct init_data;
} // namespace v1

namespace detail {

//! Structure containing the data for a worker thread
struct worker_thread_data {
    enum worker_state {
        idle = 0, //!< We don't have any work and we are sleeping
        waiting,  //!< No work, but we are spinning in the hope to catch some
        running,  //!< We have some work, or we think we have some work to execute
    };

    //! The thread object for this worker
    std::thread thread_;
    //! The state of the worker
    std::atomic<int> state_{running};
    //! Semaphore used to signal when the worker has data, or some processing to do
    binary_semaphore has_data_;
};

//! The execution context behind the global executor.
//! Creates a set of worker threads (by default, one per core), all pulling work from one global
//! queue, plus a timer thread for delayed work.
class exec_context {
public:
    explicit exec_context(const init_data& config);
    ~exec_context();

    exec_context(const exec_context&) = delete;
    exec_context& operator=(const exec_context&) = delete;

    //! Enqueues the given work to be executed by a worker thread
    void enqueue(work_function&& f);

    //! Enqueues the given work after the given delay has elapsed
    void schedule_after(std::chrono::nanoseconds delay, work_function&& f);

    //! Returns the number of worker threads we initially created
    int num_worker_threads() const { return count_; }

    //! Tests if there is work currently enqueued or executing
    bool is_active() const { return num_tasks_.load() > 0 || num_active_workers_.load() > 0; }

    //! Returns the number of work items enqueued or executing. Doesn't include pending timers.
    int num_active_tasks() const { return num_tasks_.load(); }

    //! Returns the number of timers that haven't fired yet
    int num_pending_timers() const { return timers_.num_pending(); }

private:
    //! The number of worker threads that we should have
    const int count_;

    //! The data for each worker thread
    std::vector<worker_thread_data> workers_data_;

    //! The global queue, in which we store all the enqueued work
    concurrent_queue<work_function> enqueued_work_;
    //! The number of work items in the global queue
    std::atomic<int> num_global_tasks_{0};

    //! Flag used to announce the shutting down of the execution context
    std::atomic<bool> done_{false};

    //! The number of work items that we currently have enqueued or executing
    mutable std::atomic<int> num_tasks_{0};

    //! The number of active workers; this allows us to quickly check if there is any work in the
    //! system.
    mutable std::atomic<int> num_active_workers_{0};

    //! The timers used for delayed work
    timer_service timers_;

    //! The run procedure for a worker thread
    void worker_run(worker_thread_data& worker_data);

    //! Tries to extract some work and execute it. Returns false if there is nothing to extract
    bool try_extract_execute_task();

    //! Puts the worker to sleep if the `done_` flag is not set
    void try_sleep(worker_thread_data& worker_data);

    //! Called before going to sleep to wait a bit and check for any incoming work.
    //! Returns true if we can safely go to sleep.
    bool before_sleep(worker_thread_data& worker_data);

    //! Called when adding new work to wake up the workers
    void wakeup_workers();

    //! Execute the given work item
    void execute_task(work_function& f) const;
};

} // namespace detail
} // namespace opflow
