#pragma once

#include "task.hpp"
#include "executor_type.hpp"
#include "except_fun_type.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace opflow {

inline namespace v1 {

class exclusivity_controller;

/**
 * @brief      Receives notifications about the tasks going through a scheduler.
 *
 * Both hooks are optional. @ref will_submit() is called synchronously from @ref scheduler::submit,
 * for every accepted task (including the dependencies added by conditions, and produced tasks).
 * @ref did_finish() is called after the task is finished and no longer tracked by the scheduler.
 */
class scheduler_delegate {
public:
    virtual ~scheduler_delegate() = default;

    //! Called when a task was accepted by the scheduler
    virtual void will_submit(const task_ptr& t);
    //! Called when a task tracked by the scheduler is finished
    virtual void did_finish(const task_ptr& t, const error_list& errors);
};

//! Configuration of a scheduler
struct scheduler_options {
    //! The name of the scheduler, used for diagnostics
    std::string name_{"scheduler"};
    //! The maximum number of tasks that can be executing at once; 0 = no limit
    int max_concurrent_{0};
    //! The executor used to run the tasks; if empty, the global executor is used
    executor_t executor_;
    //! The controller used for mutual exclusion; if null, the scheduler creates its own
    std::shared_ptr<exclusivity_controller> exclusivity_;
    //! If true, the scheduler starts suspended
    bool start_suspended_{false};
};

/**
 * @brief      Runs tasks, honoring their dependencies, conditions and exclusivity constraints.
 *
 * A task submitted to a scheduler goes through the following steps:
 *  - the dependencies required by its conditions are added and submitted to this scheduler
 *  - its exclusivity categories are claimed, in the order of submission
 *  - it waits for all its dependencies to finish
 *  - its conditions are evaluated; if any of them fails, the task finishes without executing
 *  - it waits until it's eligible for all its exclusivity categories, the scheduler is not
 *    suspended, and the concurrency limit allows it
 *  - it's executed with the executor of the scheduler
 *
 * Tasks that are cancelled before executing are finished promptly, without running their work.
 *
 * The admission decisions are taken on an internal serial lane, so they never block worker threads
 * and never run in parallel for the same scheduler. Copying a scheduler is disabled; the internal
 * state is shared with the tasks in flight, so destroying the scheduler is safe. Destroying the
 * scheduler cancels all the tasks it still tracks.
 *
 * @see task, condition, exclusivity_controller, scheduler_options
 */
class scheduler {
public:
    explicit scheduler(scheduler_options opts = {});
    ~scheduler();

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;

    /**
     * @brief      Submits a task for execution
     *
     * @param      t     The task to be submitted
     *
     * @return     True if the task was accepted
     *
     * A task can be submitted only once, to only one scheduler. Submitting it again, here or
     * anywhere else, is rejected; a warning is logged and false is returned.
     */
    bool submit(task_ptr t);

    //! Submits multiple tasks; returns the number of accepted tasks
    int submit(const std::vector<task_ptr>& tasks);

    //! Cancels all the tasks tracked by this scheduler; doesn't wait for them to finish
    void cancel_all();

    //! Suspends the scheduler: no new task starts executing, and no conditions are evaluated
    void suspend();
    //! Resumes the scheduler; the waiting tasks start in the order they became eligible
    void resume();
    //! Checks whether the scheduler is suspended
    bool is_suspended() const;

    //! Returns the number of tasks that were accepted and are not yet finished
    int num_tracked() const;
    //! Checks whether all the accepted tasks are finished
    bool is_idle() const { return num_tracked() == 0; }
    //! Waits until all the accepted tasks are finished; returns false on timeout
    bool wait_for_idle(std::chrono::nanoseconds timeout) const;

    //! Sets the delegate that receives notifications about the tasks of this scheduler
    void set_delegate(std::shared_ptr<scheduler_delegate> delegate);

    /**
     * @brief      Sets the handler for failures that cannot be reported through a task.
     *
     * @param      except_fun  The function to be called whenever such an exception occurs.
     *
     * Called when the executor throws while accepting a task (the task then finishes with that
     * error too), or when a delegate hook throws. If no handler is set, these are logged.
     */
    void set_exception_handler(except_fun_t except_fun);

    //! The name of the scheduler
    const std::string& name() const;

    //! The exclusivity controller used by the scheduler
    const std::shared_ptr<exclusivity_controller>& exclusivity() const;

private:
    struct impl;

    //! The implementation object of this scheduler.
    //! Shared with all the tasks in flight, so that it outlives them.
    std::shared_ptr<impl> impl_;
};

} // namespace v1
} // namespace opflow
