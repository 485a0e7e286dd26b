#pragma once

#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace opflow {

inline namespace v1 {
class task;
class condition;
class observer;
class finish_signal;

using task_ptr = std::shared_ptr<task>;
using condition_ptr = std::shared_ptr<condition>;
using observer_ptr = std::shared_ptr<observer>;
} // namespace v1

namespace detail {
struct task_access;
}

inline namespace v1 {

/**
 * @brief      A unit of asynchronous work, with a lifecycle managed by a scheduler.
 *
 * Concrete tasks derive from this class and implement @ref execute(). The work may complete
 * synchronously or later, on any thread; either way, the task calls @ref finish() exactly once.
 *
 * Before being submitted to a scheduler, a task can be configured with:
 *  - dependencies: tasks that need to be finished before this task is considered for execution
 *  - conditions: asynchronous preconditions that can veto the execution of the task, or inject
 *    extra dependencies
 *  - observers: listeners for the start, produced tasks and finish events
 *
 * After submission, these cannot be changed anymore.
 *
 * The lifecycle of a task is described by @ref state; the state only moves forward. Independently
 * of the state, a task can be cancelled at any time. A cancelled task that hasn't started will not
 * run its work; a running task is never terminated, but it can observe the cancellation through
 * @ref is_cancelled() or by overriding @ref on_cancel().
 *
 * Tasks must always be owned by a std::shared_ptr.
 *
 * @see scheduler, condition, observer, finish_signal
 */
class task : public std::enable_shared_from_this<task> {
public:
    //! The lifecycle states of a task
    enum class state {
        initialized,           //!< Created, not submitted
        pending,               //!< Submitted; waiting for dependencies
        evaluating_conditions, //!< Dependencies finished; waiting for the conditions verdicts
        ready,                 //!< Conditions hold; waiting for exclusivity, resume or a free slot
        executing,             //!< The work of the task is executing
        finishing,             //!< The finish signal was received, notifying observers
        finished,              //!< Terminal state
    };

    //! Constructs a task with the given name. The name is only used for diagnostics.
    explicit task(std::string name = "task");
    virtual ~task();

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    //! The unique identifier of the task
    uint64_t id() const noexcept { return id_; }
    //! The name of the task
    const std::string& name() const noexcept { return name_; }

    //! Returns the current state of the task
    state get_state() const noexcept { return state_.load(std::memory_order_acquire); }
    //! Returns true if the task reached its terminal state
    bool is_finished() const noexcept { return get_state() == state::finished; }
    //! Returns true if the task was cancelled
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief      Cancels the task
     *
     * Idempotent; has no effect once the task is finishing. If the task hasn't started executing,
     * it will finish without executing. If it's executing, @ref on_cancel() is called to let the
     * task shorten its work.
     *
     * Cancellation is not an error; it is not added to the error list of the task.
     *
     * @see cancel_with_error(), is_cancelled()
     */
    void cancel();

    /**
     * @brief      Cancels the task, recording the given error
     *
     * @param      err   The error to be added to the error list of the task; can be null
     *
     * Behaves like @ref cancel(), but also adds the given error to the errors of the task.
     */
    void cancel_with_error(std::exception_ptr err);

    /**
     * @brief      Adds a dependency to this task
     *
     * @param      dep   The task that must be finished before this task can run
     *
     * The task will not be considered for execution until all its dependencies are finished,
     * regardless of whether they finished with errors or were cancelled.
     *
     * Throws std::logic_error if the task was already submitted.
     */
    void add_dependency(task_ptr dep);
    //! Removes a dependency; throws std::logic_error if the task was already submitted
    void remove_dependency(const task_ptr& dep);
    //! Returns the dependencies of this task, including the ones added by conditions
    std::vector<task_ptr> dependencies() const;

    //! Adds a condition; throws std::logic_error if the task was already submitted
    void add_condition(condition_ptr c);
    //! Returns the conditions of this task, in the order in which they were added
    std::vector<condition_ptr> conditions() const;

    //! Adds an observer; throws std::logic_error if the task was already submitted
    void add_observer(observer_ptr o);

    //! Returns the errors of this task, in the order in which they were reported
    error_list errors() const;
    //! Returns true if the task has any errors
    bool has_errors() const;

    /**
     * @brief      Produces a new task from this task.
     *
     * @param      t     The produced task
     *
     * All the observers of this task are notified about the new task. The scheduler running this
     * task submits it to the same scheduler, before this function returns. The produced task is
     * independent of this task; it doesn't inherit dependencies, conditions or observers.
     */
    void produce(task_ptr t);

    //! Blocks until the task is finished and all its observers were notified
    void wait() const;

    //! Blocks until the task is finished and all its observers were notified, or until timeout.
    //! Returns true if the task is finished.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return done_cv_.wait_for(lock, timeout, [this] { return notified_; });
    }

protected:
    /**
     * @brief      The work of the task.
     *
     * Called at most once, on a thread given by the executor of the scheduler. The implementation
     * must ensure that @ref finish() is called exactly once, either before returning or later.
     * An exception thrown from here finishes the task with an @ref execution_error.
     */
    virtual void execute() = 0;

    /**
     * @brief      Called once, when the task is first cancelled.
     *
     * Can be called from any thread, in any state before finishing. Tasks that are executing
     * asynchronous work can override this to stop their work and finish early.
     */
    virtual void on_cancel() {}

    /**
     * @brief      Signals the end of the task's work.
     *
     * @param      errors  The errors produced by the work; empty on success
     *
     * Must be called exactly once, while the task is executing. Calling it a second time throws
     * @ref double_finish; calling it while the task is not executing throws std::logic_error.
     */
    void finish(error_list errors = {});
    //! @overload
    void finish(std::exception_ptr err);

    //! Creates a one-time token that finishes this task, to be handed to callbacks
    finish_signal make_finish_signal();

private:
    friend detail::task_access;
    friend class finish_signal;

    using listener_fun = std::function<void()>;

    //! The unique id of the task
    const uint64_t id_;
    //! The name of the task, used for diagnostics
    const std::string name_;
    //! The current state; written under `mutex_`
    std::atomic<state> state_{state::initialized};
    //! Set when the task is cancelled
    std::atomic<bool> cancelled_{false};

    //! Protects the data below
    mutable std::mutex mutex_;
    //! Notified when all the finish notifications were delivered
    mutable std::condition_variable done_cv_;
    //! True after observers and finish listeners were notified
    bool notified_{false};
    std::vector<task_ptr> dependencies_;
    std::vector<condition_ptr> conditions_;
    std::vector<observer_ptr> observers_;
    error_list errors_;
    //! Called after observers, when the task is finished; used to wire dependencies
    std::vector<listener_fun> finish_listeners_;
    //! Called once, when the task is first cancelled; used by the scheduler
    listener_fun cancel_listener_;

    //! Throws if the task is already submitted; expects the lock to be held
    void check_configurable(const char* what) const;
    //! Common implementation for the cancel functions
    void cancel_with_errors(error_list errs);
    //! Called by the scheduler to run the task
    void run();
    //! Called when an exception escaped from execute()
    void on_execute_exception(std::exception_ptr ex);
    //! Moves from finishing to finished and sends all the notifications
    void complete();
};

//! Returns the name of the given state
const char* to_string(task::state s) noexcept;

/**
 * @brief      One-time token that finishes a task.
 *
 * Handed to asynchronous callbacks that need to finish the task. Copies refer to the same task;
 * the task itself guarantees that only the first call has effect; the others throw
 * @ref double_finish.
 *
 * Keeps the task alive until it's called.
 */
class finish_signal {
public:
    finish_signal() = default;

    //! Finishes the task with the given errors
    void operator()(error_list errors = {}) const;
    //! Finishes the task with the given error; a null error means success
    void operator()(std::exception_ptr err) const;

    //! The task that will be finished by this signal
    const task_ptr& target() const noexcept { return task_; }

private:
    friend class task;
    explicit finish_signal(task_ptr t)
        : task_(std::move(t)) {}

    task_ptr task_;
};

} // namespace v1
} // namespace opflow
