#pragma once

#include "../task.hpp"

namespace opflow {
namespace detail {

//! Gives the scheduler access to the internals of a task, without making them public.
struct task_access {
    //! Marks the task as submitted. Returns false if the task was already submitted.
    static bool try_submit(task& t);

    //! Moves the task into a state before `executing`
    static void set_state(task& t, task::state s);

    //! Runs the task: starts executing it, or finishes it if it was cancelled in the meantime
    static void run(task& t) { t.run(); }

    //! Finishes a task that hasn't started executing. Returns false if it's too late for that.
    static bool finish_unstarted(task& t, error_list extra_errors = {});

    //! Cancels the task, adding the given errors
    static void cancel_with_errors(task& t, error_list errs) {
        t.cancel_with_errors(std::move(errs));
    }

    //! Adds a dependency to a task that is already submitted
    static void add_internal_dependency(task& t, task_ptr dep);

    //! Adds an observer to a task that is already submitted
    static void add_internal_observer(task& t, observer_ptr o);

    //! Sets the function to be called when the task is first cancelled
    static void set_cancel_listener(task& t, std::function<void()> f);

    //! Calls `f` after the task is finished and its observers notified; immediately, if it's
    //! already in this state.
    static void when_finished(task& t, std::function<void()> f);
};

} // namespace detail
} // namespace opflow
