#pragma once

#include "task.hpp"

#include <functional>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Listener for the lifecycle events of a task.
 *
 * Observers are attached to a task before it's submitted. All the hooks are optional; by default
 * they do nothing. Hooks can be called from any thread.
 *
 * Observers cannot change the outcome of a task; exceptions thrown by the hooks are logged and
 * otherwise ignored.
 *
 * @see task::add_observer(), block_observer, timeout_observer, logging_observer
 */
class observer {
public:
    virtual ~observer() = default;

    //! Called when the task starts executing, before its work
    virtual void on_start(task& t);

    //! Called when the task produces another task
    virtual void on_produce(task& t, const task_ptr& produced);

    /**
     * @brief      Called exactly once, after the task is finished.
     *
     * @param      t       The finished task
     * @param      errors  The errors of the task; empty if the task succeeded
     *
     * Also called for tasks that were cancelled or vetoed by their conditions.
     */
    virtual void on_finish(task& t, const error_list& errors);
};

//! Observer that forwards the events to functors; missing functors are ignored.
class block_observer : public observer {
public:
    using start_function = std::function<void(task&)>;
    using produce_function = std::function<void(task&, const task_ptr&)>;
    using finish_function = std::function<void(task&, const error_list&)>;

    explicit block_observer(start_function on_start = {}, produce_function on_produce = {},
            finish_function on_finish = {})
        : start_fun_(std::move(on_start))
        , produce_fun_(std::move(on_produce))
        , finish_fun_(std::move(on_finish)) {}

    void on_start(task& t) override {
        if (start_fun_)
            start_fun_(t);
    }
    void on_produce(task& t, const task_ptr& produced) override {
        if (produce_fun_)
            produce_fun_(t, produced);
    }
    void on_finish(task& t, const error_list& errors) override {
        if (finish_fun_)
            finish_fun_(t, errors);
    }

private:
    start_function start_fun_;
    produce_function produce_fun_;
    finish_function finish_fun_;
};

} // namespace v1
} // namespace opflow
