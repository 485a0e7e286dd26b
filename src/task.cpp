#include "opflow/task.hpp"
#include "opflow/observer.hpp"
#include "opflow/log.hpp"
#include "opflow/profiling.hpp"
#include "opflow/detail/task_access.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>

namespace opflow {

namespace detail {

//! Generates the ids of the tasks
static std::atomic<uint64_t> g_next_task_id{1};

//! Calls an observer hook. Observers can't change the outcome of a task, so exceptions are logged.
template <typename F>
void notify_observer(const task& t, const char* hook, F&& f) {
    try {
        f();
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_WARN(logger(), "observer {} of task '{}' ({}) threw: {}", hook, t.name(),
                t.id(), e.what());
    } catch (...) {
        SPDLOG_LOGGER_WARN(logger(), "observer {} of task '{}' ({}) threw an unknown exception",
                hook, t.name(), t.id());
    }
}

bool task_access::try_submit(task& t) {
    std::lock_guard<std::mutex> lock(t.mutex_);
    if (t.state_.load(std::memory_order_relaxed) != task::state::initialized)
        return false;
    t.state_.store(task::state::pending, std::memory_order_release);
    return true;
}

void task_access::set_state(task& t, task::state s) {
    assert(s < task::state::executing);
    std::lock_guard<std::mutex> lock(t.mutex_);
    t.state_.store(s, std::memory_order_release);
}

bool task_access::finish_unstarted(task& t, error_list extra_errors) {
    {
        std::lock_guard<std::mutex> lock(t.mutex_);
        if (t.state_.load(std::memory_order_relaxed) >= task::state::executing)
            return false;
        t.state_.store(task::state::finishing, std::memory_order_release);
        for (auto& err : extra_errors)
            t.errors_.emplace_back(std::move(err));
    }
    SPDLOG_LOGGER_DEBUG(logger(), "task '{}' ({}) finishing without executing; cancelled={}",
            t.name(), t.id(), t.is_cancelled());
    t.complete();
    return true;
}

void task_access::add_internal_dependency(task& t, task_ptr dep) {
    std::lock_guard<std::mutex> lock(t.mutex_);
    t.dependencies_.emplace_back(std::move(dep));
}

void task_access::add_internal_observer(task& t, observer_ptr o) {
    std::lock_guard<std::mutex> lock(t.mutex_);
    t.observers_.emplace_back(std::move(o));
}

void task_access::set_cancel_listener(task& t, std::function<void()> f) {
    std::lock_guard<std::mutex> lock(t.mutex_);
    t.cancel_listener_ = std::move(f);
}

void task_access::when_finished(task& t, std::function<void()> f) {
    {
        std::lock_guard<std::mutex> lock(t.mutex_);
        if (!t.notified_) {
            t.finish_listeners_.emplace_back(std::move(f));
            return;
        }
    }
    f();
}

} // namespace detail

inline namespace v1 {

task::task(std::string name)
    : id_(detail::g_next_task_id++)
    , name_(std::move(name)) {}

task::~task() = default;

void task::cancel() { cancel_with_errors({}); }

void task::cancel_with_error(std::exception_ptr err) {
    error_list errs;
    if (err)
        errs.emplace_back(std::move(err));
    cancel_with_errors(std::move(errs));
}

void task::cancel_with_errors(error_list errs) {
    listener_fun listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load(std::memory_order_relaxed) >= state::finishing)
            return;
        for (auto& err : errs)
            errors_.emplace_back(std::move(err));
        if (cancelled_.exchange(true, std::memory_order_acq_rel))
            return;
        listener = cancel_listener_;
    }
    SPDLOG_LOGGER_DEBUG(detail::logger(), "task '{}' ({}) cancelled while {}", name_, id_,
            to_string(get_state()));
    on_cancel();
    if (listener)
        listener();
}

void task::check_configurable(const char* what) const {
    if (state_.load(std::memory_order_relaxed) != state::initialized)
        throw std::logic_error(std::string("cannot ") + what + " of task '" + name_ +
                               "' after it was submitted");
}

void task::add_dependency(task_ptr dep) {
    if (!dep)
        throw std::invalid_argument("null dependency");
    if (dep.get() == this)
        throw std::invalid_argument("a task cannot depend on itself");
    std::lock_guard<std::mutex> lock(mutex_);
    check_configurable("add dependencies");
    dependencies_.emplace_back(std::move(dep));
}

void task::remove_dependency(const task_ptr& dep) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_configurable("remove dependencies");
    dependencies_.erase(
            std::remove(dependencies_.begin(), dependencies_.end(), dep), dependencies_.end());
}

std::vector<task_ptr> task::dependencies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dependencies_;
}

void task::add_condition(condition_ptr c) {
    if (!c)
        throw std::invalid_argument("null condition");
    std::lock_guard<std::mutex> lock(mutex_);
    check_configurable("add conditions");
    conditions_.emplace_back(std::move(c));
}

std::vector<condition_ptr> task::conditions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conditions_;
}

void task::add_observer(observer_ptr o) {
    if (!o)
        throw std::invalid_argument("null observer");
    std::lock_guard<std::mutex> lock(mutex_);
    check_configurable("add observers");
    observers_.emplace_back(std::move(o));
}

error_list task::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

bool task::has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !errors_.empty();
}

void task::produce(task_ptr t) {
    if (!t)
        throw std::invalid_argument("cannot produce a null task");
    std::vector<observer_ptr> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }
    SPDLOG_LOGGER_DEBUG(detail::logger(), "task '{}' ({}) produced task '{}' ({})", name_, id_,
            t->name(), t->id());
    for (auto& o : observers)
        detail::notify_observer(*this, "on_produce", [&] { o->on_produce(*this, t); });
}

void task::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return notified_; });
}

void task::finish(error_list errors) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cur = state_.load(std::memory_order_relaxed);
        if (cur >= state::finishing)
            throw double_finish(name_);
        if (cur != state::executing)
            throw std::logic_error("task '" + name_ + "' cannot finish while " + to_string(cur));
        state_.store(state::finishing, std::memory_order_release);
        for (auto& err : errors)
            errors_.emplace_back(std::move(err));
    }
    complete();
}

void task::finish(std::exception_ptr err) {
    error_list errs;
    if (err)
        errs.emplace_back(std::move(err));
    finish(std::move(errs));
}

finish_signal task::make_finish_signal() { return finish_signal{shared_from_this()}; }

void task::run() {
    OPFLOW_PROFILING_FUNCTION();
    OPFLOW_PROFILING_SET_DYNNAME(name_.c_str());
    std::vector<observer_ptr> observers;
    bool skip = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Cancelled while being dispatched: the work must not run
        if (state_.load(std::memory_order_relaxed) >= state::finishing)
            return;
        skip = cancelled_.load(std::memory_order_acquire);
        state_.store(skip ? state::finishing : state::executing, std::memory_order_release);
        if (!skip)
            observers = observers_;
    }
    if (skip) {
        SPDLOG_LOGGER_DEBUG(
                detail::logger(), "task '{}' ({}) cancelled before it could execute", name_, id_);
        complete();
        return;
    }

    SPDLOG_LOGGER_DEBUG(detail::logger(), "task '{}' ({}) executing", name_, id_);
    for (auto& o : observers)
        detail::notify_observer(*this, "on_start", [&] { o->on_start(*this); });

    try {
        execute();
    } catch (...) {
        on_execute_exception(std::current_exception());
    }
}

void task::on_execute_exception(std::exception_ptr ex) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load(std::memory_order_relaxed) == state::executing) {
            state_.store(state::finishing, std::memory_order_release);
            errors_.emplace_back(std::make_exception_ptr(execution_error(name_, ex)));
            ex = nullptr;
        }
    }
    if (ex) {
        // Nobody is listening anymore; the least we can do is to log it
        SPDLOG_LOGGER_ERROR(detail::logger(), "task '{}' ({}) threw after it finished: {}", name_,
                id_, describe(ex));
        return;
    }
    complete();
}

void task::complete() {
    std::vector<observer_ptr> observers;
    error_list errors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(state::finished, std::memory_order_release);
        observers.swap(observers_);
        errors = errors_;
        cancel_listener_ = nullptr;
    }
    SPDLOG_LOGGER_DEBUG(detail::logger(), "task '{}' ({}) finished with {} errors; cancelled={}",
            name_, id_, errors.size(), is_cancelled());

    for (auto& o : observers)
        detail::notify_observer(*this, "on_finish", [&] { o->on_finish(*this, errors); });

    std::vector<listener_fun> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notified_ = true;
        listeners.swap(finish_listeners_);
    }
    done_cv_.notify_all();
    for (auto& l : listeners)
        l();
}

const char* to_string(task::state s) noexcept {
    switch (s) {
    case task::state::initialized:
        return "initialized";
    case task::state::pending:
        return "pending";
    case task::state::evaluating_conditions:
        return "evaluating_conditions";
    case task::state::ready:
        return "ready";
    case task::state::executing:
        return "executing";
    case task::state::finishing:
        return "finishing";
    case task::state::finished:
        return "finished";
    }
    return "unknown";
}

void finish_signal::operator()(error_list errors) const {
    if (!task_)
        throw std::logic_error("empty finish signal");
    task_->finish(std::move(errors));
}

void finish_signal::operator()(std::exception_ptr err) const {
    if (!task_)
        throw std::logic_error("empty finish signal");
    task_->finish(std::move(err));
}

} // namespace v1
} // namespace opflow
