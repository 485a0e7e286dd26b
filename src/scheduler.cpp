#include "opflow/scheduler.hpp"
#include "opflow/condition.hpp"
#include "opflow/observer.hpp"
#include "opflow/exclusivity_controller.hpp"
#include "opflow/global_executor.hpp"
#include "opflow/log.hpp"
#include "opflow/profiling.hpp"
#include "opflow/detail/action_lane.hpp"
#include "opflow/detail/task_access.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace opflow {
inline namespace v1 {

void scheduler_delegate::will_submit(const task_ptr&) {}
void scheduler_delegate::did_finish(const task_ptr&, const error_list&) {}

namespace {

//! Returns the exclusivity categories of all the conditions of the task, sorted
std::vector<std::string> collect_categories(const task& t) {
    std::vector<std::string> res;
    for (const auto& c : t.conditions()) {
        auto cats = c->exclusivity_categories();
        res.insert(res.end(), cats.begin(), cats.end());
    }
    std::sort(res.begin(), res.end());
    res.erase(std::unique(res.begin(), res.end()), res.end());
    return res;
}

} // namespace

//! The implementation details of a scheduler.
//! All the admission state is touched only from `lane_` actions.
struct scheduler::impl : std::enable_shared_from_this<impl> {
    //! The admission data of a tracked task
    struct entry {
        task_ptr task_;
        //! The exclusivity categories claimed by the task
        std::vector<std::string> categories_;
        //! Number of dependencies not yet finished, plus one while wiring them
        int pending_deps_{0};
        //! Number of conditions that haven't reported yet
        int pending_verdicts_{0};
        //! True if the task is at the head of all its exclusivity categories
        bool eligible_{true};
        //! True if the task was added to the ready queue
        bool queued_{false};
        //! True if the task was given to the executor
        bool dispatched_{false};
        //! True if we finished the task without executing it
        bool finishing_{false};
    };

    //! Observer attached to every task submitted to the scheduler
    struct tracking_observer : observer {
        explicit tracking_observer(std::shared_ptr<impl> owner)
            : owner_(std::move(owner)) {}

        void on_produce(task&, const task_ptr& produced) override { owner_->submit(produced); }
        void on_finish(task& t, const error_list&) override { owner_->on_finished(t); }

        std::shared_ptr<impl> owner_;
    };

    const std::string name_;
    const int max_concurrent_;
    executor_t executor_;
    std::shared_ptr<exclusivity_controller> exclusivity_;
    std::atomic<bool> suspended_;

    std::shared_ptr<scheduler_delegate> delegate_;
    except_fun_t except_fun_;
    //! Protects `except_fun_`
    std::mutex except_fun_mutex_;

    //! Tracked tasks, by id; ids are never reused
    std::unordered_map<uint64_t, entry> entries_;
    //! Tasks ready to be executed, in the order they became eligible
    std::deque<uint64_t> ready_queue_;
    //! Tasks whose dependencies finished while the scheduler was suspended
    std::vector<uint64_t> awaiting_resume_;
    //! Number of tasks given to the executor and not yet finished
    int running_{0};

    //! Protects `num_tracked_`
    mutable std::mutex idle_mutex_;
    mutable std::condition_variable idle_cv_;
    int num_tracked_{0};

    //! Serializes all the admission decisions
    detail::action_lane lane_;

    explicit impl(scheduler_options opts)
        : name_(std::move(opts.name_))
        , max_concurrent_(opts.max_concurrent_)
        , executor_(std::move(opts.executor_))
        , exclusivity_(std::move(opts.exclusivity_))
        , suspended_(opts.start_suspended_)
        , lane_([this](std::exception_ptr ex) { report_exception(std::move(ex)); }) {
        if (!executor_)
            executor_ = global_executor{};
        if (!exclusivity_)
            exclusivity_ = std::make_shared<exclusivity_controller>();
    }

    std::shared_ptr<scheduler_delegate> delegate() const { return std::atomic_load(&delegate_); }

    void report_exception(std::exception_ptr ex) {
        except_fun_t handler;
        {
            std::lock_guard<std::mutex> lock(except_fun_mutex_);
            handler = except_fun_;
        }
        if (handler) {
            handler(std::move(ex));
            return;
        }
        SPDLOG_LOGGER_ERROR(
                detail::logger(), "scheduler '{}': unhandled error: {}", name_, describe(ex));
    }

    //! Synchronous part of the submission
    bool submit(task_ptr t, bool quiet = false) {
        OPFLOW_PROFILING_FUNCTION();
        if (!t) {
            SPDLOG_LOGGER_WARN(detail::logger(), "scheduler '{}': ignoring null task", name_);
            return false;
        }
        if (!detail::task_access::try_submit(*t)) {
            if (!quiet)
                SPDLOG_LOGGER_WARN(detail::logger(),
                        "scheduler '{}': rejecting task '{}' ({}); it was already submitted", name_,
                        t->name(), t->id());
            return false;
        }
        SPDLOG_LOGGER_TRACE(
                detail::logger(), "scheduler '{}': accepted '{}' ({})", name_, t->name(), t->id());
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            num_tracked_++;
        }
        if (auto d = delegate()) {
            try {
                d->will_submit(t);
            } catch (...) {
                report_exception(std::current_exception());
            }
        }

        // Dependencies required by conditions are submitted before the guarded task
        for (const auto& c : t->conditions()) {
            task_ptr dep;
            try {
                dep = c->dependency_for(t);
            } catch (...) {
                auto err = condition_failed(c->name(), std::current_exception());
                detail::task_access::cancel_with_errors(*t, {std::make_exception_ptr(err)});
                continue;
            }
            if (!dep)
                continue;
            detail::task_access::add_internal_dependency(*t, dep);
            // The dependency may be shared with other tasks, and already submitted
            submit(dep, true);
        }

        auto p_this = shared_from_this();
        const uint64_t key = t->id();
        detail::task_access::add_internal_observer(*t, std::make_shared<tracking_observer>(p_this));
        detail::task_access::set_cancel_listener(*t, [p_this, key]() {
            p_this->lane_.execute([p_this, key]() { p_this->on_cancelled(key); });
        });
        lane_.execute([p_this, t = std::move(t)]() { p_this->track(t); });
        return true;
    }

    //! Posts an action to the lane, related to the given task
    void post(uint64_t key, void (impl::*action)(uint64_t)) {
        auto p_this = shared_from_this();
        lane_.execute([p_this, key, action]() { ((*p_this).*action)(key); });
    }

    entry* find_entry(uint64_t key) {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    void track(const task_ptr& t) {
        OPFLOW_PROFILING_FUNCTION();
        const uint64_t key = t->id();
        auto& e = entries_[key];
        e.task_ = t;
        e.categories_ = collect_categories(*t);
        if (!e.categories_.empty()) {
            auto p_this = shared_from_this();
            e.eligible_ = exclusivity_->acquire(e.categories_, t,
                    [p_this, key]() { p_this->post(key, &impl::on_exclusivity_granted); });
        }

        if (t->is_cancelled()) {
            finish_unstarted(e);
            return;
        }

        auto deps = t->dependencies();
        e.pending_deps_ = static_cast<int>(deps.size()) + 1;
        for (const auto& dep : deps) {
            auto p_this = shared_from_this();
            detail::task_access::when_finished(
                    *dep, [p_this, key]() { p_this->post(key, &impl::on_dependency_finished); });
        }
        on_dependency_finished(key);
    }

    void on_dependency_finished(uint64_t key) {
        entry* e = find_entry(key);
        if (!e || e->finishing_ || --e->pending_deps_ > 0)
            return;
        if (e->task_->is_cancelled()) {
            finish_unstarted(*e);
            return;
        }
        if (suspended_.load()) {
            awaiting_resume_.push_back(key);
            return;
        }
        start_evaluation(*e);
    }

    void start_evaluation(entry& e) {
        OPFLOW_PROFILING_FUNCTION();
        const task_ptr t = e.task_;
        detail::task_access::set_state(*t, task::state::evaluating_conditions);
        auto conds = t->conditions();
        if (conds.empty()) {
            on_conditions_satisfied(e);
            return;
        }

        e.pending_verdicts_ = static_cast<int>(conds.size());
        auto p_this = shared_from_this();
        const uint64_t key = t->id();
        for (size_t i = 0; i < conds.size(); i++) {
            condition::completion done{conds[i]->name(), [p_this, key, i](std::exception_ptr r) {
                                           p_this->lane_.execute([p_this, key, i, r]() {
                                               p_this->on_verdict(key, i, r);
                                           });
                                       }};
            try {
                conds[i]->evaluate(t, done);
            } catch (...) {
                done.report_if_pending(std::current_exception());
            }
        }
    }

    void on_verdict(uint64_t key, size_t idx, std::exception_ptr verdict) {
        entry* e = find_entry(key);
        if (!e || e->finishing_)
            return;
        // The first failure vetoes the task; the verdicts still pending are ignored
        if (verdict) {
            auto conds = e->task_->conditions();
            auto err = condition_failed(conds[idx]->name(), std::move(verdict));
            SPDLOG_LOGGER_DEBUG(detail::logger(),
                    "scheduler '{}': condition '{}' of '{}' ({}) failed", name_,
                    conds[idx]->name(), e->task_->name(), e->task_->id());
            detail::task_access::cancel_with_errors(*e->task_, {std::make_exception_ptr(err)});
            finish_unstarted(*e);
            return;
        }
        if (--e->pending_verdicts_ > 0)
            return;

        if (e->task_->is_cancelled()) {
            finish_unstarted(*e);
            return;
        }
        on_conditions_satisfied(*e);
    }

    void on_conditions_satisfied(entry& e) {
        detail::task_access::set_state(*e.task_, task::state::ready);
        if (e.eligible_)
            enqueue_ready(e);
        pump();
    }

    void on_exclusivity_granted(uint64_t key) {
        entry* e = find_entry(key);
        if (!e)
            return;
        e->eligible_ = true;
        if (!e->finishing_ && !e->queued_ && e->task_->get_state() == task::state::ready) {
            enqueue_ready(*e);
            pump();
        }
    }

    void enqueue_ready(entry& e) {
        e.queued_ = true;
        ready_queue_.push_back(e.task_->id());
    }

    //! Dispatch as many ready tasks as the constraints allow
    void pump() {
        while (!suspended_.load() && !ready_queue_.empty() &&
                (max_concurrent_ <= 0 || running_ < max_concurrent_)) {
            uint64_t key = ready_queue_.front();
            ready_queue_.pop_front();
            entry* e = find_entry(key);
            if (!e || e->finishing_ || e->dispatched_)
                continue;
            dispatch(*e);
        }
    }

    void dispatch(entry& e) {
        OPFLOW_PROFILING_FUNCTION();
        e.dispatched_ = true;
        running_++;
        task_ptr t = e.task_;
        SPDLOG_LOGGER_TRACE(detail::logger(), "scheduler '{}': dispatching '{}' ({})", name_,
                t->name(), t->id());
        try {
            executor_([t]() { detail::task_access::run(*t); });
        } catch (...) {
            auto ex = std::current_exception();
            report_exception(ex);
            // The task will never run, but it still needs to finish
            detail::task_access::finish_unstarted(*t, {ex});
        }
    }

    void finish_unstarted(entry& e) {
        e.finishing_ = true;
        detail::task_access::finish_unstarted(*e.task_);
    }

    void on_cancelled(uint64_t key) {
        entry* e = find_entry(key);
        if (!e || e->finishing_ || e->dispatched_)
            return;
        // Verdicts that arrive later are ignored
        finish_unstarted(*e);
    }

    //! Called from the finishing thread, after the task is finished
    void on_finished(task& t) {
        auto cats = collect_categories(t);
        if (!cats.empty())
            exclusivity_->release(cats, t.shared_from_this());
        post(t.id(), &impl::untrack);
    }

    void untrack(uint64_t key) {
        auto it = entries_.find(key);
        if (it == entries_.end())
            return;
        task_ptr t = std::move(it->second.task_);
        if (it->second.dispatched_)
            running_--;
        entries_.erase(it);

        if (auto d = delegate()) {
            try {
                d->did_finish(t, t->errors());
            } catch (...) {
                report_exception(std::current_exception());
            }
        }
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            num_tracked_--;
        }
        idle_cv_.notify_all();
        pump();
    }

    void cancel_all() {
        auto p_this = shared_from_this();
        lane_.execute([p_this]() {
            std::vector<task_ptr> to_cancel;
            to_cancel.reserve(p_this->entries_.size());
            for (auto& kv : p_this->entries_)
                to_cancel.push_back(kv.second.task_);
            SPDLOG_LOGGER_DEBUG(detail::logger(), "scheduler '{}': cancelling {} tasks",
                    p_this->name_, to_cancel.size());
            for (auto& t : to_cancel)
                t->cancel();
        });
    }

    void on_resumed() {
        if (suspended_.load())
            return;
        std::vector<uint64_t> waiting;
        waiting.swap(awaiting_resume_);
        for (uint64_t key : waiting) {
            entry* e = find_entry(key);
            if (e && !e->finishing_)
                start_evaluation(*e);
        }
        pump();
    }
};

scheduler::scheduler(scheduler_options opts)
    : impl_(std::make_shared<impl>(std::move(opts))) {}

scheduler::~scheduler() { impl_->cancel_all(); }

bool scheduler::submit(task_ptr t) { return impl_->submit(std::move(t)); }

int scheduler::submit(const std::vector<task_ptr>& tasks) {
    int res = 0;
    for (const auto& t : tasks)
        if (impl_->submit(t))
            res++;
    return res;
}

void scheduler::cancel_all() { impl_->cancel_all(); }

void scheduler::suspend() { impl_->suspended_.store(true); }

void scheduler::resume() {
    impl_->suspended_.store(false);
    auto p = impl_;
    p->lane_.execute([p]() { p->on_resumed(); });
}

bool scheduler::is_suspended() const { return impl_->suspended_.load(); }

int scheduler::num_tracked() const {
    std::lock_guard<std::mutex> lock(impl_->idle_mutex_);
    return impl_->num_tracked_;
}

bool scheduler::wait_for_idle(std::chrono::nanoseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->idle_mutex_);
    return impl_->idle_cv_.wait_for(lock, timeout, [this] { return impl_->num_tracked_ == 0; });
}

void scheduler::set_delegate(std::shared_ptr<scheduler_delegate> delegate) {
    std::atomic_store(&impl_->delegate_, std::move(delegate));
}

void scheduler::set_exception_handler(except_fun_t except_fun) {
    std::lock_guard<std::mutex> lock(impl_->except_fun_mutex_);
    impl_->except_fun_ = std::move(except_fun);
}

const std::string& scheduler::name() const { return impl_->name_; }

const std::shared_ptr<exclusivity_controller>& scheduler::exclusivity() const {
    return impl_->exclusivity_;
}

} // namespace v1
} // namespace opflow
