#include "opflow/condition.hpp"
#include "opflow/errors.hpp"
#include "opflow/log.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace opflow {
inline namespace v1 {

//! The state shared by all the copies of a completion
struct condition::completion::state {
    std::string condition_name_;
    result_function on_result_;
    std::atomic<bool> completed_{false};

    state(std::string name, result_function on_result)
        : condition_name_(std::move(name))
        , on_result_(std::move(on_result)) {}

    ~state() {
        if (completed_.load(std::memory_order_acquire))
            return;
        // The condition dropped the completion; report it as a failure so that the task can move on
        SPDLOG_LOGGER_WARN(detail::logger(),
                "condition '{}' released its completion without reporting a verdict",
                condition_name_);
        try {
            on_result_(std::make_exception_ptr(verdict_dropped(condition_name_)));
        } catch (const std::exception& e) {
            SPDLOG_LOGGER_ERROR(detail::logger(), "cannot report verdict of condition '{}': {}",
                    condition_name_, e.what());
        }
    }
};

condition::completion::completion(std::string condition_name, result_function on_result)
    : state_(std::make_shared<state>(std::move(condition_name), std::move(on_result))) {}

void condition::completion::failed(std::exception_ptr err) const {
    if (!err)
        err = std::make_exception_ptr(std::runtime_error("unspecified condition failure"));
    report(std::move(err));
}

void condition::completion::report(std::exception_ptr result) const {
    if (!state_)
        throw std::logic_error("reporting through an empty completion");
    if (state_->completed_.exchange(true, std::memory_order_acq_rel))
        throw double_completion(state_->condition_name_);
    state_->on_result_(std::move(result));
}

bool condition::completion::report_if_pending(std::exception_ptr result) const noexcept {
    if (!state_ || state_->completed_.exchange(true, std::memory_order_acq_rel))
        return false;
    try {
        state_->on_result_(std::move(result));
    } catch (const std::exception& e) {
        SPDLOG_LOGGER_ERROR(detail::logger(), "cannot report verdict of condition '{}': {}",
                state_->condition_name_, e.what());
    }
    return true;
}

bool condition::completion::is_completed() const noexcept {
    return state_ && state_->completed_.load(std::memory_order_acquire);
}

condition::condition(std::string name)
    : name_(std::move(name)) {}

condition::~condition() = default;

task_ptr condition::dependency_for(const task_ptr&) { return nullptr; }

} // namespace v1
} // namespace opflow
