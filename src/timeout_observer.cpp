#include "opflow/timeout_observer.hpp"
#include "opflow/log.hpp"
#include "opflow/detail/exec_context_if.hpp"
#include "opflow/detail/library_data.hpp"

#include <spdlog/spdlog.h>

namespace opflow {
inline namespace v1 {

timeout_observer::timeout_observer(std::chrono::nanoseconds timeout)
    : timeout_(timeout) {}

void timeout_observer::on_start(task& t) {
    std::weak_ptr<task> weak_task = t.weak_from_this();
    auto timeout = timeout_;
    auto on_timeout = [weak_task, timeout]() {
        auto p = weak_task.lock();
        if (!p || p->get_state() >= task::state::finishing)
            return;
        SPDLOG_LOGGER_DEBUG(detail::logger(), "task '{}' ({}) timed out", p->name(), p->id());
        p->cancel_with_error(std::make_exception_ptr(task_timed_out(timeout)));
    };
    detail::do_schedule_after(detail::get_exec_context(), timeout_, std::move(on_timeout));
}

} // namespace v1
} // namespace opflow
