#include "opflow/delay_task.hpp"
#include "opflow/log.hpp"
#include "opflow/detail/exec_context_if.hpp"
#include "opflow/detail/library_data.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

#include <algorithm>

namespace opflow {
inline namespace v1 {

namespace {
std::string delay_name(std::chrono::nanoseconds delay) {
    return fmt::format("Delay for {} seconds", std::chrono::duration<double>(delay).count());
}
std::string delay_name(std::chrono::system_clock::time_point until) {
    auto t = std::chrono::system_clock::to_time_t(until);
    return fmt::format("Delay until {:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(t));
}
} // namespace

delay_task::delay_task(std::chrono::nanoseconds delay, tag)
    : task(delay_name(delay))
    , delay_(delay) {}

delay_task::delay_task(std::chrono::system_clock::time_point until)
    : task(delay_name(until))
    , until_(until)
    , absolute_(true) {}

std::chrono::nanoseconds delay_task::remaining() const {
    using namespace std::chrono;
    if (fired_.load())
        return nanoseconds{0};
    nanoseconds res{0};
    if (absolute_) {
        res = duration_cast<nanoseconds>(until_ - system_clock::now());
    } else {
        auto started = started_at_.load();
        if (started == 0) {
            res = delay_;
        } else {
            steady_clock::time_point start{steady_clock::duration(started)};
            res = delay_ - duration_cast<nanoseconds>(steady_clock::now() - start);
        }
    }
    return std::max(res, nanoseconds{0});
}

void delay_task::execute() {
    // Avoid 0, as it means "not started"
    started_at_.store(std::max<std::chrono::steady_clock::rep>(
            std::chrono::steady_clock::now().time_since_epoch().count(), 1));
    auto left = remaining();
    if (left <= std::chrono::nanoseconds{0}) {
        fire();
        return;
    }

    SPDLOG_LOGGER_TRACE(detail::logger(), "task '{}' ({}) waiting for {} ns", name(), id(),
            left.count());
    std::weak_ptr<task> weak_self = weak_from_this();
    detail::do_schedule_after(detail::get_exec_context(), left, [weak_self]() {
        if (auto self = std::static_pointer_cast<delay_task>(weak_self.lock()))
            self->fire();
    });
}

void delay_task::on_cancel() {
    if (get_state() == state::executing)
        fire();
}

void delay_task::fire() {
    if (fired_.exchange(true))
        return;
    finish();
}

} // namespace v1
} // namespace opflow
