#pragma once

#include "../executor_type.hpp"

#include <chrono>

namespace opflow {
namespace detail {

class exec_context;

// Free-function interface to the execution context, so that users of it don't need to see the
// full class definition.

void do_enqueue(exec_context& ctx, work_function&& f);
void do_schedule_after(exec_context& ctx, std::chrono::nanoseconds delay, work_function&& f);

int num_worker_threads(const exec_context& ctx);
bool is_active(const exec_context& ctx);
int num_active_tasks(const exec_context& ctx);
int num_pending_timers(const exec_context& ctx);

} // namespace detail
} // namespace opflow
