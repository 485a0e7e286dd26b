#include "opflow/observer.hpp"

namespace opflow {
inline namespace v1 {

void observer::on_start(task&) {}
void observer::on_produce(task&, const task_ptr&) {}
void observer::on_finish(task&, const error_list&) {}

} // namespace v1
} // namespace opflow
