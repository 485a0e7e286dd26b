#include "opflow/no_failed_dependencies.hpp"

namespace opflow {
inline namespace v1 {

no_failed_dependencies_condition::no_failed_dependencies_condition()
    : condition("NoFailedDependencies") {}

void no_failed_dependencies_condition::evaluate(const task_ptr& t, completion done) {
    std::vector<std::string> failed;
    for (const auto& dep : t->dependencies()) {
        if (dep->is_cancelled() || dep->has_errors())
            failed.emplace_back(dep->name());
    }
    if (failed.empty())
        done.satisfied();
    else
        done.failed(std::make_exception_ptr(failed_dependencies(std::move(failed))));
}

} // namespace v1
} // namespace opflow
