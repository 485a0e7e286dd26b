#pragma once

#include "condition.hpp"

namespace opflow {

inline namespace v1 {

/**
 * @brief      Condition that fails if any dependency of the task failed.
 *
 * A dependency failed if it finished with errors, or if it was cancelled. By default, a task runs
 * after its dependencies regardless of their outcome; this condition changes that.
 *
 * The failure is reported as @ref failed_dependencies, containing the names of the failed tasks.
 */
class no_failed_dependencies_condition : public condition {
public:
    no_failed_dependencies_condition();

    void evaluate(const task_ptr& t, completion done) override;
};

} // namespace v1
} // namespace opflow
