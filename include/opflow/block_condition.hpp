#pragma once

#include "condition.hpp"

#include <functional>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Condition given by a predicate.
 *
 * The predicate is called when the condition is evaluated; returning false fails the condition
 * with @ref block_condition_failed. An exception thrown by the predicate is reported as the
 * failure.
 */
class block_condition : public condition {
public:
    using predicate = std::function<bool()>;

    block_condition(std::string name, predicate pred);

    void evaluate(const task_ptr& t, completion done) override;

private:
    predicate pred_;
};

} // namespace v1
} // namespace opflow
