#pragma once

#include "condition.hpp"

namespace opflow {

inline namespace v1 {

/**
 * @brief      Inverts the verdict of another condition.
 *
 * Fails with @ref negation_failed when the wrapped condition is satisfied, and is satisfied when
 * the wrapped condition fails. The dependency and the exclusivity categories of the wrapped
 * condition are kept.
 */
class negated_condition : public condition {
public:
    explicit negated_condition(condition_ptr inner);

    std::vector<std::string> exclusivity_categories() const override;
    task_ptr dependency_for(const task_ptr& t) override;
    void evaluate(const task_ptr& t, completion done) override;

private:
    condition_ptr inner_;
};

/**
 * @brief      Suppresses the dependency of another condition.
 *
 * Useful for conditions that would prompt the user (e.g., asking for a permission) when we only
 * want to check the current status. The verdict of the wrapped condition, including its error, is
 * kept as is.
 */
class silent_condition : public condition {
public:
    explicit silent_condition(condition_ptr inner);

    std::vector<std::string> exclusivity_categories() const override;
    void evaluate(const task_ptr& t, completion done) override;

private:
    condition_ptr inner_;
};

/**
 * @brief      Places the guarded task in a mutual exclusion category.
 *
 * No two tasks with the same category execute at the same time, within the scope of one
 * exclusivity controller; they execute in the order in which they were submitted.
 *
 * Can wrap another condition, in which case it evaluates as that condition. Without a wrapped
 * condition it's always satisfied.
 *
 * @see exclusivity_controller
 */
class mutually_exclusive_condition : public condition {
public:
    explicit mutually_exclusive_condition(std::string category, condition_ptr inner = {});

    //! The category added by this condition
    const std::string& category() const noexcept { return category_; }

    std::vector<std::string> exclusivity_categories() const override;
    task_ptr dependency_for(const task_ptr& t) override;
    void evaluate(const task_ptr& t, completion done) override;

private:
    std::string category_;
    condition_ptr inner_;
};

} // namespace v1
} // namespace opflow
