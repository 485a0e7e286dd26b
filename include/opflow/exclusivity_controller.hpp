#pragma once

#include "task.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Keeps the order of the tasks that share mutual exclusion categories.
 *
 * For each category, the controller keeps the sequence of tasks that claimed it, in the order of
 * the claims. Only the head of a sequence may execute. A task with multiple categories may execute
 * only when it's at the head of all its sequences.
 *
 * All the categories of a task are claimed at once, under one lock; therefore all the sequences
 * agree on the relative order of any two tasks, and two tasks cannot wait on each other.
 *
 * A controller can be shared by multiple schedulers, to extend mutual exclusion across them.
 *
 * Thread-safe.
 *
 * @see mutually_exclusive_condition, scheduler_options
 */
class exclusivity_controller {
public:
    //! Function called when a task becomes eligible to execute
    using grant_function = std::function<void()>;

    exclusivity_controller() = default;

    exclusivity_controller(const exclusivity_controller&) = delete;
    exclusivity_controller& operator=(const exclusivity_controller&) = delete;

    /**
     * @brief      Adds the task at the end of the sequences of the given categories
     *
     * @param      categories  The categories claimed by the task
     * @param      t           The task
     * @param      on_grant    Called if the task becomes eligible later
     *
     * @return     True if the task is immediately eligible (head of all its categories)
     *
     * If the task is not immediately eligible, `on_grant` is called exactly once, when the task
     * becomes eligible, outside of any controller lock.
     *
     * A task can be added only once. An empty set of categories makes the task eligible.
     */
    bool acquire(
            const std::vector<std::string>& categories, const task_ptr& t, grant_function on_grant);
    //! @overload
    bool acquire(const std::string& category, const task_ptr& t, grant_function on_grant);

    /**
     * @brief      Removes the task from the sequences of the given categories
     *
     * @param      categories  The categories to be released
     * @param      t           The task
     *
     * Normally, the released task is the head of its sequences; a task that finished without
     * executing can be released from any position. Tasks that become eligible are granted.
     */
    void release(const std::vector<std::string>& categories, const task_ptr& t);
    //! @overload
    void release(const std::string& category, const task_ptr& t);

    //! Checks whether the task is at the head of all the sequences it belongs to
    bool is_eligible(const task_ptr& t) const;

    //! Returns the tasks that claimed the given category, in order
    std::vector<task_ptr> holders(const std::string& category) const;

    //! Returns the number of categories with at least one task
    int num_categories() const;

private:
    //! A task that claimed some categories
    struct claimant {
        task_ptr task_;
        std::vector<std::string> categories_;
        grant_function on_grant_;
        bool granted_{false};
    };

    mutable std::mutex mutex_;
    //! For each category, the claiming tasks, in order
    std::unordered_map<std::string, std::deque<const task*>> sequences_;
    //! The data for each claiming task
    std::unordered_map<const task*, claimant> claimants_;

    //! Checks if the given claimant is the head of all its sequences; expects the lock to be held
    bool is_head_of_all(const task* t, const claimant& c) const;
};

} // namespace v1
} // namespace opflow
