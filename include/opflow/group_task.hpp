#pragma once

#include "task.hpp"
#include "scheduler.hpp"

#include <memory>
#include <string>
#include <vector>

namespace opflow {

inline namespace v1 {

/**
 * @brief      A task that runs a set of child tasks, and finishes when all of them are finished.
 *
 * The children are submitted to a private scheduler, which starts suspended; they don't start
 * until the group itself starts executing. Dependencies between the children, their conditions and
 * their exclusivity categories are honored as in any other scheduler. Tasks produced by the
 * children, and the dependencies added by their conditions, are children of the group as well.
 *
 * The group finishes once no child is left unfinished. The errors of the group are the errors of
 * all the children, in the order in which the children finished. A failed or cancelled child does
 * not cancel the group or its siblings.
 *
 * Cancelling the group cancels all its children; the group finishes after all the children have
 * finished.
 *
 * Example:
 *      auto group = std::make_shared<opflow::group_task>(std::vector<opflow::task_ptr>{t1, t2});
 *      sched.submit(group);
 *
 * @see scheduler, task
 */
class group_task : public task {
public:
    /**
     * @brief      Constructs a group with the given children
     *
     * @param      children  The initial children of the group
     * @param      name      The name of the group
     * @param      opts      Options for the private scheduler; it always starts suspended
     */
    explicit group_task(std::vector<task_ptr> children = {}, std::string name = "Group",
            scheduler_options opts = {});
    ~group_task() override;

    /**
     * @brief      Adds a new child to the group
     *
     * @param      child  The task to be added
     *
     * @return     True if the child was accepted; false if it was already submitted somewhere
     *
     * Children can be added before the group starts, or while it's executing. Throws
     * std::logic_error if the group is already done.
     */
    bool add_child(task_ptr child);
    //! Adds multiple children; returns the number of accepted children
    int add_children(const std::vector<task_ptr>& children);

    //! The number of children that are not yet finished
    int num_unfinished_children() const;

protected:
    void execute() override;
    void on_cancel() override;

private:
    class children_tracker;

    //! Keeps track of the unfinished children; shared with the private scheduler
    std::shared_ptr<children_tracker> tracker_;
    //! The scheduler on which the children run
    scheduler scheduler_;
};

} // namespace v1
} // namespace opflow
