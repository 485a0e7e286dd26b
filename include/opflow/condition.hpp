#pragma once

#include "task.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace opflow {

inline namespace v1 {

/**
 * @brief      An asynchronous precondition of a task.
 *
 * A condition is attached to a task before the task is submitted. It can:
 *  - inject a dependency: a task that must finish before the condition is evaluated (e.g., a task
 *    that asks the user for a permission), see @ref dependency_for()
 *  - veto the execution of the task, by reporting a failure from @ref evaluate()
 *  - place the task in one or more mutual exclusion categories, see @ref exclusivity_categories()
 *
 * The evaluation starts after all the dependencies of the task are finished. The result is
 * reported asynchronously, through the @ref completion object; the evaluation must not block the
 * calling thread while waiting for slow resources.
 *
 * If any of the conditions of a task fails, the task is cancelled and finished without executing;
 * its errors will contain one @ref condition_failed for each failed condition.
 *
 * The name of the condition is used as its category in error reporting.
 *
 * @see task::add_condition(), negated_condition, silent_condition, mutually_exclusive_condition
 */
class condition {
public:
    //! Type of the function that receives the verdict; a null error means "satisfied"
    using result_function = std::function<void(std::exception_ptr)>;

    /**
     * @brief      Single-shot handle through which a condition reports its verdict.
     *
     * Copies of a completion refer to the same verdict; only one report is allowed across all the
     * copies. Reporting a second time throws @ref double_completion.
     *
     * If all the copies are destroyed without reporting anything, a failure is reported, so that
     * the guarded task doesn't wait forever.
     */
    class completion {
    public:
        //! Constructs an empty completion; reporting through it throws
        completion() = default;

        //! Constructs a completion that passes the verdict to `on_result`
        completion(std::string condition_name, result_function on_result);

        //! Reports that the condition is satisfied
        void satisfied() const { report(nullptr); }
        //! Reports that the condition failed with the given error
        void failed(std::exception_ptr err) const;
        //! Reports the verdict; a null error means "satisfied"
        void operator()(std::exception_ptr result) const { report(std::move(result)); }

        //! Reports the verdict if none was reported so far; returns false otherwise
        bool report_if_pending(std::exception_ptr result) const noexcept;

        //! Checks whether a verdict was reported
        bool is_completed() const noexcept;

    private:
        struct state;
        std::shared_ptr<state> state_;

        void report(std::exception_ptr result) const;
    };

    //! Constructs a condition with the given name/category
    explicit condition(std::string name);
    virtual ~condition();

    condition(const condition&) = delete;
    condition& operator=(const condition&) = delete;

    //! The name of the condition; used as the category of the errors it reports
    const std::string& name() const noexcept { return name_; }

    //! The mutual exclusion categories in which this condition places the guarded task
    virtual std::vector<std::string> exclusivity_categories() const { return {}; }

    /**
     * @brief      Returns a task that needs to finish before this condition can be evaluated
     *
     * @param      t     The task guarded by this condition
     *
     * Called once, when the guarded task is submitted. The returned task becomes a dependency of
     * the guarded task and is submitted to the same scheduler. Returns null if no such task is
     * needed, which is the default.
     */
    virtual task_ptr dependency_for(const task_ptr& t);

    /**
     * @brief      Evaluates the condition for the given task
     *
     * @param      t     The task guarded by this condition
     * @param      done  The handle through which the verdict must be reported, exactly once
     *
     * Can report the verdict synchronously, or later from any thread. Throwing from here counts as
     * a failure, if no verdict was reported before.
     */
    virtual void evaluate(const task_ptr& t, completion done) = 0;

private:
    const std::string name_;
};

} // namespace v1
} // namespace opflow
