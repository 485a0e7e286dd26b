#pragma once

#include "../executor_type.hpp"
#include "../except_fun_type.hpp"
#include "../low_level/spin_backoff.hpp"
#include "concurrent_queue.hpp"

#include <atomic>

namespace opflow {
namespace detail {

/**
 * @brief      Runs actions one at a time, in the order in which they were posted.
 *
 * Actions can be posted from any thread. If no action is running, the posting thread runs the
 * action, and then keeps running the actions posted in the meantime by other threads, until none
 * is left. Otherwise, the action is queued and the function returns immediately.
 *
 * The state touched only by the actions of one lane needs no further synchronization.
 *
 * Exceptions thrown by the actions are passed to the given exception handler.
 */
class action_lane {
public:
    explicit action_lane(except_fun_t except_fun)
        : except_fun_(std::move(except_fun)) {}

    action_lane(const action_lane&) = delete;
    action_lane& operator=(const action_lane&) = delete;

    //! Posts an action to the lane
    void execute(work_function f) {
        actions_.push(std::move(f));
        // If there were no other actions, this thread needs to drain the lane
        if (count_++ == 0)
            drain();
    }

private:
    //! The actions that wait to be executed
    concurrent_queue<work_function> actions_;
    //! The number of actions posted and not yet executed
    std::atomic<int> count_{0};
    //! Called when an action throws
    except_fun_t except_fun_;

    void drain() {
        do {
            run_one();
        } while (--count_ > 0);
    }

    void run_one() {
        work_function f;
        // Pushes happen before increments, so there is always an action to pop here
        spin_backoff spinner;
        while (!actions_.try_pop(f))
            spinner.pause();
        try {
            f();
        } catch (...) {
            except_fun_(std::current_exception());
        }
    }
};

} // namespace detail
} // namespace opflow
