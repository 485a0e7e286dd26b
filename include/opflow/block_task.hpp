#pragma once

#include "task.hpp"

#include <functional>
#include <string>

namespace opflow {

inline namespace v1 {

/**
 * @brief      A task built from a functor.
 *
 * Two forms are supported:
 *  - a functor taking no arguments; the task finishes as soon as the functor returns
 *  - a functor taking a @ref finish_signal; the functor (or someone it hands the signal to) must
 *    call the signal exactly once, possibly later and from another thread
 *
 * An exception thrown by the functor finishes the task with an @ref execution_error.
 *
 * Example:
 *      auto t = std::make_shared<opflow::block_task>([] { do_work(); });
 */
class block_task : public task {
public:
    //! Type of functor for synchronous blocks
    using sync_block = std::function<void()>;
    //! Type of functor for blocks that signal their own completion
    using async_block = std::function<void(finish_signal)>;

    explicit block_task(sync_block f, std::string name = "Block");
    explicit block_task(async_block f, std::string name = "Block");

protected:
    void execute() override;

private:
    sync_block sync_fun_;
    async_block async_fun_;
};

} // namespace v1
} // namespace opflow
