#pragma once

#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <stdexcept>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Configuration data for the opflow library
 *
 * Store here all the parameters needed to be passed to opflow when initializing. Any parameters
 * that are left unfilled will have reasonable defaults.
 */
struct init_data {
    //! The number of workers we need to create in the worker pool; 0 = num cores available
    int num_workers_{0};
    //! Function to be called at the start of each worker thread.
    //! Use this if you want to do things like setting thread priority, affinity, etc.
    std::function<void()> worker_start_fun_;
    //! The logger to be used by the library; if null, a stderr logger named "opflow" is used
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief      Initializes the opflow library.
 *
 * @param      config  The configuration to be passed to the library; optional.
 *
 * This will start the worker pool and the timer thread with the given parameters. If the library
 * is already initialized this will throw an @ref already_initialized exception.
 *
 * If this is not explicitly called the library will be initialized with default settings the first
 * time that a task needs to be executed on the global executor.
 *
 * @see        shutdown(), is_initialized(), already_initialized
 */
void init(const init_data& config = {});

/**
 * @brief      Exception thrown when attempting to initialize the library more than once.
 *
 * @see init(), is_initialized()
 */
struct already_initialized : std::runtime_error {
    already_initialized()
        : runtime_error("already initialized") {}
};

//! Determines if the library is initialized.
bool is_initialized();

/**
 * @brief      Shuts down the opflow library.
 *
 * Stops the worker threads and the timer thread, and drops the work that is still enqueued. The
 * library is destroyed automatically at the end of the program, so this is not necessarily needed;
 * unit tests use it to start from a clean state.
 *
 * @warning    It is forbidden to shutdown the library while it's still in use. Pending timers are
 *             dropped, so delay tasks that are waiting on them will never finish.
 */
void shutdown();

} // namespace v1
} // namespace opflow
