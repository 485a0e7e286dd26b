#pragma once

#include "../detail/platform.hpp"

#include <type_traits>

#if !OPFLOW_PLATFORM_LINUX
#include <condition_variable>
#include <mutex>
#endif

namespace opflow {

inline namespace v1 {

/**
 * @brief      A semaphore with two states: SIGNALED and WAITING.
 *
 * Used to put worker threads to sleep when they have nothing to do, and to wake them up when new
 * work arrives. It's assumed that the user will not call signal() multiple times in a row.
 */
class binary_semaphore {
public:
    //! Constructor. Puts the semaphore in the WAITING state
    binary_semaphore();
    ~binary_semaphore();

    binary_semaphore(const binary_semaphore&) = delete;
    void operator=(const binary_semaphore&) = delete;

    /**
     * @brief      Wait for the semaphore to be signaled.
     *
     * The call will block until another thread signals the semaphore. If the semaphore is already
     * signaled, this returns immediately and puts it back into the WAITING state.
     */
    void wait();

    //! Puts the semaphore in the SIGNALED state, waking up a thread blocked in wait()
    void signal();

private:
#if OPFLOW_PLATFORM_LINUX
    //! Storage for the sem_t object
    std::aligned_storage<32>::type sem_;
#else
    std::condition_variable cond_var_;
    std::mutex mutex_;
    int count_{0};
#endif
};

} // namespace v1
} // namespace opflow
