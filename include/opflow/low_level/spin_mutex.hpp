#pragma once

#include "spin_backoff.hpp"

#include <atomic>

namespace opflow {
inline namespace v1 {

/**
 * @brief      Mutex that spins on the CPU while waiting for the lock.
 *
 * Only to be used for guarding a handful of instructions, like the one-time initialization of the
 * execution context.
 *
 * @see spin_backoff
 */
class spin_mutex {
public:
    spin_mutex() = default;

    spin_mutex(const spin_mutex&) = delete;
    spin_mutex& operator=(const spin_mutex&) = delete;

    //! Acquires ownership of the mutex, spinning while it's taken
    void lock() {
        spin_backoff spinner;
        while (busy_.test_and_set(std::memory_order_acquire))
            spinner.pause();
    }

    //! Tries to lock the mutex; returns false if the mutex is not available
    bool try_lock() { return !busy_.test_and_set(std::memory_order_acquire); }

    //! Releases the ownership on the mutex
    void unlock() { busy_.clear(std::memory_order_release); }

private:
    //! True if the spin mutex is taken
    std::atomic_flag busy_ = ATOMIC_FLAG_INIT;
};

} // namespace v1
} // namespace opflow
