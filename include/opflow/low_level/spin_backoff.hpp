#pragma once

#include "../detail/platform.hpp"

#include <thread>

#if !defined(OPFLOW_LOW_LEVEL_SHORT_PAUSE)

#if OPFLOW_CPU_ARCH_x86 && (__GNUC__ || __clang__)
#define OPFLOW_LOW_LEVEL_SHORT_PAUSE_ONE_IMPL() asm("pause;")
#elif OPFLOW_CPU_ARCH_arm && (__GNUC__ || __clang__)
#define OPFLOW_LOW_LEVEL_SHORT_PAUSE_ONE_IMPL() __asm__ __volatile__("yield" ::: "memory")
#else
#define OPFLOW_LOW_LEVEL_SHORT_PAUSE(count) std::this_thread::yield()
#endif

#endif

namespace opflow {
namespace detail {

#if !defined(OPFLOW_LOW_LEVEL_SHORT_PAUSE)

//! Issue a very short pause instruction to the CPU; try to keep the CPU in low-energy state
inline void short_pause(int count) {
    while (count-- > 0) {
        OPFLOW_LOW_LEVEL_SHORT_PAUSE_ONE_IMPL();
    }
}

#define OPFLOW_LOW_LEVEL_SHORT_PAUSE(count) opflow::detail::short_pause(count)
#endif

#if !defined(OPFLOW_LOW_LEVEL_YIELD_PAUSE)
#define OPFLOW_LOW_LEVEL_YIELD_PAUSE() std::this_thread::yield()
#endif

} // namespace detail

inline namespace v1 {

/**
 * @brief      Spins with exponential backoff.
 *
 * Used in places where a thread waits for a resource that another thread is about to release.
 * The first pauses are short CPU pauses; after a threshold the thread yields its CPU quanta.
 *
 * @see spin_mutex
 */
class spin_backoff {
public:
    //! Pauses a short while; consecutive calls pause longer and longer.
    void pause() {
        constexpr int pause_threshold = 16;
        if (count_ < pause_threshold) {
            OPFLOW_LOW_LEVEL_SHORT_PAUSE(count_);
            count_ *= 2;
        } else {
            OPFLOW_LOW_LEVEL_YIELD_PAUSE();
        }
    }

private:
    //! The count of 'pause' instructions we should make
    int count_{1};
};

} // namespace v1
} // namespace opflow
