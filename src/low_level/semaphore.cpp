#include "opflow/low_level/semaphore.hpp"
#include "opflow/profiling.hpp"

#include <cassert>

#if OPFLOW_PLATFORM_LINUX
#include <semaphore.h>
#include <cerrno>
#endif

namespace opflow {
inline namespace v1 {

#if OPFLOW_PLATFORM_LINUX

namespace {
sem_t* as_sem(std::aligned_storage<32>::type& storage) {
    return reinterpret_cast<sem_t*>(&storage);
}
} // namespace

binary_semaphore::binary_semaphore() {
    static_assert(sizeof(sem_t) <= sizeof(sem_), "Did not find the right size of sem_t");
    int ret = sem_init(as_sem(sem_), 0, 0);
    assert(!ret);
    (void)ret;
}

binary_semaphore::~binary_semaphore() {
    int ret = sem_destroy(as_sem(sem_));
    assert(!ret);
    (void)ret;
}

void binary_semaphore::wait() {
    OPFLOW_PROFILING_SCOPE_C(OPFLOW_PROFILING_COLOR_SILVER);
    // Retry if we were interrupted by a signal handler
    while (sem_wait(as_sem(sem_)) != 0 && errno == EINTR)
        ;
}

void binary_semaphore::signal() {
    OPFLOW_PROFILING_FUNCTION();
    sem_post(as_sem(sem_));
}

#else

binary_semaphore::binary_semaphore() = default;
binary_semaphore::~binary_semaphore() = default;

void binary_semaphore::wait() {
    OPFLOW_PROFILING_SCOPE_C(OPFLOW_PROFILING_COLOR_SILVER);
    std::unique_lock<std::mutex> lock{mutex_};
    cond_var_.wait(lock, [this] { return count_ > 0; });
    count_--;
}

void binary_semaphore::signal() {
    OPFLOW_PROFILING_FUNCTION();
    {
        std::lock_guard<std::mutex> lock{mutex_};
        count_++;
    }
    cond_var_.notify_one();
}

#endif

} // namespace v1
} // namespace opflow
