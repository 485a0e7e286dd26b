#include "opflow/init.hpp"
#include "opflow/log.hpp"
#include "opflow/low_level/spin_mutex.hpp"
#include "opflow/detail/likely.hpp"
#include "opflow/detail/library_data.hpp"
#include "opflow/detail/exec_context.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>

namespace opflow {
namespace detail {

static std::atomic<exec_context*> g_exec_context{nullptr};

//! Guards the creation and the destruction of the execution context
static spin_mutex g_init_bottleneck;

//! Called to shutdown the library
void do_shutdown() {
    exec_context* ctx = nullptr;
    {
        std::lock_guard<spin_mutex> lock(g_init_bottleneck);
        ctx = g_exec_context.exchange(nullptr, std::memory_order_acq_rel);
    }
    // Joining the workers happens outside the lock
    delete ctx;
}

//! Actually initializes the library; this is guarded by get_exec_context()
exec_context* do_init(const init_data* config) {
    static const init_data default_config;
    if (!config)
        config = &default_config;
    if (config->logger_)
        set_logger(config->logger_);
    auto* global_ctx = new exec_context(*config);
    g_exec_context.store(global_ctx, std::memory_order_release);

    static std::once_flag atexit_registered;
    std::call_once(atexit_registered, []() { atexit(&do_shutdown); });
    return global_ctx;
}

exec_context& get_exec_context(const init_data* config) {
    auto* p = g_exec_context.load(std::memory_order_acquire);
    OPFLOW_IF_UNLIKELY(!p) {
        std::lock_guard<spin_mutex> lock(g_init_bottleneck);
        // Another thread might have initialized the library while we were waiting
        p = g_exec_context.load(std::memory_order_acquire);
        if (!p)
            p = do_init(config);
    }
    return *p;
}

} // namespace detail

inline namespace v1 {

void init(const init_data& config) {
    std::lock_guard<spin_mutex> lock(detail::g_init_bottleneck);
    if (is_initialized())
        throw already_initialized();
    detail::do_init(&config);
}

bool is_initialized() { return detail::g_exec_context.load(std::memory_order_acquire) != nullptr; }

void shutdown() { detail::do_shutdown(); }

} // namespace v1

} // namespace opflow
