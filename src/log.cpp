#include "opflow/log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>

namespace opflow {

namespace detail {

//! The logger explicitly set by the user; null if the default one is to be used
static std::shared_ptr<spdlog::logger> g_user_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    constexpr const char* name = "opflow";
    // Somebody else might have registered a logger with our name; prefer that one
    auto res = spdlog::get(name);
    if (!res) {
        res = spdlog::stderr_color_mt(name);
        res->set_level(spdlog::level::warn);
    }
    return res;
}

} // namespace detail

inline namespace v1 {

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::atomic_store(&detail::g_user_logger, std::move(logger));
}

std::shared_ptr<spdlog::logger> get_logger() {
    auto res = std::atomic_load(&detail::g_user_logger);
    if (res)
        return res;
    static const std::shared_ptr<spdlog::logger> default_logger = detail::make_default_logger();
    return default_logger;
}

} // namespace v1
} // namespace opflow
