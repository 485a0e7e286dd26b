#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Sets the logger used by the library.
 *
 * @param      logger  The new logger; if null, the default logger is restored
 *
 * The default logger writes to stderr, is named "opflow" and only reports warnings and errors.
 * Tasks state transitions are logged at debug level, admission decisions at trace level.
 *
 * @see init_data::logger_
 */
void set_logger(std::shared_ptr<spdlog::logger> logger);

//! Returns the logger currently used by the library.
std::shared_ptr<spdlog::logger> get_logger();

} // namespace v1

namespace detail {
//! Shortcut for the library logger, to be used with the SPDLOG_LOGGER_* macros
inline std::shared_ptr<spdlog::logger> logger() { return get_logger(); }
} // namespace detail

} // namespace opflow
