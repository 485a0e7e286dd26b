#pragma once

#include <functional>
#include <exception>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Type of function to be called for handling exceptions
 *
 * A handler of this type is called whenever an exception cannot be reported through a task; e.g.,
 * when an executor fails to accept work.
 */
using except_fun_t = std::function<void(std::exception_ptr)>;

} // namespace v1
} // namespace opflow
