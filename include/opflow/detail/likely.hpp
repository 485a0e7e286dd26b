#pragma once

#include "opflow/detail/platform.hpp"

#if OPFLOW_CPP_COMPILER(gcc) || OPFLOW_CPP_COMPILER(clang)

#define OPFLOW_IF_LIKELY(cond) if (__builtin_expect(!!(cond), 1))
#define OPFLOW_IF_UNLIKELY(cond) if (__builtin_expect(!!(cond), 0))

#else

#define OPFLOW_IF_LIKELY(cond) if (cond)
#define OPFLOW_IF_UNLIKELY(cond) if (cond)

#endif
