#include "opflow/errors.hpp"

namespace opflow {
inline namespace v1 {

condition_failed::condition_failed(std::string category, std::exception_ptr underlying)
    : runtime_error("condition '" + category + "' failed: " + describe(underlying))
    , category_(std::move(category))
    , underlying_(std::move(underlying)) {}

execution_error::execution_error(const std::string& task_name, std::exception_ptr underlying)
    : runtime_error("task '" + task_name + "' failed: " + describe(underlying))
    , underlying_(std::move(underlying)) {}

namespace {
std::string join_names(const std::vector<std::string>& names) {
    std::string res;
    for (const auto& n : names) {
        if (!res.empty())
            res += ", ";
        res += n;
    }
    return res;
}
} // namespace

failed_dependencies::failed_dependencies(std::vector<std::string> names)
    : runtime_error("failed dependencies: " + join_names(names))
    , names_(std::move(names)) {}

task_timed_out::task_timed_out(std::chrono::nanoseconds timeout)
    : runtime_error("task timed out after " +
                    std::to_string(std::chrono::duration<double>(timeout).count()) + " seconds")
    , timeout_(timeout) {}

std::string describe(const std::exception_ptr& err) {
    if (!err)
        return "no error";
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

bool is_cancellation(const std::exception_ptr& err) {
    if (!err)
        return false;
    try {
        std::rethrow_exception(err);
    } catch (const task_cancelled&) {
        return true;
    } catch (...) {
        return false;
    }
}

} // namespace v1
} // namespace opflow
