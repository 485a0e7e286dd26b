#pragma once

#include "observer.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace opflow {

inline namespace v1 {

/**
 * @brief      Logs the lifecycle events of a task.
 *
 * Start and produce events are logged with the given level; finish events are logged with the
 * given level on success, and as warnings if the task has errors.
 *
 * If no logger is given, the library logger is used.
 */
class logging_observer : public observer {
public:
    explicit logging_observer(std::shared_ptr<spdlog::logger> logger = {},
            spdlog::level::level_enum level = spdlog::level::info);

    void on_start(task& t) override;
    void on_produce(task& t, const task_ptr& produced) override;
    void on_finish(task& t, const error_list& errors) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum level_;
};

} // namespace v1
} // namespace opflow
