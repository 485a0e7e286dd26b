#include "opflow/logging_observer.hpp"
#include "opflow/log.hpp"

#include <spdlog/spdlog.h>

namespace opflow {
inline namespace v1 {

logging_observer::logging_observer(
        std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level)
    : logger_(logger ? std::move(logger) : get_logger())
    , level_(level) {}

void logging_observer::on_start(task& t) {
    logger_->log(level_, "task '{}' ({}) started", t.name(), t.id());
}

void logging_observer::on_produce(task& t, const task_ptr& produced) {
    logger_->log(level_, "task '{}' ({}) produced '{}' ({})", t.name(), t.id(), produced->name(),
            produced->id());
}

void logging_observer::on_finish(task& t, const error_list& errors) {
    if (errors.empty()) {
        logger_->log(level_, "task '{}' ({}) finished{}", t.name(), t.id(),
                t.is_cancelled() ? " (cancelled)" : "");
        return;
    }
    logger_->warn("task '{}' ({}) finished with {} errors", t.name(), t.id(), errors.size());
    for (const auto& err : errors)
        logger_->warn("  {}", describe(err));
}

} // namespace v1
} // namespace opflow
