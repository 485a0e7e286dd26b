#include "opflow/block_condition.hpp"

namespace opflow {
inline namespace v1 {

block_condition::block_condition(std::string name, predicate pred)
    : condition(std::move(name))
    , pred_(std::move(pred)) {
    if (!pred_)
        throw std::invalid_argument("block condition requires a predicate");
}

void block_condition::evaluate(const task_ptr&, completion done) {
    bool ok = false;
    try {
        ok = pred_();
    } catch (...) {
        done.failed(std::current_exception());
        return;
    }
    if (ok)
        done.satisfied();
    else
        done.failed(std::make_exception_ptr(block_condition_failed(name())));
}

} // namespace v1
} // namespace opflow
