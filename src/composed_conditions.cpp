#include "opflow/composed_conditions.hpp"
#include "opflow/errors.hpp"

#include <stdexcept>

namespace opflow {
inline namespace v1 {

namespace {
const condition_ptr& check_inner(const condition_ptr& inner) {
    if (!inner)
        throw std::invalid_argument("cannot wrap a null condition");
    return inner;
}

bool is_dropped_verdict(const std::exception_ptr& result) {
    if (!result)
        return false;
    try {
        std::rethrow_exception(result);
    } catch (const verdict_dropped&) {
        return true;
    } catch (...) {
        return false;
    }
}
} // namespace

negated_condition::negated_condition(condition_ptr inner)
    : condition("Not<" + check_inner(inner)->name() + ">")
    , inner_(std::move(inner)) {}

std::vector<std::string> negated_condition::exclusivity_categories() const {
    return inner_->exclusivity_categories();
}

task_ptr negated_condition::dependency_for(const task_ptr& t) { return inner_->dependency_for(t); }

void negated_condition::evaluate(const task_ptr& t, completion done) {
    auto inverted = [done, inner_name = inner_->name()](std::exception_ptr result) {
        // A dropped verdict is a bug of the inner condition, not a failure to invert
        if (is_dropped_verdict(result))
            done.failed(std::move(result));
        else if (result)
            done.satisfied();
        else
            done.failed(std::make_exception_ptr(negation_failed(inner_name)));
    };
    inner_->evaluate(t, completion{inner_->name(), std::move(inverted)});
}

silent_condition::silent_condition(condition_ptr inner)
    : condition("Silent<" + check_inner(inner)->name() + ">")
    , inner_(std::move(inner)) {}

std::vector<std::string> silent_condition::exclusivity_categories() const {
    return inner_->exclusivity_categories();
}

void silent_condition::evaluate(const task_ptr& t, completion done) {
    inner_->evaluate(t, std::move(done));
}

mutually_exclusive_condition::mutually_exclusive_condition(
        std::string category, condition_ptr inner)
    : condition("MutuallyExclusive<" + category + ">")
    , category_(std::move(category))
    , inner_(std::move(inner)) {
    if (category_.empty())
        throw std::invalid_argument("empty exclusivity category");
}

std::vector<std::string> mutually_exclusive_condition::exclusivity_categories() const {
    std::vector<std::string> res;
    if (inner_)
        res = inner_->exclusivity_categories();
    res.emplace_back(category_);
    return res;
}

task_ptr mutually_exclusive_condition::dependency_for(const task_ptr& t) {
    return inner_ ? inner_->dependency_for(t) : nullptr;
}

void mutually_exclusive_condition::evaluate(const task_ptr& t, completion done) {
    if (inner_)
        inner_->evaluate(t, std::move(done));
    else
        done.satisfied();
}

} // namespace v1
} // namespace opflow
