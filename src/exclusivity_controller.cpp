#include "opflow/exclusivity_controller.hpp"
#include "opflow/log.hpp"
#include "opflow/profiling.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace opflow {
inline namespace v1 {

bool exclusivity_controller::acquire(
        const std::vector<std::string>& categories, const task_ptr& t, grant_function on_grant) {
    OPFLOW_PROFILING_FUNCTION();
    if (!t)
        throw std::invalid_argument("null task");
    if (categories.empty())
        return true;

    std::lock_guard<std::mutex> lock(mutex_);
    const task* key = t.get();
    if (claimants_.count(key) > 0)
        throw std::logic_error(
                "task '" + t->name() + "' already claimed its exclusivity categories");

    claimant c;
    c.task_ = t;
    c.categories_ = categories;
    std::sort(c.categories_.begin(), c.categories_.end());
    c.categories_.erase(
            std::unique(c.categories_.begin(), c.categories_.end()), c.categories_.end());
    for (const auto& cat : c.categories_)
        sequences_[cat].push_back(key);

    c.granted_ = is_head_of_all(key, c);
    if (!c.granted_)
        c.on_grant_ = std::move(on_grant);
    bool res = c.granted_;
    SPDLOG_LOGGER_TRACE(detail::logger(), "task '{}' ({}) claimed {} categories; eligible={}",
            t->name(), t->id(), c.categories_.size(), res);
    claimants_.emplace(key, std::move(c));
    return res;
}

bool exclusivity_controller::acquire(
        const std::string& category, const task_ptr& t, grant_function on_grant) {
    return acquire(std::vector<std::string>{category}, t, std::move(on_grant));
}

void exclusivity_controller::release(
        const std::vector<std::string>& categories, const task_ptr& t) {
    OPFLOW_PROFILING_FUNCTION();
    if (!t || categories.empty())
        return;

    std::vector<grant_function> to_grant;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const task* key = t.get();
        auto it = claimants_.find(key);
        if (it == claimants_.end())
            return;

        // Remove the task from the given sequences; remember the sequences that changed
        std::vector<std::string> touched;
        auto& own_cats = it->second.categories_;
        for (const auto& cat : categories) {
            auto cat_it = std::find(own_cats.begin(), own_cats.end(), cat);
            if (cat_it == own_cats.end())
                continue;
            own_cats.erase(cat_it);

            auto seq_it = sequences_.find(cat);
            if (seq_it == sequences_.end())
                continue;
            auto& seq = seq_it->second;
            seq.erase(std::remove(seq.begin(), seq.end(), key), seq.end());
            if (seq.empty())
                sequences_.erase(seq_it);
            else
                touched.push_back(cat);
        }
        if (own_cats.empty())
            claimants_.erase(it);

        // The new heads of the changed sequences may now be eligible
        for (const auto& cat : touched) {
            const task* head = sequences_[cat].front();
            auto head_it = claimants_.find(head);
            if (head_it == claimants_.end())
                continue;
            auto& hc = head_it->second;
            if (!hc.granted_ && is_head_of_all(head, hc)) {
                hc.granted_ = true;
                if (hc.on_grant_)
                    to_grant.emplace_back(std::move(hc.on_grant_));
            }
        }
    }
    for (auto& f : to_grant)
        f();
}

void exclusivity_controller::release(const std::string& category, const task_ptr& t) {
    release(std::vector<std::string>{category}, t);
}

bool exclusivity_controller::is_eligible(const task_ptr& t) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claimants_.find(t.get());
    return it == claimants_.end() || is_head_of_all(t.get(), it->second);
}

std::vector<task_ptr> exclusivity_controller::holders(const std::string& category) const {
    std::vector<task_ptr> res;
    std::lock_guard<std::mutex> lock(mutex_);
    auto seq_it = sequences_.find(category);
    if (seq_it == sequences_.end())
        return res;
    for (const task* t : seq_it->second)
        res.push_back(claimants_.at(t).task_);
    return res;
}

int exclusivity_controller::num_categories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(sequences_.size());
}

bool exclusivity_controller::is_head_of_all(const task* t, const claimant& c) const {
    for (const auto& cat : c.categories_) {
        auto it = sequences_.find(cat);
        if (it == sequences_.end() || it->second.front() != t)
            return false;
    }
    return true;
}

} // namespace v1
} // namespace opflow
