#include "opflow/group_task.hpp"
#include "opflow/log.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace opflow {
inline namespace v1 {

//! Counts the children that are not yet finished, and finishes the group when none is left.
class group_task::children_tracker : public scheduler_delegate {
public:
    void will_submit(const task_ptr&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_++;
    }

    void did_finish(const task_ptr&, const error_list& errors) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.insert(errors_.end(), errors.begin(), errors.end());
            outstanding_--;
        }
        check_done();
    }

    //! Called when the group starts executing
    void start(std::shared_ptr<group_task> owner) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            owner_ = owner;
            started_ = true;
        }
        check_done();
    }

    //! Prevents the group from finishing while a child is being added
    void reserve() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_)
            throw std::logic_error("cannot add children to a finished group");
        outstanding_++;
    }
    void unreserve() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outstanding_--;
        }
        check_done();
    }

    int outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

private:
    mutable std::mutex mutex_;
    std::weak_ptr<group_task> owner_;
    //! Number of children not yet finished, plus the reservations
    int outstanding_{0};
    bool started_{false};
    bool done_{false};
    //! The errors of the children, in finish order
    error_list errors_;

    void check_done() {
        std::shared_ptr<group_task> owner;
        error_list errors;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_ || done_ || outstanding_ > 0)
                return;
            done_ = true;
            owner = owner_.lock();
            errors.swap(errors_);
        }
        if (owner)
            owner->finish(std::move(errors));
    }
};

namespace {
scheduler_options children_options(scheduler_options opts, const std::string& group_name) {
    opts.name_ = group_name;
    opts.start_suspended_ = true;
    return opts;
}
} // namespace

group_task::group_task(std::vector<task_ptr> children, std::string name, scheduler_options opts)
    : task(std::move(name))
    , tracker_(std::make_shared<children_tracker>())
    , scheduler_(children_options(std::move(opts), task::name())) {
    scheduler_.set_delegate(tracker_);
    add_children(children);
}

group_task::~group_task() = default;

bool group_task::add_child(task_ptr child) {
    tracker_->reserve();
    bool res = scheduler_.submit(std::move(child));
    tracker_->unreserve();
    return res;
}

int group_task::add_children(const std::vector<task_ptr>& children) {
    int res = 0;
    for (const auto& c : children)
        if (add_child(c))
            res++;
    return res;
}

int group_task::num_unfinished_children() const { return tracker_->outstanding(); }

void group_task::execute() {
    SPDLOG_LOGGER_DEBUG(detail::logger(), "group '{}' ({}) starting with {} children", name(), id(),
            tracker_->outstanding());
    tracker_->start(std::static_pointer_cast<group_task>(shared_from_this()));
    scheduler_.resume();
}

void group_task::on_cancel() { scheduler_.cancel_all(); }

} // namespace v1
} // namespace opflow
