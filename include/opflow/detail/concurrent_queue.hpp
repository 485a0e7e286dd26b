#pragma once

#include <deque>
#include <mutex>
#include <memory>

namespace opflow {
namespace detail {

//! Queue that can be used concurrently by multiple producers and consumers.
template <typename T>
class concurrent_queue {
public:
    concurrent_queue() = default;
    ~concurrent_queue() = default;

    concurrent_queue(const concurrent_queue&) = delete;
    void operator=(const concurrent_queue&) = delete;

    void push(T val) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace_back(std::move(val));
    }

    bool try_pop(T& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
            return false;
        result = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    //! Drops all the elements in the queue; returns the number of dropped elements
    size_t clear() {
        std::deque<T> to_drop;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            to_drop.swap(queue_);
        }
        return to_drop.size();
    }

private:
    std::deque<T> queue_;
    std::mutex mutex_;
};

} // namespace detail
} // namespace opflow
