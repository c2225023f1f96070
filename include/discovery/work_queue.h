#ifndef ZONELINK_DISCOVERY_WORK_QUEUE_H
#define ZONELINK_DISCOVERY_WORK_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace zonelink {
namespace discovery {

/**
 * @brief Fixed-capacity multi-producer queue.
 *
 * close() wakes every waiter; consumers keep draining what is left and then
 * receive std::nullopt.
 */
template <typename T>
class BoundedWorkQueue {
   public:
    explicit BoundedWorkQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedWorkQueue(const BoundedWorkQueue&) = delete;
    BoundedWorkQueue& operator=(const BoundedWorkQueue&) = delete;

    // Non-blocking; false when full or closed.
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    bool push(T item, std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!notFull_.wait_for(lock, timeout,
                                   [this]() { return closed_ || items_.size() < capacity_; })) {
                return false;
            }
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    // Empty optional on timeout, or once closed and drained.
    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!notEmpty_.wait_for(lock, timeout,
                                    [this]() { return closed_ || !items_.empty(); })) {
                return std::nullopt;
            }
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        notFull_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace discovery
}  // namespace zonelink

#endif  // ZONELINK_DISCOVERY_WORK_QUEUE_H
