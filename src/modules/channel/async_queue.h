// modules/channel/async_queue.h
#ifndef AGENTFLOW_MODULES_CHANNEL_ASYNC_QUEUE_H
#define AGENTFLOW_MODULES_CHANNEL_ASYNC_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace agentflow {

// FIFO mailbox. enqueue never blocks; dequeue waits while empty.
// Items go to waiting consumers in the order the consumers started waiting.
template <typename T>
class AsyncQueue {
public:
    AsyncQueue() = default;
    AsyncQueue(const AsyncQueue&) = delete;
    AsyncQueue& operator=(const AsyncQueue&) = delete;

    void enqueue(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        // 直接交给最早等待的消费者
        while (!waiters_.empty()) {
            auto waiter = waiters_.front();
            waiters_.pop_front();
            if (waiter->abandoned) continue;
            waiter->slot.emplace(std::move(item));
            cv_.notify_all();
            return;
        }
        items_.push_back(std::move(item));
    }

    T dequeue() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!items_.empty()) {
            return pop_front_locked();
        }
        auto waiter = std::make_shared<Waiter>();
        waiters_.push_back(waiter);
        cv_.wait(lock, [&] { return waiter->slot.has_value(); });
        return std::move(*waiter->slot);
    }

    // Returns std::nullopt on timeout. A timed-out consumer leaves no waiter behind.
    template <typename Rep, typename Period>
    std::optional<T> dequeue_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!items_.empty()) {
            return pop_front_locked();
        }
        auto waiter = std::make_shared<Waiter>();
        waiters_.push_back(waiter);
        bool delivered = cv_.wait_for(lock, timeout, [&] { return waiter->slot.has_value(); });
        if (!delivered) {
            waiter->abandoned = true;
            remove_waiter_locked(waiter);
            return std::nullopt;
        }
        return std::move(*waiter->slot);
    }

    std::optional<T> try_dequeue() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        return pop_front_locked();
    }

    // Returns and removes everything queued right now; never waits.
    std::vector<T> drain_sync() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> drained;
        drained.reserve(items_.size());
        for (auto& item : items_) {
            drained.push_back(std::move(item));
        }
        items_.clear();
        return drained;
    }

    // Removes items matching `pred` under one lock; the rest keep their order and position
    template <typename Pred>
    std::vector<T> take_if(Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> taken;
        std::deque<T> kept;
        for (auto& item : items_) {
            if (pred(item)) {
                taken.push_back(std::move(item));
            } else {
                kept.push_back(std::move(item));
            }
        }
        items_.swap(kept);
        return taken;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t waiting_consumers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiters_.size();
    }

private:
    struct Waiter {
        std::optional<T> slot;
        bool abandoned = false;
    };

    T pop_front_locked() {
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void remove_waiter_locked(const std::shared_ptr<Waiter>& waiter) {
        for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
            if (*it == waiter) {
                waiters_.erase(it);
                return;
            }
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CHANNEL_ASYNC_QUEUE_H
