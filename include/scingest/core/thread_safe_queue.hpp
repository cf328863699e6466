/**
 * @file thread_safe_queue.hpp
 * @brief Blocking FIFO shared between producer and worker threads
 *
 * The transfer workers drain a queue of chunk indices from it. Once close()
 * is called, blocking pops return whatever is left and then std::nullopt, so
 * a pre-filled, closed queue doubles as a fixed work list.
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::size_t> work;
 * work.push(0);
 * work.close();
 * while (auto index = work.pop()) { ... }
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace scingest {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Append an item; ignored after close()
     *
     * RETURNS: false if the queue is already closed
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Pop, waiting until an item arrives or the queue is closed
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        return take_locked();
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /**
     * @brief Refuse further pushes and wake every waiting consumer
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Drop pending items, e.g. when the consumers are told to stop
     */
    std::size_t clear() {
        std::unique_lock lock(mutex_);
        const auto dropped = queue_.size();
        std::queue<T>().swap(queue_);
        return dropped;
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace scingest
