/**
 * @file work_queue.hpp
 * @brief Closable multi-producer/multi-consumer FIFO used as the job channel
 *
 * Producers push jobs, then call close(). Consumers loop on pop() until it
 * returns nullopt, which happens only once the queue is closed AND drained,
 * so no job pushed before close() is ever lost.
 *
 * EXAMPLE:
 * WorkQueue<CopyJob> queue;
 * queue.push(job);                        // Producer
 * queue.close();                          // Producer finished
 * while (auto job = queue.pop()) { ... }  // Consumer
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace psync {

/**
 * @brief Thread-safe FIFO with end-of-stream signalling
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently, each item is handed out once
 * - Items are dequeued in the order they were pushed
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * RETURNS: false if the queue was already closed (item dropped)
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

    /**
     * @brief Try to pop item (non-blocking)
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Next item, or nullopt once the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop item with timeout
     *
     * RETURNS: nullopt on timeout or when closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /**
     * @brief Signal end of input (wakes all waiting consumers)
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace psync
