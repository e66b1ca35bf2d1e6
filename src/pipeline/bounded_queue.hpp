#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace ibarrow::pipeline {

/**
 * @brief Blocking FIFO with a fixed capacity
 *
 * push() waits while the queue is full (backpressure), pop() waits while it
 * is empty. close() ends the stream: pending items can still be drained.
 * abort() ends it immediately and discards pending items, so neither side
 * processes anything further.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("queue capacity must be > 0");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // false if the queue was closed or aborted; the value is dropped
    bool push(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return items_.size() < capacity_ || closed_; });
            if (closed_) return false;
            items_.push_back(std::move(value));
            if (items_.size() > peak_size_) peak_size_ = items_.size();
        }
        not_empty_.notify_one();
        return true;
    }

    // nullopt once the queue is closed and drained, or aborted
    std::optional<T> pop() {
        std::optional<T> value;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
            if (items_.empty()) return std::nullopt;
            value.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    std::optional<T> try_pop() {
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) return std::nullopt;
            value.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void abort() {
        std::deque<T> discarded;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            discarded.swap(items_);
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t capacity() const noexcept { return capacity_; }

    // Largest number of items held at once
    size_t peak_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_size_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    size_t peak_size_ = 0;
    bool closed_ = false;
};

} // namespace ibarrow::pipeline
