#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Fixed-capacity FIFO shared between producer and consumer threads.
// tryPush never blocks; push blocks while the queue is full. Once closed,
// pushes fail and pops drain what is left before returning empty.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                if (!closed_) {
                    dropped_++;
                }
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    bool push(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    // Like push, but gives up after `timeout` if no slot frees up.
    bool pushFor(T item, std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!notFull_.wait_for(lock, timeout, [this] { return closed_ || items_.size() < capacity_; })) {
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

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return takeFront(lock);
    }

    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return takeFront(lock);
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return takeFront(lock);
    }

    // Removes everything currently buffered and returns how many items went.
    size_t drain() {
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            count = items_.size();
            items_.clear();
        }
        notFull_.notify_all();
        return count;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<T> takeFront(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    size_t dropped_{0};
    bool closed_{false};
};
