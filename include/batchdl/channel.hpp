#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace batchdl {

// Multi-producer, multi-consumer FIFO. A capacity of 0 means unbounded, in
// which case send() never blocks.
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel was closed before the value could be queued.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || capacity_ == 0 || items_.size() < capacity_;
        });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until a value is available. Returns std::nullopt once the channel
    // is closed and drained.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return popLocked();
    }

    std::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value{std::move(items_.front())};
        items_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace batchdl
