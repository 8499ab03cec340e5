/**
 * Channel.hpp - Bounded multi-producer queue between session loops
 *
 * Loops never share mutable state directly; they exchange messages through
 * a Channel. Two overflow policies:
 *   Block      - producer waits for room (coordinator inbox)
 *   DropOldest - producer never waits, oldest item is evicted (audio ingest)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace vsp::core {

enum class OverflowPolicy {
    Block,
    DropOldest
};

struct PushResult {
    bool accepted = false;
    size_t dropped = 0;
};

template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity, OverflowPolicy policy = OverflowPolicy::Block)
        : capacity_(capacity > 0 ? capacity : 1)
        , policy_(policy) {
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    PushResult push(T item) {
        PushResult result;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (policy_ == OverflowPolicy::Block) {
                not_full_.wait(lock, [this]() { return closed_ || items_.size() < capacity_; });
            } else {
                while (!closed_ && items_.size() >= capacity_) {
                    items_.pop_front();
                    result.dropped++;
                }
            }
            if (closed_) return result;

            items_.push_back(std::move(item));
            result.accepted = true;
        }
        not_empty_.notify_one();
        return result;
    }

    /// Never waits. Fails when full or closed regardless of policy.
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Blocks until an item arrives or the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return takeLocked();
    }

    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return takeLocked();
    }

    size_t clear() {
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed = items_.size();
            items_.clear();
        }
        not_full_.notify_all();
        return removed;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeLocked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace vsp::core
