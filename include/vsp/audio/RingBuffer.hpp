/**
 * RingBuffer.hpp - Lock-free single-producer single-consumer sample buffer
 *
 * Sits between the speaker sink (producer) and the PortAudio output
 * callback (consumer). clear() must only be called while the consumer
 * tolerates an empty read.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vsp::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1) {
    }

    /// Returns the number of samples actually written.
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t free = (read + buffer_.size() - write - 1) % buffer_.size();
        const size_t n = std::min(count, free);

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % buffer_.size()] = data[i];
        }
        write_.store((write + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    /// Returns the number of samples actually read.
    size_t pop(T* out, size_t count) {
        const size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t used = (write + buffer_.size() - read) % buffer_.size();
        const size_t n = std::min(count, used);

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % buffer_.size()];
        }
        read_.store((read + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    size_t available() const {
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t write = write_.load(std::memory_order_acquire);
        return (write + buffer_.size() - read) % buffer_.size();
    }

    size_t capacity() const { return buffer_.size() - 1; }

    /// Drops everything queued by advancing the read index to the write index.
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    std::vector<T> buffer_;
    std::atomic<size_t> write_{0};
    std::atomic<size_t> read_{0};
};

extern template class RingBuffer<int16_t>;

} // namespace vsp::audio
