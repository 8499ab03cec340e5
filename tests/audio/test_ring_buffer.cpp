/**
 * test_ring_buffer.cpp - SPSC sample ring used by the speaker output
 */

#include "vsp/audio/RingBuffer.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>

using vsp::audio::RingBuffer;

void test_fifo_order_across_wrap() {
    RingBuffer<int16_t> ring(8);
    std::vector<int16_t> out(8);

    // Move the indices near the end so the next push wraps
    std::vector<int16_t> warmup(6, 0);
    assert(ring.push(warmup.data(), warmup.size()) == 6);
    assert(ring.pop(out.data(), 6) == 6);

    std::vector<int16_t> pcm = {10, -20, 30, -40, 50};
    assert(ring.push(pcm.data(), pcm.size()) == pcm.size());
    assert(ring.available() == 5);

    assert(ring.pop(out.data(), 2) == 2);
    assert(out[0] == 10 && out[1] == -20);
    assert(ring.pop(out.data(), 8) == 3);
    assert(out[0] == 30 && out[1] == -40 && out[2] == 50);

    std::cout << "[PASS] test_fifo_order_across_wrap" << std::endl;
}

void test_full_ring_truncates_push() {
    RingBuffer<int16_t> ring(480);   // 20ms at 24kHz
    std::vector<int16_t> chunk(1000, 7);

    assert(ring.push(chunk.data(), chunk.size()) == 480);
    assert(ring.push(chunk.data(), 1) == 0);
    assert(ring.available() == ring.capacity());

    std::cout << "[PASS] test_full_ring_truncates_push" << std::endl;
}

void test_barge_in_clear() {
    RingBuffer<int16_t> ring(2400);
    std::vector<int16_t> reply(2000, 1000);
    ring.push(reply.data(), reply.size());

    ring.clear();
    assert(ring.available() == 0);

    std::vector<int16_t> out(64, -1);
    assert(ring.pop(out.data(), out.size()) == 0);

    // The next response starts from an empty ring
    std::vector<int16_t> next = {1, 2, 3};
    assert(ring.push(next.data(), next.size()) == 3);
    assert(ring.pop(out.data(), out.size()) == 3);
    assert(out[2] == 3);

    std::cout << "[PASS] test_barge_in_clear" << std::endl;
}

void test_producer_consumer_sequence() {
    constexpr int kTotal = 48000;
    RingBuffer<int16_t> ring(960);
    std::vector<int16_t> received;
    received.reserve(kTotal);

    std::thread producer([&]() {
        std::vector<int16_t> block(240);
        int next = 0;
        while (next < kTotal) {
            size_t n = std::min<size_t>(block.size(), kTotal - next);
            for (size_t i = 0; i < n; ++i) block[i] = static_cast<int16_t>((next + i) % 30000);
            size_t pushed = 0;
            while (pushed < n) {
                pushed += ring.push(block.data() + pushed, n - pushed);
                if (pushed < n) std::this_thread::yield();
            }
            next += static_cast<int>(n);
        }
    });

    std::vector<int16_t> out(128);
    while (received.size() < static_cast<size_t>(kTotal)) {
        size_t got = ring.pop(out.data(), out.size());
        received.insert(received.end(), out.begin(), out.begin() + got);
        if (got == 0) std::this_thread::yield();
    }
    producer.join();

    for (int i = 0; i < kTotal; ++i) {
        assert(received[i] == static_cast<int16_t>(i % 30000));
    }

    std::cout << "[PASS] test_producer_consumer_sequence" << std::endl;
}

int main() {
    std::cout << "=== RingBuffer Tests ===" << std::endl;

    test_fifo_order_across_wrap();
    test_full_ring_truncates_push();
    test_barge_in_clear();
    test_producer_consumer_sequence();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
