/**
 * test_channel.cpp - Unit tests for the inter-loop channel
 */

#include "vsp/core/Channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace vsp::core;

void test_fifo_order() {
    Channel<int> channel(8);
    for (int i = 0; i < 5; ++i) {
        assert(channel.push(i).accepted);
    }
    for (int i = 0; i < 5; ++i) {
        auto item = channel.popFor(std::chrono::milliseconds(10));
        assert(item.has_value());
        assert(*item == i);
    }
    assert(!channel.popFor(std::chrono::milliseconds(5)).has_value());

    std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_drop_oldest() {
    Channel<int> channel(3, OverflowPolicy::DropOldest);
    size_t dropped = 0;
    for (int i = 0; i < 5; ++i) {
        auto result = channel.push(i);
        assert(result.accepted);
        dropped += result.dropped;
    }
    assert(dropped == 2);
    assert(channel.size() == 3);

    // Newest survive
    assert(*channel.popFor(std::chrono::milliseconds(1)) == 2);
    assert(*channel.popFor(std::chrono::milliseconds(1)) == 3);
    assert(*channel.popFor(std::chrono::milliseconds(1)) == 4);

    std::cout << "[PASS] test_drop_oldest" << std::endl;
}

void test_try_push_full() {
    Channel<int> channel(2);
    assert(channel.tryPush(1));
    assert(channel.tryPush(2));
    assert(!channel.tryPush(3));
    assert(channel.size() == 2);

    std::cout << "[PASS] test_try_push_full" << std::endl;
}

void test_block_until_room() {
    Channel<int> channel(1);
    channel.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        channel.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!pushed);

    assert(*channel.pop() == 1);
    producer.join();
    assert(pushed);
    assert(*channel.pop() == 2);

    std::cout << "[PASS] test_block_until_room" << std::endl;
}

void test_close_wakes_waiters() {
    Channel<int> channel(1);

    std::thread consumer([&]() {
        auto item = channel.pop();
        assert(!item.has_value());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    consumer.join();

    assert(channel.closed());
    assert(!channel.push(7).accepted);
    assert(!channel.tryPush(7));

    std::cout << "[PASS] test_close_wakes_waiters" << std::endl;
}

void test_close_drains_remaining() {
    Channel<int> channel(4);
    channel.push(1);
    channel.push(2);
    channel.close();

    assert(*channel.pop() == 1);
    assert(*channel.pop() == 2);
    assert(!channel.pop().has_value());

    std::cout << "[PASS] test_close_drains_remaining" << std::endl;
}

void test_clear() {
    Channel<int> channel(4);
    channel.push(1);
    channel.push(2);
    assert(channel.clear() == 2);
    assert(channel.size() == 0);

    std::cout << "[PASS] test_clear" << std::endl;
}

void test_concurrent_producers() {
    Channel<int> channel(16);
    const int per_producer = 500;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&]() {
            for (int i = 0; i < per_producer; ++i) channel.push(1);
        });
    }

    int received = 0;
    while (received < 4 * per_producer) {
        auto item = channel.popFor(std::chrono::milliseconds(500));
        assert(item.has_value());
        received += *item;
    }
    for (auto& t : producers) t.join();

    std::cout << "[PASS] test_concurrent_producers (received=" << received << ")" << std::endl;
}

int main() {
    std::cout << "=== Channel Tests ===" << std::endl;

    test_fifo_order();
    test_drop_oldest();
    test_try_push_full();
    test_block_until_room();
    test_close_wakes_waiters();
    test_close_drains_remaining();
    test_clear();
    test_concurrent_producers();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
