// Test program for RecordChannel validation
#include "core/record_channel.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace airbrakes;
using namespace std::chrono;

int main() {
    std::cout << "=== RecordChannel Validation ===" << std::endl;

    // Test 1: FIFO order
    {
        RecordChannel<std::string> channel;
        channel.push("A");
        channel.push("B");
        channel.push("C");

        if (channel.size() != 3) {
            std::cerr << "FAIL: Expected size 3, got " << channel.size() << std::endl;
            return 1;
        }

        const char* expected[] = {"A", "B", "C"};
        for (const char* e : expected) {
            std::string value;
            if (!channel.try_pop(value) || value != e) {
                std::cerr << "FAIL: Expected " << e << ", got " << value << std::endl;
                return 1;
            }
        }

        if (!channel.empty()) {
            std::cerr << "FAIL: Channel not empty after popping all" << std::endl;
            return 1;
        }

        std::cout << "✓ Test 1: FIFO order - PASSED" << std::endl;
    }

    // Test 2: Unbounded - push never fails or waits
    {
        RecordChannel<int> channel;
        constexpr int NUM_ITEMS = 100000;

        auto start = high_resolution_clock::now();
        for (int i = 0; i < NUM_ITEMS; i++) {
            channel.push(i);
        }
        auto duration = duration_cast<microseconds>(high_resolution_clock::now() - start).count();

        if (channel.size() != NUM_ITEMS) {
            std::cerr << "FAIL: Lost items without a consumer" << std::endl;
            return 1;
        }

        std::cout << "✓ Test 2: Unbounded push - PASSED (" << duration << " µs for "
                  << NUM_ITEMS << " items)" << std::endl;
    }

    // Test 3: pop_for times out on an empty channel
    {
        RecordChannel<int> channel;
        int value = -1;

        auto start = steady_clock::now();
        bool got = channel.pop_for(milliseconds(20), value);
        auto waited = duration_cast<milliseconds>(steady_clock::now() - start).count();

        if (got || waited < 15) {
            std::cerr << "FAIL: pop_for returned early (got=" << got
                      << ", waited " << waited << " ms)" << std::endl;
            return 1;
        }

        std::cout << "✓ Test 3: Bounded wait - PASSED" << std::endl;
    }

    // Test 4: Blocking consumer, per-producer order preserved
    {
        RecordChannel<int> channel;
        constexpr int PRODUCERS = 4;
        constexpr int PER_PRODUCER = 20000;
        constexpr int STOP = -1;

        std::vector<int> last_seen(PRODUCERS, -1);
        std::atomic<int> consumed{0};
        std::atomic<bool> order_ok{true};

        std::thread consumer([&]() {
            while (true) {
                int item = channel.pop();
                if (item == STOP) {
                    break;
                }
                const int producer = item / PER_PRODUCER;
                const int seq = item % PER_PRODUCER;
                if (seq != last_seen[producer] + 1) {
                    order_ok.store(false);
                }
                last_seen[producer] = seq;
                consumed.fetch_add(1);
            }
        });

        std::vector<std::thread> producers;
        for (int p = 0; p < PRODUCERS; p++) {
            producers.emplace_back([&channel, p]() {
                for (int i = 0; i < PER_PRODUCER; i++) {
                    channel.push(p * PER_PRODUCER + i);
                }
            });
        }
        for (auto& t : producers) {
            t.join();
        }

        // Terminator queued behind everything
        channel.push(STOP);
        consumer.join();

        if (!order_ok.load()) {
            std::cerr << "FAIL: Producer order not preserved" << std::endl;
            return 1;
        }
        if (consumed.load() != PRODUCERS * PER_PRODUCER || !channel.empty()) {
            std::cerr << "FAIL: Consumed " << consumed.load() << " of "
                      << PRODUCERS * PER_PRODUCER << std::endl;
            return 1;
        }

        std::cout << "✓ Test 4: Multi-producer - PASSED" << std::endl;
    }

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
