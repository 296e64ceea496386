// Unbounded Ordered Record Channel (multi-producer, single-consumer)
//
// Purpose: FIFO hand-off from the control loop to the flight logger thread.
// Producers never wait on the consumer: push() costs one lock plus one
// deque insertion, regardless of how far behind the consumer is.
//
// Key Features:
// - Strict FIFO: items are popped in exactly the order they were pushed
// - Unbounded: push() always succeeds
// - Bounded-wait pop_for() so the consumer can poll a shutdown flag
//
// Sample Input:
//   RecordChannel<int> channel;
//   channel.push(1); channel.push(2);
//
// Expected Output:
//   int value;
//   channel.pop_for(std::chrono::milliseconds(10), value);  // true, value == 1
//   channel.pop_for(std::chrono::milliseconds(10), value);  // true, value == 2
//
// Thread Safety:
//   - ANY number of threads call push()
//   - ONE consumer thread calls pop()/pop_for()

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace airbrakes {

template <typename T>
class RecordChannel {
public:
    RecordChannel() = default;

    // Non-copyable, non-movable (contains mutex)
    RecordChannel(const RecordChannel&) = delete;
    RecordChannel& operator=(const RecordChannel&) = delete;

    // Producer: append item (never blocks beyond the insertion)
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    // Consumer: wait until an item is available
    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Consumer: wait at most `timeout` (returns false if nothing arrived)
    template <typename Rep, typename Period>
    bool pop_for(const std::chrono::duration<Rep, Period>& timeout, T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    // Consumer: non-blocking pop
    bool try_pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    // Approximate depth (stale as soon as it returns)
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
};

}  // namespace airbrakes
