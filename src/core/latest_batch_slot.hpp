// Latest Packet Batch Slot
//
// Purpose: Hand-off point between the acquisition thread and the control loop.
// Holds the most recently completed receive() batch, guarded by a mutex so a
// reader always gets one whole batch (never a torn write, never two writes
// spliced together).
//
// Key Features:
// - publish() replaces the held batch and bumps the sequence
// - take() moves out the held batch if it is newer than the last take()
// - A batch replaced before anyone read it is counted as superseded
//
// Sample Input:
//   LatestBatchSlot slot;
//   slot.publish(batch_from_sensor);   // acquisition thread
//
// Expected Output:
//   PacketBatch latest = slot.take();  // control loop, once per tick
//   // latest == batch_from_sensor; a second take() returns an empty batch
//
// Thread Safety:
//   - ONE writer thread calls publish()
//   - ONE reader thread calls take()
//   - Critical sections are a vector swap

#pragma once

#include "packet_types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace airbrakes {

class LatestBatchSlot {
public:
    LatestBatchSlot()
        : sequence_(0),
          superseded_(0) {}

    // Non-copyable, non-movable (contains mutex and atomics)
    LatestBatchSlot(const LatestBatchSlot&) = delete;
    LatestBatchSlot& operator=(const LatestBatchSlot&) = delete;

    // Writer: make a completed batch the latest value
    void publish(PacketBatch batch) {
        if (batch.empty()) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            latest_.swap(batch);
        }

        // batch now holds the previous value, unread if non-empty
        if (!batch.empty()) {
            superseded_.fetch_add(batch.size(), std::memory_order_relaxed);
        }
        sequence_.fetch_add(1, std::memory_order_release);
    }

    // Reader: the latest batch if it was published after the previous take().
    // Empty when nothing new arrived.
    PacketBatch take() {
        PacketBatch out;

        std::lock_guard<std::mutex> lock(mutex_);
        out.swap(latest_);
        return out;
    }

    // Check for an unread batch without consuming it
    bool has_pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !latest_.empty();
    }

    // Number of non-empty publish() calls so far
    uint64_t sequence() const {
        return sequence_.load(std::memory_order_acquire);
    }

    // Packets replaced by a newer batch before the reader took them
    uint64_t superseded() const {
        return superseded_.load(std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    PacketBatch latest_;              // Protected by mutex_

    std::atomic<uint64_t> sequence_;
    std::atomic<uint64_t> superseded_;
};

}  // namespace airbrakes
