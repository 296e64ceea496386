// IMU Acquisition Thread
//
// Purpose: Continuously pulls packets from the sensor driver on its own
// thread and publishes them for the control loop, so a slow serial read
// never delays a control tick.
//
// Key Features:
// - pthread with optional SCHED_FIFO priority and CPU affinity
// - Bounded receive wait derived from the sampling frequency
// - Transient read failures are logged and retried, never propagated
// - Latest batch handed over through a mutex-guarded slot (no torn batches)
// - Bounded join on stop() so shutdown cannot hang
// - Thread state is co-owned by the thread, so an abandoned thread
//   outliving its Imu never touches freed memory
//
// Sample Usage:
//   Imu imu(driver, config);
//   imu.start();
//
//   // Control loop, once per tick
//   PacketBatch batch = imu.get_latest_batch();
//
//   imu.stop();
//
// Expected Output:
//   - Each tick sees the newest completed receive() batch, in arrival order
//   - get_latest_batch() is empty when nothing new arrived

#pragma once

#include "core/latest_batch_slot.hpp"
#include "core/packet_types.hpp"
#include "sensors/packet_source.hpp"
#include "service/service_types.hpp"

#include <pthread.h>
#include <atomic>
#include <cstdint>
#include <memory>

namespace airbrakes {

class Imu {
public:
    /**
     * @brief Constructor
     * @param source Driver the thread pulls from (must outlive the thread,
     *        including a thread abandoned by stop())
     * @param config Acquisition configuration
     * @throws std::invalid_argument on invalid configuration
     */
    explicit Imu(PacketSource& source, const ImuConfig& config = ImuConfig());

    /**
     * @brief Destructor (stops thread if running)
     */
    ~Imu();

    // Disable copy/move (manages thread lifetime)
    Imu(const Imu&) = delete;
    Imu& operator=(const Imu&) = delete;

    /**
     * @brief Start acquisition thread
     * @return true if started successfully; false if already started or
     *         if an earlier stop() abandoned a thread
     */
    bool start();

    /**
     * @brief Stop acquisition thread
     *
     * Signals the loop and joins within config.join_timeout_ms. The last
     * published batch stays readable through get_latest_batch().
     *
     * @return false if the thread did not exit in time (it is abandoned)
     */
    bool stop();

    /**
     * @brief Check if thread is running
     */
    bool is_running() const;

    /**
     * @brief Latest batch published since the previous call
     *
     * Called from the control loop only. Never blocks beyond a vector swap.
     */
    PacketBatch get_latest_batch();

    /**
     * @brief Acquisition statistics snapshot
     */
    AcquisitionStats get_stats() const;

    const ImuConfig& config() const { return config_; }

private:
    /**
     * @brief Everything the acquisition thread touches
     *
     * Held by shared_ptr from both the Imu and the running thread.
     */
    struct Worker {
        Worker(PacketSource& packet_source, const ImuConfig& imu_config);

        void run();

        /**
         * @brief Single acquisition iteration
         *
         * 1. receive() with bounded wait
         * 2. Classify by descriptor and reject out-of-order timestamps
         * 3. Publish the batch to the slot
         */
        void acquisition_cycle();

        PacketSource& source;
        const ImuConfig config;
        LatestBatchSlot slot;
        std::atomic<bool> running;

        // Acquisition thread only
        PacketBatch receive_buffer;
        timestamp_t last_timestamp_ns;
        bool have_timestamp;

        // Statistics
        std::atomic<uint64_t> loop_count;
        std::atomic<uint64_t> packets_received;
        std::atomic<uint64_t> raw_packets;
        std::atomic<uint64_t> estimated_packets;
        std::atomic<uint64_t> source_failures;
    };

    static void* thread_entry(void* arg);

    ImuConfig config_;
    std::shared_ptr<Worker> worker_;

    // === Thread Management ===

    pthread_t thread_;
    bool thread_created_;
    bool abandoned_;
};

}  // namespace airbrakes
