// IMU Acquisition Thread Implementation

#include "sensors/imu.hpp"
#include "utils/logger.hpp"
#include "utils/thread_utils.hpp"

#include <exception>
#include <utility>

namespace airbrakes {

namespace {

// Consecutive failures logged individually before switching to a summary
constexpr uint64_t kLoggedFailureBurst = 5;

const ImuConfig& validated(const ImuConfig& config) {
    config.validate();
    return config;
}

}  // namespace

// === Constructor/Destructor ===

Imu::Worker::Worker(PacketSource& packet_source, const ImuConfig& imu_config)
    : source(packet_source),
      config(imu_config),
      running(false),
      last_timestamp_ns(0),
      have_timestamp(false),
      loop_count(0),
      packets_received(0),
      raw_packets(0),
      estimated_packets(0),
      source_failures(0) {}

Imu::Imu(PacketSource& source, const ImuConfig& config)
    : config_(validated(config)),
      worker_(std::make_shared<Worker>(source, config_)),
      thread_(0),
      thread_created_(false),
      abandoned_(false) {

    LOG_INFO("Imu created (port: %s, rate: %.1f Hz, receive timeout: %d ms)",
             config_.port.c_str(), config_.sampling_frequency_hz,
             config_.receive_timeout_ms());
}

Imu::~Imu() {
    if (thread_created_) {
        LOG_WARN("Imu destroyed while running, stopping...");
        stop();
    }
}

// === Thread Management ===

bool Imu::start() {
    if (abandoned_) {
        LOG_ERROR("Imu cannot restart, an abandoned acquisition thread may still run");
        return false;
    }
    if (thread_created_ || is_running()) {
        LOG_WARN("Imu already started");
        return false;
    }

    worker_->running.store(true, std::memory_order_release);

    // The thread's own reference, released when the thread exits
    auto* thread_ref = new std::shared_ptr<Worker>(worker_);

    if (!spawn_worker(thread_, thread_entry, thread_ref, config_.thread_priority)) {
        delete thread_ref;
        worker_->running.store(false, std::memory_order_release);
        return false;
    }

    thread_created_ = true;
    LOG_INFO("Imu acquisition started");
    return true;
}

bool Imu::stop() {
    worker_->running.store(false, std::memory_order_release);

    if (!thread_created_) {
        return !abandoned_;
    }

    LOG_INFO("Stopping Imu...");

    // Loop observes the flag after at most one receive timeout
    const uint32_t timeout_ms =
        config_.join_timeout_ms + static_cast<uint32_t>(config_.receive_timeout_ms());

    thread_created_ = false;

    if (!join_with_timeout(thread_, timeout_ms)) {
        LOG_ERROR("Imu thread did not exit within %u ms, abandoning it", timeout_ms);
        pthread_detach(thread_);
        abandoned_ = true;
        return false;
    }

    LOG_INFO("Imu stopped (loops: %llu, packets: %llu, failures: %llu)",
             static_cast<unsigned long long>(worker_->loop_count.load()),
             static_cast<unsigned long long>(worker_->packets_received.load()),
             static_cast<unsigned long long>(worker_->source_failures.load()));
    return true;
}

bool Imu::is_running() const {
    return worker_->running.load(std::memory_order_acquire);
}

PacketBatch Imu::get_latest_batch() {
    return worker_->slot.take();
}

void* Imu::thread_entry(void* arg) {
    std::unique_ptr<std::shared_ptr<Worker>> thread_ref(static_cast<std::shared_ptr<Worker>*>(arg));
    Worker& worker = **thread_ref;

    pin_current_thread(worker.config.cpu_affinity);
    worker.run();
    return nullptr;
}

// === Acquisition Loop ===

void Imu::Worker::run() {
    LOG_INFO("Acquisition loop starting");

    while (running.load(std::memory_order_acquire)) {
        acquisition_cycle();
        loop_count.fetch_add(1, std::memory_order_relaxed);
    }

    LOG_INFO("Acquisition loop exiting");
}

void Imu::Worker::acquisition_cycle() {
    receive_buffer.clear();

    // Step 1: Bounded receive; failures are retried next iteration
    bool ok = false;
    try {
        ok = source.receive(config.receive_timeout_ms(), receive_buffer);
    } catch (const std::exception& e) {
        LOG_WARN("IMU receive threw: %s", e.what());
        ok = false;
    }

    if (!ok) {
        uint64_t failures = source_failures.fetch_add(1, std::memory_order_relaxed) + 1;
        if (failures <= kLoggedFailureBurst) {
            LOG_WARN("IMU read failed (failure %llu), retrying",
                     static_cast<unsigned long long>(failures));
        } else if (failures % 1000 == 0) {
            LOG_WARN("IMU read failures so far: %llu",
                     static_cast<unsigned long long>(failures));
        }
        return;
    }

    if (receive_buffer.empty()) {
        return;
    }

    // Step 2: Classify and enforce non-decreasing timestamps
    PacketBatch accepted;
    accepted.reserve(receive_buffer.size());

    for (auto& packet : receive_buffer) {
        timestamp_t ts = packet_timestamp(packet);
        if (have_timestamp && ts < last_timestamp_ns) {
            LOG_WARN("Dropping out-of-order %s packet (t=%lld < %lld)",
                     packet_kind(packet), static_cast<long long>(ts),
                     static_cast<long long>(last_timestamp_ns));
            continue;
        }
        last_timestamp_ns = ts;
        have_timestamp = true;

        if (is_estimated(packet)) {
            estimated_packets.fetch_add(1, std::memory_order_relaxed);
        } else {
            raw_packets.fetch_add(1, std::memory_order_relaxed);
        }
        accepted.push_back(std::move(packet));
    }

    packets_received.fetch_add(accepted.size(), std::memory_order_relaxed);

    // Step 3: Replace the latest batch
    slot.publish(std::move(accepted));
}

// === Statistics ===

AcquisitionStats Imu::get_stats() const {
    AcquisitionStats stats;
    stats.loop_count = worker_->loop_count.load(std::memory_order_relaxed);
    stats.packets_received = worker_->packets_received.load(std::memory_order_relaxed);
    stats.raw_packets = worker_->raw_packets.load(std::memory_order_relaxed);
    stats.estimated_packets = worker_->estimated_packets.load(std::memory_order_relaxed);
    stats.batches_published = worker_->slot.sequence();
    stats.source_failures = worker_->source_failures.load(std::memory_order_relaxed);
    stats.packets_superseded = worker_->slot.superseded();
    return stats;
}

}  // namespace airbrakes
