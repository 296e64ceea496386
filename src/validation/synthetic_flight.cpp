/**
 * @file synthetic_flight.cpp
 * @brief Implementation of the synthetic flight generator and replay source
 */

#include "synthetic_flight.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

namespace airbrakes {

// ========== SyntheticFlight ==========

SyntheticFlight::SyntheticFlight(const NoiseParams& params, uint32_t seed)
    : params_(params),
      normal_dist_(0.0, 1.0)
{
    if (seed == 0) {
        seed = static_cast<uint32_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    rng_.seed(seed);
}

float SyntheticFlight::noisy(double value, double std_dev) {
    if (std_dev <= 0.0) {
        return static_cast<float>(value);
    }
    return static_cast<float>(value + std_dev * normal_dist_(rng_));
}

std::vector<SyntheticFlight::Segment> SyntheticFlight::nominal_profile() {
    return {
        {2.0, 0.0, 0.0},     // On the pad
        {3.0, 20.0, 30.0},   // Motor burn
        {3.0, 1.0, 20.0},    // Coast, climbing
        {4.0, 1.0, -10.0},   // Past apogee, descending
    };
}

PacketBatch SyntheticFlight::generate(const std::vector<Segment>& profile,
                                      double rate_hz, int raw_every) {
    if (!(rate_hz > 0.0)) {
        throw std::invalid_argument("SyntheticFlight: rate_hz must be positive");
    }

    const double dt = 1.0 / rate_hz;
    const timestamp_t dt_ns = seconds_to_ns(dt);

    PacketBatch packets;
    timestamp_t t_ns = START_TIME_NS;
    double altitude = GROUND_ALTITUDE_M;
    int estimated_count = 0;

    for (const auto& segment : profile) {
        const int num_samples = static_cast<int>(std::lround(segment.duration_s * rate_hz));

        for (int i = 0; i < num_samples; i++) {
            EstimatedPacket est(t_ns);
            est.est_pressure_alt = noisy(altitude, params_.altitude_noise_std);
            est.est_compensated_accel_x = noisy(0.0, params_.accel_noise_std);
            est.est_compensated_accel_y = noisy(0.0, params_.accel_noise_std);
            est.est_compensated_accel_z = noisy(segment.accel_z, params_.accel_noise_std);
            est.est_angular_rate_x = noisy(0.0, params_.gyro_noise_std);
            est.est_angular_rate_y = noisy(0.0, params_.gyro_noise_std);
            est.est_angular_rate_z = noisy(0.0, params_.gyro_noise_std);
            est.est_orient_quaternion = Quaternion4f{1.0f, 0.0f, 0.0f, 0.0f};
            est.est_filter_state = 4;   // Full navigation
            packets.push_back(est);
            estimated_count++;

            if (raw_every > 0 && estimated_count % raw_every == 0) {
                // Raw accelerometer still sees gravity
                RawPacket raw(t_ns);
                raw.scaled_accel_x = noisy(0.0, params_.accel_noise_std);
                raw.scaled_accel_y = noisy(0.0, params_.accel_noise_std);
                raw.scaled_accel_z = noisy(segment.accel_z + GRAVITY, params_.accel_noise_std);
                raw.scaled_gyro_x = noisy(0.0, params_.gyro_noise_std);
                raw.scaled_gyro_y = noisy(0.0, params_.gyro_noise_std);
                raw.scaled_gyro_z = noisy(0.0, params_.gyro_noise_std);
                packets.push_back(raw);
            }

            altitude += segment.climb_rate_mps * dt;
            t_ns += dt_ns;
        }
    }

    return packets;
}

// ========== ScriptedPacketSource ==========

ScriptedPacketSource::ScriptedPacketSource(PacketBatch packets,
                                           size_t packets_per_receive,
                                           uint32_t receive_delay_us)
    : packets_(std::move(packets)),
      packets_per_receive_(packets_per_receive == 0 ? 1 : packets_per_receive),
      receive_delay_us_(receive_delay_us),
      next_(0),
      exhausted_(packets_.empty()),
      calls_(0),
      fail_every_(0),
      throw_every_(0),
      hanging_(false) {}

void ScriptedPacketSource::hang() {
    std::lock_guard<std::mutex> lock(hang_mutex_);
    hanging_ = true;
}

void ScriptedPacketSource::release() {
    {
        std::lock_guard<std::mutex> lock(hang_mutex_);
        hanging_ = false;
    }
    hang_cv_.notify_all();
}

bool ScriptedPacketSource::receive(int timeout_ms, PacketBatch& out) {
    const uint64_t call = calls_.fetch_add(1, std::memory_order_relaxed) + 1;

    {
        // A hung driver ignores its timeout
        std::unique_lock<std::mutex> lock(hang_mutex_);
        hang_cv_.wait(lock, [this] { return !hanging_; });
    }

    const uint32_t throw_n = throw_every_.load(std::memory_order_relaxed);
    if (throw_n > 0 && call % throw_n == 0) {
        throw std::runtime_error("scripted serial read error");
    }

    const uint32_t fail_n = fail_every_.load(std::memory_order_relaxed);
    if (fail_n > 0 && call % fail_n == 0) {
        return false;
    }

    if (next_ >= packets_.size()) {
        exhausted_.store(true, std::memory_order_release);
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return true;
    }

    if (receive_delay_us_ > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(receive_delay_us_));
    }

    const size_t end = std::min(packets_.size(), next_ + packets_per_receive_);
    out.insert(out.end(), packets_.begin() + static_cast<std::ptrdiff_t>(next_),
               packets_.begin() + static_cast<std::ptrdiff_t>(end));
    next_ = end;

    if (next_ >= packets_.size()) {
        exhausted_.store(true, std::memory_order_release);
    }
    return true;
}

} // namespace airbrakes
