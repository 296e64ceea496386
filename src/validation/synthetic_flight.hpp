/**
 * @file synthetic_flight.hpp
 * @brief Synthetic sounding-rocket flight for hardware-free validation
 *
 * Purpose: Generate the packet stream an IMU would produce over a flight
 * made of constant-acceleration segments, with Gaussian sensor noise, and
 * replay it through the PacketSource interface.
 *
 * Sample Input:
 *   - Profile: 2 s pad, 3 s burn at 20 m/s², coast at 1 m/s² rising then
 *     falling 40 m
 *   - Rate: 100 Hz, one raw packet every 5 estimated packets
 *
 * Expected Output:
 *   - ~1200 estimated packets with non-decreasing timestamps
 *   - est_pressure_alt follows the segment climb rates
 *   - est_compensated_accel_z ≈ segment acceleration (± noise)
 */

#ifndef AIRBRAKES_VALIDATION_SYNTHETIC_FLIGHT_HPP
#define AIRBRAKES_VALIDATION_SYNTHETIC_FLIGHT_HPP

#include "core/packet_types.hpp"
#include "sensors/packet_source.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace airbrakes {

class SyntheticFlight {
public:
    /**
     * @brief Sensor noise (1-sigma)
     */
    struct NoiseParams {
        double accel_noise_std;     ///< Compensated accel noise [m/s²]
        double gyro_noise_std;      ///< Angular rate noise [rad/s]
        double altitude_noise_std;  ///< Pressure altitude noise [m]

        static NoiseParams default_sensor() {
            NoiseParams p;
            p.accel_noise_std = 0.05;
            p.gyro_noise_std = 0.001;
            p.altitude_noise_std = 0.05;
            return p;
        }

        static NoiseParams none() {
            NoiseParams p;
            p.accel_noise_std = 0.0;
            p.gyro_noise_std = 0.0;
            p.altitude_noise_std = 0.0;
            return p;
        }
    };

    /**
     * @brief Constant-condition flight segment
     */
    struct Segment {
        double duration_s;          ///< Segment length [s]
        double accel_z;             ///< Compensated acceleration along z [m/s²]
        double climb_rate_mps;      ///< Altitude rate during the segment [m/s]
    };

    /**
     * @param params Noise parameters
     * @param seed Random seed (0 = random)
     */
    explicit SyntheticFlight(const NoiseParams& params = NoiseParams::default_sensor(),
                             uint32_t seed = 0);

    /**
     * @brief Generate packets for a profile
     *
     * @param profile Segments flown in order
     * @param rate_hz Estimated packet rate [Hz]
     * @param raw_every Emit a raw packet after every raw_every estimated ones (0 = never)
     * @return Packets in timestamp order
     */
    PacketBatch generate(const std::vector<Segment>& profile, double rate_hz, int raw_every = 0);

    /**
     * @brief Pad -> burn -> coast up -> coast down
     *
     * 2 s at rest, 3 s at 20 m/s², 3 s at 1 m/s² climbing 20 m/s,
     * 4 s at 1 m/s² descending 10 m/s.
     */
    static std::vector<Segment> nominal_profile();

    /// First packet timestamp [ns]
    static constexpr timestamp_t START_TIME_NS = 1000000000LL;

    /// Pad altitude [m]
    static constexpr double GROUND_ALTITUDE_M = 1400.0;

private:
    float noisy(double value, double std_dev);

    NoiseParams params_;
    std::mt19937 rng_;
    std::normal_distribution<double> normal_dist_;
};

/**
 * @brief PacketSource replaying a fixed packet list
 *
 * Hands out packets_per_receive packets per receive() call, optionally
 * paced in real time. Once exhausted, receive() waits out its timeout and
 * returns nothing. Failures can be injected to exercise retry handling.
 */
class ScriptedPacketSource : public PacketSource {
public:
    /**
     * @param packets Packets to replay, in order
     * @param packets_per_receive Packets returned per receive() call
     * @param receive_delay_us Sleep per receive() call to emulate the sensor rate
     */
    explicit ScriptedPacketSource(PacketBatch packets,
                                  size_t packets_per_receive = 1,
                                  uint32_t receive_delay_us = 0);

    bool receive(int timeout_ms, PacketBatch& out) override;

    /// Every n-th receive() returns false (0 = never)
    void fail_every(uint32_t n) { fail_every_.store(n, std::memory_order_relaxed); }

    /// Every n-th receive() throws std::runtime_error (0 = never)
    void throw_every(uint32_t n) { throw_every_.store(n, std::memory_order_relaxed); }

    /// Block inside receive() until release() (simulates a hung driver)
    void hang();
    void release();

    bool exhausted() const { return exhausted_.load(std::memory_order_acquire); }

    uint64_t receive_calls() const { return calls_.load(std::memory_order_relaxed); }

    size_t total_packets() const { return packets_.size(); }

private:
    const PacketBatch packets_;
    const size_t packets_per_receive_;
    const uint32_t receive_delay_us_;

    size_t next_;                      // Acquisition thread only
    std::atomic<bool> exhausted_;
    std::atomic<uint64_t> calls_;
    std::atomic<uint32_t> fail_every_;
    std::atomic<uint32_t> throw_every_;

    std::mutex hang_mutex_;
    std::condition_variable hang_cv_;
    bool hanging_;
};

} // namespace airbrakes

#endif // AIRBRAKES_VALIDATION_SYNTHETIC_FLIGHT_HPP
