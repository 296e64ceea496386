/**
 * @file data_processor.hpp
 * @brief Rolling-window flight quantities derived from estimated packets
 *
 * Purpose: Turns the packets of each control tick into the quantities the
 * flight state machine decides on: averaged compensated acceleration,
 * current altitude and the highest altitude reached so far.
 *
 * Only EstimatedPacket entries enter the window; raw packets are ignored
 * and never affect altitude. The window keeps the last N estimated packets
 * in arrival order, evicting the oldest first.
 *
 * Sample Input:
 *   DataProcessor processor(config);   // window_size = 10
 *   processor.update(batch);           // 3 estimated packets, accel z = 20
 *
 * Expected Output:
 *   processor.avg_acceleration()           == (0, 0, 20)
 *   processor.avg_acceleration_magnitude() == 20
 *   processor.max_altitude()               == highest est_pressure_alt seen
 */

#ifndef AIRBRAKES_PROCESSING_DATA_PROCESSOR_HPP
#define AIRBRAKES_PROCESSING_DATA_PROCESSOR_HPP

#include "core/packet_types.hpp"
#include "core/types.hpp"
#include "service/service_types.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace airbrakes {

/**
 * @brief Snapshot of the processor outputs for one tick
 *
 * Handed to the state machine by value so it never sees a half-updated
 * processor.
 */
struct ProcessedData {
    Vector3d avg_acceleration;              ///< Mean compensated accel [m/s²]
    double avg_acceleration_magnitude;      ///< |mean accel| [m/s²]
    std::optional<double> current_altitude; ///< Newest windowed pressure altitude [m]
    std::optional<double> max_altitude;     ///< Highest altitude so far [m]
    std::optional<double> vertical_velocity;///< Altitude slope over window [m/s]
    std::optional<timestamp_t> timestamp_ns;///< Newest window entry [ns]
    size_t window_size;                     ///< Entries currently averaged

    ProcessedData()
        : avg_acceleration(Vector3d::Zero()),
          avg_acceleration_magnitude(0.0),
          window_size(0) {}
};

class DataProcessor {
public:
    /**
     * @param config Window configuration
     * @throws std::invalid_argument if window_size == 0
     */
    explicit DataProcessor(const ProcessorConfig& config = ProcessorConfig());

    /**
     * @brief Append the estimated packets of a batch and recompute
     *
     * Called once per control tick, also with an empty batch.
     */
    void update(const PacketBatch& new_packets);

    // === Accessors (pure reads) ===

    /// Per-axis mean of compensated acceleration; zero vector when empty
    const Vector3d& avg_acceleration() const { return avg_accel_; }

    /// Z component of the averaged acceleration [m/s²]
    double avg_acceleration_z() const { return avg_accel_.z(); }

    /// Euclidean norm of the averaged vector (not the mean of norms)
    double avg_acceleration_magnitude() const { return avg_accel_mag_; }

    /// Most recent pressure altitude; empty until one has been reported
    std::optional<double> current_altitude() const { return current_altitude_; }

    /// Highest altitude observed; never decreases, never reset
    std::optional<double> max_altitude() const { return max_altitude_; }

    /// Altitude rate between the oldest and newest window entries [m/s]
    std::optional<double> vertical_velocity() const { return vertical_velocity_; }

    size_t window_size() const { return window_.size(); }
    size_t window_capacity() const { return capacity_; }

    /// Window contents, oldest first
    const std::deque<EstimatedPacket>& window() const { return window_; }

    /**
     * @brief Copy of all outputs for the state machine
     */
    ProcessedData snapshot() const;

private:
    void compute_averages();
    void compute_altitude();

    const size_t capacity_;
    std::deque<EstimatedPacket> window_;

    Vector3d avg_accel_;
    double avg_accel_mag_;
    std::optional<double> current_altitude_;
    std::optional<double> max_altitude_;
    std::optional<double> vertical_velocity_;
};

} // namespace airbrakes

#endif // AIRBRAKES_PROCESSING_DATA_PROCESSOR_HPP
