/**
 * @file packet_types.hpp
 * @brief Inertial data packets as delivered by the acquisition stage
 *
 * Purpose: Logical packet shape emitted by the IMU driver. Each packet is
 * either Raw (unfiltered sensor channels, descriptor set 0x80) or Estimated
 * (output of the sensor's onboard filter, descriptor set 0x82). Every channel
 * is optional: a frame only carries the channels the sensor reported.
 *
 * References:
 * - MIP descriptor sets (MicroStrain 3DM-CX5-AR user manual)
 *
 * Sample Input:
 *   EstimatedPacket p(1'000'000'000);
 *   p.est_pressure_alt = 1412.5f;
 *
 * Expected Output:
 *   Packet pkt = p;  // tag fixed to Estimated for the packet's lifetime
 *   is_estimated(pkt) == true, packet_timestamp(pkt) == 1'000'000'000
 */

#ifndef AIRBRAKES_CORE_PACKET_TYPES_HPP
#define AIRBRAKES_CORE_PACKET_TYPES_HPP

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace airbrakes {

/// MIP descriptor set of raw sensor data packets
constexpr uint8_t RAW_DESCRIPTOR_SET = 0x80;

/// MIP descriptor set of filter (estimated) data packets
constexpr uint8_t ESTIMATED_DESCRIPTOR_SET = 0x82;

// ========== Raw Packet ==========

/**
 * @brief Unfiltered sensor frame
 */
struct RawPacket {
    timestamp_t timestamp_ns;   ///< Collection time [ns]

    // GPS correlation
    std::optional<uint16_t> gps_correl_timestamp_flags;
    std::optional<double> gps_correl_timestamp_tow;      ///< Time of week [s]
    std::optional<uint16_t> gps_correl_timestamp_week_num;

    // Scaled accelerometer [m/s²], body frame
    std::optional<float> scaled_accel_x;
    std::optional<float> scaled_accel_y;
    std::optional<float> scaled_accel_z;

    // Scaled gyroscope [rad/s], body frame
    std::optional<float> scaled_gyro_x;
    std::optional<float> scaled_gyro_y;
    std::optional<float> scaled_gyro_z;

    explicit RawPacket(timestamp_t timestamp = 0) : timestamp_ns(timestamp) {}
};

// ========== Estimated Packet ==========

/**
 * @brief Filter output frame
 */
struct EstimatedPacket {
    timestamp_t timestamp_ns;   ///< Collection time [ns]

    // Filter GPS time
    std::optional<double> est_filter_gps_time_tow;       ///< Time of week [s]
    std::optional<uint16_t> est_filter_gps_time_week_num;

    // Attitude
    std::optional<Quaternion4f> est_orient_quaternion;          ///< [w, x, y, z]
    std::optional<Quaternion4f> est_attitude_uncert_quaternion; ///< 1-sigma

    // Filter status
    std::optional<uint16_t> est_filter_state;
    std::optional<uint16_t> est_filter_dynamics_mode;
    std::optional<uint16_t> est_filter_status_flags;

    std::optional<float> est_pressure_alt;   ///< Pressure altitude [m]

    // Angular rate [rad/s], body frame
    std::optional<float> est_angular_rate_x;
    std::optional<float> est_angular_rate_y;
    std::optional<float> est_angular_rate_z;

    // Gravity-compensated acceleration [m/s²], body frame
    std::optional<float> est_compensated_accel_x;
    std::optional<float> est_compensated_accel_y;
    std::optional<float> est_compensated_accel_z;

    explicit EstimatedPacket(timestamp_t timestamp = 0) : timestamp_ns(timestamp) {}
};

// ========== Packet ==========

/// Tagged union; the alternative is chosen at construction and never changes
using Packet = std::variant<RawPacket, EstimatedPacket>;

/// Packets delivered together, in arrival order
using PacketBatch = std::vector<Packet>;

inline bool is_estimated(const Packet& packet) {
    return std::holds_alternative<EstimatedPacket>(packet);
}

inline bool is_raw(const Packet& packet) {
    return std::holds_alternative<RawPacket>(packet);
}

inline timestamp_t packet_timestamp(const Packet& packet) {
    return std::visit([](const auto& p) { return p.timestamp_ns; }, packet);
}

/// Short label used in diagnostics ("raw" / "estimated")
inline const char* packet_kind(const Packet& packet) {
    return is_estimated(packet) ? "estimated" : "raw";
}

} // namespace airbrakes

#endif // AIRBRAKES_CORE_PACKET_TYPES_HPP
