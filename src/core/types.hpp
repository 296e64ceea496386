/**
 * @file types.hpp
 * @brief Core type definitions for the airbrakes flight software
 *
 * Purpose: Strongly-typed aliases for the math types used by the data
 * processor and the state machine. Eigen is used for the acceleration
 * vectors so averages and norms read like the math.
 *
 * References:
 * - Eigen: https://eigen.tuxfamily.org/dox/group__QuickRefPage.html
 *
 * Sample Input: N/A (type definitions only)
 * Expected Output: Compile-time type safety for derived flight quantities
 */

#ifndef AIRBRAKES_CORE_TYPES_HPP
#define AIRBRAKES_CORE_TYPES_HPP

#include <Eigen/Dense>
#include <array>
#include <cstdint>

namespace airbrakes {

// ========== Derived quantities (double precision) ==========

using Vector3d = Eigen::Vector3d;

// ========== Sensor channels (single precision) ==========
// The sensor reports float32 channels; quaternions are stored as plain
// arrays [w, x, y, z] so packets stay trivially copyable.

using Quaternion4f = std::array<float, 4>;

// ========== Constants ==========

constexpr double GRAVITY = 9.80665;  // m/s² (standard gravity)

// Timestamp type (nanoseconds, monotonic, arbitrary epoch)
using timestamp_t = int64_t;

constexpr double NS_PER_SECOND = 1e9;

inline double ns_to_seconds(timestamp_t ns) {
    return static_cast<double>(ns) / NS_PER_SECOND;
}

inline timestamp_t seconds_to_ns(double seconds) {
    return static_cast<timestamp_t>(seconds * NS_PER_SECOND);
}

} // namespace airbrakes

#endif // AIRBRAKES_CORE_TYPES_HPP
