/**
 * @file servo.hpp
 * @brief Boundary to the airbrake actuator
 *
 * Purpose: The control loop commands the airbrake through ActuatorSink with
 * a normalized extension, 0.0 = stowed, 1.0 = fully deployed. The hardware
 * driver maps this onto its own PWM range; that mapping lives outside this
 * repo.
 *
 * SimulatedServo records commands instead of moving hardware; the desktop
 * executable and the tests use it.
 */

#ifndef AIRBRAKES_ACTUATION_SERVO_HPP
#define AIRBRAKES_ACTUATION_SERVO_HPP

#include <algorithm>
#include <atomic>
#include <cstdint>

namespace airbrakes {

class ActuatorSink {
public:
    virtual ~ActuatorSink() = default;

    /**
     * @brief Drive the airbrake to the given extension
     * @param extension Normalized extension, already clamped to [0, 1]
     */
    virtual void set_extension(double extension) = 0;
};

/// Clamp a requested extension into the actuator's range
inline double clamp_to_actuator_range(double extension) {
    return std::clamp(extension, 0.0, 1.0);
}

class SimulatedServo : public ActuatorSink {
public:
    SimulatedServo() : extension_(0.0), commands_(0), max_extension_(0.0) {}

    void set_extension(double extension) override {
        extension_.store(extension, std::memory_order_relaxed);
        commands_.fetch_add(1, std::memory_order_relaxed);
        if (extension > max_extension_.load(std::memory_order_relaxed)) {
            max_extension_.store(extension, std::memory_order_relaxed);
        }
    }

    /// Last commanded extension
    double extension() const { return extension_.load(std::memory_order_relaxed); }

    /// Number of set_extension() calls
    uint64_t command_count() const { return commands_.load(std::memory_order_relaxed); }

    /// Largest extension ever commanded
    double max_extension() const { return max_extension_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> extension_;
    std::atomic<uint64_t> commands_;
    std::atomic<double> max_extension_;
};

} // namespace airbrakes

#endif // AIRBRAKES_ACTUATION_SERVO_HPP
