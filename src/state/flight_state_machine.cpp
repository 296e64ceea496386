/**
 * @file flight_state_machine.cpp
 * @brief Implementation of the flight phase state machine
 */

#include "flight_state_machine.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace airbrakes {

// phase() maps the variant index onto FlightPhase
static_assert(std::variant_size_v<PhaseState> == 4, "one alternative per FlightPhase");
static_assert(std::is_same_v<std::variant_alternative_t<0, PhaseState>, StandByState>, "");
static_assert(std::is_same_v<std::variant_alternative_t<1, PhaseState>, MotorBurnState>, "");
static_assert(std::is_same_v<std::variant_alternative_t<2, PhaseState>, CoastState>, "");
static_assert(std::is_same_v<std::variant_alternative_t<3, PhaseState>, FreeFallState>, "");

namespace {

double clamp_extension(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

const StateMachineConfig& validated(const StateMachineConfig& config) {
    config.validate();
    return config;
}

}  // namespace

const char* phase_name(FlightPhase phase) {
    switch (phase) {
        case FlightPhase::StandBy:   return "StandBy";
        case FlightPhase::MotorBurn: return "MotorBurn";
        case FlightPhase::Coast:     return "Coast";
        case FlightPhase::FreeFall:  return "FreeFall";
    }
    return "Unknown";
}

FlightStateMachine::FlightStateMachine(const StateMachineConfig& config,
                                       std::unique_ptr<CoastPolicy> coast_policy)
    : config_(validated(config)),
      coast_policy_(std::move(coast_policy)),
      state_(StandByState{}),
      transition_count_(0) {

    if (!coast_policy_) {
        coast_policy_ = std::make_unique<FixedExtensionPolicy>(config_.coast_extension);
    }
}

// === Per-tick update ===

void FlightStateMachine::update(const ProcessedData& data) {
    if (data.timestamp_ns) {
        last_data_ns_ = data.timestamp_ns;
    }

    if (auto* stand_by = std::get_if<StandByState>(&state_)) {
        update_stand_by(*stand_by, data);
    } else if (auto* motor_burn = std::get_if<MotorBurnState>(&state_)) {
        update_motor_burn(*motor_burn, data);
    } else if (auto* coast = std::get_if<CoastState>(&state_)) {
        update_coast(*coast, data);
    }
    // FreeFall: nothing to track
}

void FlightStateMachine::update_stand_by(StandByState& s, const ProcessedData& data) {
    if (!data.timestamp_ns) {
        return;  // No estimated data yet
    }
    const timestamp_t now = *data.timestamp_ns;

    if (data.avg_acceleration_magnitude > config_.launch_accel_threshold) {
        if (!s.above_since_ns) {
            s.above_since_ns = now;
        }
        s.ready = ns_to_seconds(now - *s.above_since_ns) >= config_.launch_dwell_s;
    } else {
        s.above_since_ns.reset();
        s.ready = false;
    }
}

void FlightStateMachine::update_motor_burn(MotorBurnState& s, const ProcessedData& data) {
    if (!data.timestamp_ns) {
        return;
    }
    const timestamp_t now = *data.timestamp_ns;

    if (data.avg_acceleration_magnitude < config_.burnout_accel_threshold) {
        if (!s.below_since_ns) {
            s.below_since_ns = now;
        }
        s.ready = ns_to_seconds(now - *s.below_since_ns) >= config_.burnout_dwell_s;
    } else {
        s.below_since_ns.reset();
        s.ready = false;
    }
}

void FlightStateMachine::update_coast(CoastState& s, const ProcessedData& data) {
    s.extension = clamp_extension(coast_policy_->extension(data));

    if (!data.current_altitude || !data.max_altitude) {
        s.ready = false;  // Hold until altitude is known
        return;
    }

    s.ready = (*data.max_altitude - *data.current_altitude) > config_.apogee_margin_m;
}

// === Transitions ===

bool FlightStateMachine::next_phase_if_ready() {
    const FlightPhase from = phase();

    // Only the active phase's single successor is considered
    switch (from) {
        case FlightPhase::StandBy:
            if (!std::get<StandByState>(state_).ready) return false;
            state_ = MotorBurnState{};
            break;
        case FlightPhase::MotorBurn:
            if (!std::get<MotorBurnState>(state_).ready) return false;
            state_ = CoastState{};
            break;
        case FlightPhase::Coast:
            if (!std::get<CoastState>(state_).ready) return false;
            state_ = FreeFallState{};
            break;
        case FlightPhase::FreeFall:
            return false;
    }

    transition_count_++;
    last_transition_ns_ = last_data_ns_;

    LOG_INFO("Phase transition: %s -> %s (t=%.3f s)",
             phase_name(from), phase_label(),
             last_data_ns_ ? ns_to_seconds(*last_data_ns_) : 0.0);
    return true;
}

double FlightStateMachine::extension() const {
    if (const auto* coast = std::get_if<CoastState>(&state_)) {
        return coast->extension;
    }
    return 0.0;
}

} // namespace airbrakes
