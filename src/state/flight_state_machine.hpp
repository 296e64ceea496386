/**
 * @file flight_state_machine.hpp
 * @brief Flight phase detection and airbrake command authority
 *
 * Purpose: Decides which phase of flight the rocket is in and the extension
 * to command. Phases only move forward:
 *
 *   StandBy -> MotorBurn -> Coast -> FreeFall
 *
 * - StandBy:   avg accel magnitude > launch threshold for launch dwell
 * - MotorBurn: avg accel magnitude < burnout threshold for burnout dwell
 * - Coast:     current altitude < max altitude - apogee margin
 * - FreeFall:  terminal
 *
 * Dwell times are measured on packet timestamps, not wall clock, so the
 * decision only depends on the data. Missing data (empty window, no
 * altitude yet) holds the current phase.
 *
 * Per tick:
 *   machine.update(processor.snapshot());
 *   machine.next_phase_if_ready();   // at most one transition
 *   servo.set_extension(machine.extension());
 */

#ifndef AIRBRAKES_STATE_FLIGHT_STATE_MACHINE_HPP
#define AIRBRAKES_STATE_FLIGHT_STATE_MACHINE_HPP

#include "processing/data_processor.hpp"
#include "service/service_types.hpp"
#include "state/coast_policy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>

namespace airbrakes {

enum class FlightPhase : uint8_t {
    StandBy = 0,
    MotorBurn = 1,
    Coast = 2,
    FreeFall = 3
};

/// Label written to the flight log ("StandBy", "MotorBurn", ...)
const char* phase_name(FlightPhase phase);

// ========== Per-phase state ==========

struct StandByState {
    std::optional<timestamp_t> above_since_ns;  ///< First tick above launch threshold
    bool ready = false;
};

struct MotorBurnState {
    std::optional<timestamp_t> below_since_ns;  ///< First tick below burnout threshold
    bool ready = false;
};

struct CoastState {
    double extension = 0.0;                     ///< Last policy output (clamped)
    bool ready = false;
};

struct FreeFallState {};

using PhaseState = std::variant<StandByState, MotorBurnState, CoastState, FreeFallState>;

class FlightStateMachine {
public:
    /**
     * @param config Detection thresholds
     * @param coast_policy Extension policy for Coast
     *        (default: FixedExtensionPolicy(config.coast_extension))
     * @throws std::invalid_argument on invalid configuration
     */
    explicit FlightStateMachine(const StateMachineConfig& config = StateMachineConfig(),
                                std::unique_ptr<CoastPolicy> coast_policy = nullptr);

    // Non-copyable (owns the policy)
    FlightStateMachine(const FlightStateMachine&) = delete;
    FlightStateMachine& operator=(const FlightStateMachine&) = delete;

    /**
     * @brief Feed this tick's processor outputs to the active phase
     *
     * Only the active phase's dwell bookkeeping changes.
     */
    void update(const ProcessedData& data);

    /**
     * @brief Advance to the next phase if the active phase is ready
     * @return true if a transition happened
     */
    bool next_phase_if_ready();

    FlightPhase phase() const { return static_cast<FlightPhase>(state_.index()); }

    const char* phase_label() const { return phase_name(phase()); }

    /// Commanded extension in [0, 1]; always 0 outside Coast
    double extension() const;

    /// Phase-specific state (for diagnostics and tests)
    const PhaseState& state() const { return state_; }

    uint32_t transition_count() const { return transition_count_; }

    /// Data timestamp of the most recent transition
    std::optional<timestamp_t> last_transition_ns() const { return last_transition_ns_; }

private:
    void update_stand_by(StandByState& s, const ProcessedData& data);
    void update_motor_burn(MotorBurnState& s, const ProcessedData& data);
    void update_coast(CoastState& s, const ProcessedData& data);

    StateMachineConfig config_;
    std::unique_ptr<CoastPolicy> coast_policy_;

    PhaseState state_;
    std::optional<timestamp_t> last_data_ns_;
    std::optional<timestamp_t> last_transition_ns_;
    uint32_t transition_count_;
};

} // namespace airbrakes

#endif // AIRBRAKES_STATE_FLIGHT_STATE_MACHINE_HPP
