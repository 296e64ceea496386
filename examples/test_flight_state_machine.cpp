// Flight State Machine Test
//
// Purpose: Validate phase detection and airbrake commands
// Tests: Launch dwell, burnout, apogee, forward-only ordering, missing data, coast policy
//
// Expected Output:
// - StandBy -> MotorBurn -> Coast -> FreeFall, one step per tick at most
// - Extension is zero outside Coast and always within [0, 1]
// - Phase holds when data is missing
// - All tests pass

#include "processing/data_processor.hpp"
#include "state/flight_state_machine.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

using namespace airbrakes;

namespace {

constexpr timestamp_t TICK_NS = 10000000;  // 100 Hz

ProcessedData make_data(timestamp_t t_ns, double accel_magnitude, double altitude, double max_altitude) {
    ProcessedData data;
    data.avg_acceleration = Vector3d(0.0, 0.0, accel_magnitude);
    data.avg_acceleration_magnitude = accel_magnitude;
    data.current_altitude = altitude;
    data.max_altitude = max_altitude;
    data.timestamp_ns = t_ns;
    data.window_size = 10;
    return data;
}

// One control tick
bool step(FlightStateMachine& sm, const ProcessedData& data) {
    sm.update(data);
    return sm.next_phase_if_ready();
}

// Policy returning whatever the test sets
class ScriptedPolicy : public CoastPolicy {
public:
    explicit ScriptedPolicy(double value) : value_(value) {}
    double extension(const ProcessedData&) override { return value_; }
    void set(double value) { value_ = value; }

private:
    double value_;
};

}  // namespace

// Test 1: Initial phase
bool test_initial_state() {
    std::cout << "\n=== Test 1: Initial State ===" << std::endl;

    FlightStateMachine sm;

    if (sm.phase() != FlightPhase::StandBy || std::string(sm.phase_label()) != "StandBy") {
        std::cerr << "✗ Initial phase is " << sm.phase_label() << std::endl;
        return false;
    }
    if (sm.extension() != 0.0 || sm.transition_count() != 0 || sm.last_transition_ns()) {
        std::cerr << "✗ Initial state not clean" << std::endl;
        return false;
    }

    std::cout << "✓ Test 1: PASSED" << std::endl;
    return true;
}

// Test 2: Sustained 15 m/s² launches within the dwell time
bool test_launch_detection() {
    std::cout << "\n=== Test 2: Launch Detection ===" << std::endl;

    FlightStateMachine sm;  // 12 m/s² for 0.1 s
    timestamp_t t = 0;

    // Pad noise never triggers
    for (int i = 0; i < 200; i++) {
        step(sm, make_data(t, 9.0 + 0.5 * std::sin(i), 0.0, 0.0));
        t += TICK_NS;
    }
    if (sm.phase() != FlightPhase::StandBy) {
        std::cerr << "✗ Left StandBy on pad noise" << std::endl;
        return false;
    }

    // A short spike is not a launch
    for (int i = 0; i < 5; i++) {
        step(sm, make_data(t, 15.0, 0.0, 0.0));
        t += TICK_NS;
    }
    step(sm, make_data(t, 9.8, 0.0, 0.0));
    t += TICK_NS;
    if (sm.phase() != FlightPhase::StandBy) {
        std::cerr << "✗ 50 ms spike treated as launch" << std::endl;
        return false;
    }

    // Sustained thrust
    const timestamp_t launch_t = t;
    int ticks = 0;
    while (sm.phase() == FlightPhase::StandBy && ticks < 100) {
        step(sm, make_data(t, 15.0, 1.0, 1.0));
        t += TICK_NS;
        ticks++;
    }

    if (sm.phase() != FlightPhase::MotorBurn) {
        std::cerr << "✗ No launch detected after " << ticks << " ticks" << std::endl;
        return false;
    }

    // Dwell 0.1 s at 100 Hz → transition on the 11th tick above threshold
    double detect_s = ns_to_seconds(*sm.last_transition_ns() - launch_t);
    if (ticks != 11 || std::fabs(detect_s - 0.1) > 1e-9) {
        std::cerr << "✗ Launch after " << ticks << " ticks (" << detect_s << " s)" << std::endl;
        return false;
    }
    if (sm.extension() != 0.0) {
        std::cerr << "✗ Nonzero extension during MotorBurn" << std::endl;
        return false;
    }

    std::cout << "  Launch confirmed after " << detect_s * 1000.0 << " ms" << std::endl;
    std::cout << "✓ Test 2: PASSED" << std::endl;
    return true;
}

// Test 3: Full flight, forward-only, one transition per tick
bool test_full_sequence() {
    std::cout << "\n=== Test 3: Full Sequence ===" << std::endl;

    FlightStateMachine sm;
    timestamp_t t = 0;
    double altitude = 0.0;
    double max_altitude = 0.0;
    FlightPhase previous = sm.phase();
    bool saw_coast_extension = false;

    // Burn 2 s, coast up 3 s, then descend
    for (int i = 0; i < 1000; i++) {
        double accel;
        double climb;
        if (i < 50)       { accel = 9.8;  climb = 0.0; }
        else if (i < 250) { accel = 30.0; climb = 0.5; }
        else if (i < 550) { accel = 2.0;  climb = 0.2; }
        else              { accel = 2.0;  climb = -0.1; }

        altitude += climb;
        max_altitude = std::max(max_altitude, altitude);

        bool changed = step(sm, make_data(t, accel, altitude, max_altitude));
        t += TICK_NS;

        const int before = static_cast<int>(previous);
        const int after = static_cast<int>(sm.phase());
        if (after < before || after > before + 1) {
            std::cerr << "✗ Illegal transition " << phase_name(previous)
                      << " -> " << sm.phase_label() << std::endl;
            return false;
        }
        if (changed != (after == before + 1)) {
            std::cerr << "✗ next_phase_if_ready() result disagrees with phase" << std::endl;
            return false;
        }

        if (sm.phase() != FlightPhase::Coast && sm.extension() != 0.0) {
            std::cerr << "✗ Extension " << sm.extension() << " in " << sm.phase_label() << std::endl;
            return false;
        }
        if (sm.phase() == FlightPhase::Coast && sm.extension() > 0.0) {
            saw_coast_extension = true;
        }

        previous = sm.phase();
    }

    if (sm.phase() != FlightPhase::FreeFall || sm.transition_count() != 3) {
        std::cerr << "✗ Ended in " << sm.phase_label() << " after "
                  << sm.transition_count() << " transitions" << std::endl;
        return false;
    }
    if (!saw_coast_extension) {
        std::cerr << "✗ Airbrake never deployed during Coast" << std::endl;
        return false;
    }

    // FreeFall is terminal
    for (int i = 0; i < 10; i++) {
        if (step(sm, make_data(t, 50.0, 0.0, max_altitude))) {
            std::cerr << "✗ Transition out of FreeFall" << std::endl;
            return false;
        }
        t += TICK_NS;
    }

    std::cout << "✓ Test 3: PASSED" << std::endl;
    return true;
}

// Test 4: Coast conditions do not skip MotorBurn
bool test_no_phase_skipping() {
    std::cout << "\n=== Test 4: No Phase Skipping ===" << std::endl;

    FlightStateMachine sm;

    // Launch-level accel and an apogee drop in the same data
    timestamp_t t = 0;
    for (int i = 0; i < 12; i++) {
        step(sm, make_data(t, 15.0, 100.0, 200.0));
        t += TICK_NS;
    }
    if (sm.phase() != FlightPhase::MotorBurn || sm.transition_count() != 1) {
        std::cerr << "✗ Expected exactly one step to MotorBurn, got " << sm.phase_label() << std::endl;
        return false;
    }

    // Burnout dwell starts fresh in MotorBurn
    step(sm, make_data(t, 1.0, 100.0, 200.0));
    t += TICK_NS;
    if (sm.phase() != FlightPhase::MotorBurn) {
        std::cerr << "✗ Burnout accepted without dwell" << std::endl;
        return false;
    }

    std::cout << "✓ Test 4: PASSED" << std::endl;
    return true;
}

// Test 5: Missing data holds the phase
bool test_missing_data_holds() {
    std::cout << "\n=== Test 5: Missing Data Holds ===" << std::endl;

    FlightStateMachine sm;

    // No timestamp: nothing to measure a dwell against
    ProcessedData empty;
    empty.avg_acceleration_magnitude = 50.0;
    for (int i = 0; i < 50; i++) {
        step(sm, empty);
    }
    if (sm.phase() != FlightPhase::StandBy) {
        std::cerr << "✗ Launched without data" << std::endl;
        return false;
    }

    // Reach Coast
    timestamp_t t = 0;
    while (sm.phase() == FlightPhase::StandBy) {
        step(sm, make_data(t, 20.0, 0.0, 0.0));
        t += TICK_NS;
    }
    while (sm.phase() == FlightPhase::MotorBurn) {
        step(sm, make_data(t, 1.0, 500.0, 500.0));
        t += TICK_NS;
    }
    if (sm.phase() != FlightPhase::Coast) {
        std::cerr << "✗ Did not reach Coast" << std::endl;
        return false;
    }

    // Altitude missing: apogee cannot be confirmed
    ProcessedData no_altitude = make_data(t, 1.0, 0.0, 0.0);
    no_altitude.current_altitude.reset();
    for (int i = 0; i < 20; i++) {
        step(sm, no_altitude);
    }
    if (sm.phase() != FlightPhase::Coast) {
        std::cerr << "✗ Apogee declared without altitude" << std::endl;
        return false;
    }

    // Within the margin: still coasting
    step(sm, make_data(t, 1.0, 496.0, 500.0));
    if (sm.phase() != FlightPhase::Coast) {
        std::cerr << "✗ Apogee declared inside margin" << std::endl;
        return false;
    }

    step(sm, make_data(t + TICK_NS, 1.0, 494.0, 500.0));
    if (sm.phase() != FlightPhase::FreeFall) {
        std::cerr << "✗ Apogee not declared 6 m below max" << std::endl;
        return false;
    }

    std::cout << "✓ Test 5: PASSED" << std::endl;
    return true;
}

// Test 6: Policy output is clamped, ignored outside Coast
bool test_coast_policy_clamping() {
    std::cout << "\n=== Test 6: Coast Policy Clamping ===" << std::endl;

    auto policy = std::make_unique<ScriptedPolicy>(3.5);
    ScriptedPolicy* policy_ptr = policy.get();
    FlightStateMachine sm(StateMachineConfig(), std::move(policy));

    timestamp_t t = 0;
    while (sm.phase() != FlightPhase::Coast) {
        double accel = (sm.phase() == FlightPhase::StandBy) ? 20.0 : 1.0;
        step(sm, make_data(t, accel, 100.0, 100.0));
        if (sm.extension() != 0.0) {
            std::cerr << "✗ Policy leaked into " << sm.phase_label() << std::endl;
            return false;
        }
        t += TICK_NS;
    }

    step(sm, make_data(t, 1.0, 100.0, 100.0));
    if (sm.extension() != 1.0) {
        std::cerr << "✗ 3.5 clamped to " << sm.extension() << std::endl;
        return false;
    }

    policy_ptr->set(-0.7);
    step(sm, make_data(t, 1.0, 100.0, 100.0));
    if (sm.extension() != 0.0) {
        std::cerr << "✗ -0.7 clamped to " << sm.extension() << std::endl;
        return false;
    }

    policy_ptr->set(std::numeric_limits<double>::quiet_NaN());
    step(sm, make_data(t, 1.0, 100.0, 100.0));
    if (sm.extension() != 0.0) {
        std::cerr << "✗ NaN not mapped to retracted" << std::endl;
        return false;
    }

    policy_ptr->set(0.42);
    step(sm, make_data(t, 1.0, 100.0, 100.0));
    if (std::fabs(sm.extension() - 0.42) > 1e-12) {
        std::cerr << "✗ In-range value altered" << std::endl;
        return false;
    }

    std::cout << "✓ Test 6: PASSED" << std::endl;
    return true;
}

// Test 7: Invalid thresholds rejected
bool test_invalid_config() {
    std::cout << "\n=== Test 7: Invalid Config ===" << std::endl;

    StateMachineConfig config;
    config.coast_extension = 1.5;

    try {
        FlightStateMachine sm(config);
        std::cerr << "✗ coast_extension = 1.5 accepted" << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cout << "  Rejected: " << e.what() << std::endl;
    }

    std::cout << "✓ Test 7: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Flight State Machine Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    set_log_level(LogLevel::Warn);

    bool all_passed = true;

    all_passed &= test_initial_state();
    all_passed &= test_launch_detection();
    all_passed &= test_full_sequence();
    all_passed &= test_no_phase_skipping();
    all_passed &= test_missing_data_holds();
    all_passed &= test_coast_policy_clamping();
    all_passed &= test_invalid_config();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL FLIGHT STATE MACHINE TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
