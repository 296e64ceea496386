// Airbrakes Context - Control Loop Orchestrator
//
// Purpose: Owns every pipeline stage and runs one control tick per update():
//
//   Imu (background) -> DataProcessor -> FlightStateMachine -> Servo
//                                                           -> FlightLogger (background)
//
// Key Features:
// - start() launches the logger and acquisition threads, no tick work
// - update() is one full pipeline pass; it never throws to the caller
// - stop() drains both background threads with bounded waits, exactly once
// - Shutdown flag observable from any thread (e.g. a signal handler's loop)
//
// Sample Usage:
//   AirbrakesContext airbrakes(config, imu_driver, servo);
//   airbrakes.start();
//   while (!airbrakes.shutdown_requested()) {
//       airbrakes.update();
//   }
//   airbrakes.stop();
//
// Expected Output:
//   - Servo only moves during Coast
//   - One log row per packet per tick, in tick order

#pragma once

#include "actuation/servo.hpp"
#include "processing/data_processor.hpp"
#include "sensors/imu.hpp"
#include "sensors/packet_source.hpp"
#include "service/flight_logger.hpp"
#include "service/service_types.hpp"
#include "state/flight_state_machine.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace airbrakes {

class AirbrakesContext {
public:
    /**
     * @brief Constructor
     *
     * Creates the log file immediately; no thread runs until start().
     *
     * @param config Complete configuration
     * @param source IMU driver (must outlive the context)
     * @param servo Airbrake actuator (must outlive the context)
     * @param coast_policy Coast extension policy (default: fixed extension)
     * @throws std::invalid_argument on invalid configuration
     * @throws std::runtime_error if the log file cannot be created
     */
    AirbrakesContext(const AirbrakesConfig& config,
                     PacketSource& source,
                     ActuatorSink& servo,
                     std::unique_ptr<CoastPolicy> coast_policy = nullptr);

    /**
     * @brief Destructor (stops background threads if still running)
     */
    ~AirbrakesContext();

    AirbrakesContext(const AirbrakesContext&) = delete;
    AirbrakesContext& operator=(const AirbrakesContext&) = delete;

    /**
     * @brief Start the logger and acquisition threads
     * @return true if both started
     */
    bool start();

    /**
     * @brief Run one control tick
     *
     * Pulls the latest packets, updates the processor, advances the state
     * machine, commands the servo and submits the log rows. Errors are
     * logged and the tick degrades to "no update".
     */
    void update();

    /**
     * @brief Stop acquisition, then drain the logger (bounded waits)
     * @return false if a background thread timed out or the log is incomplete
     */
    bool stop();

    void request_shutdown() { shutdown_requested_.store(true, std::memory_order_release); }

    bool shutdown_requested() const {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

    // === State Access (control loop thread) ===

    FlightPhase phase() const { return state_machine_.phase(); }
    double extension() const { return last_extension_; }

    const DataProcessor& processor() const { return processor_; }
    const FlightStateMachine& state_machine() const { return state_machine_; }
    const Imu& imu() const { return imu_; }
    const FlightLogger& logger() const { return logger_; }

    /**
     * @brief Loop metrics snapshot
     */
    LoopMetrics get_metrics() const;

private:
    void tick();
    void maybe_log_metrics();

    AirbrakesConfig config_;
    ActuatorSink& servo_;

    // Declaration order = construction order: logger before acquisition
    FlightLogger logger_;
    Imu imu_;
    DataProcessor processor_;
    FlightStateMachine state_machine_;

    std::atomic<bool> shutdown_requested_;
    bool started_;
    bool stopped_;

    double last_extension_;

    // === Statistics (control loop thread) ===

    uint64_t ticks_;
    uint64_t packets_processed_;
    uint64_t tick_errors_;
    int64_t last_metrics_ns_;
};

}  // namespace airbrakes
