// Service Configuration and Statistics Types
//
// Purpose: Runtime configuration for every pipeline stage and the statistics
// each background unit exposes for health monitoring.
//
// Key Features:
// - Plain structs with flight-tested defaults set in constructors
// - validate() rejects unusable values with std::invalid_argument
// - Stats are snapshots copied out of the owning thread
//
// Sample Usage:
//   AirbrakesConfig config;
//   config.imu.sampling_frequency_hz = 200.0;
//   config.validate();              // throws on bad values
//   AirbrakesContext context(config, source, servo);
//
// Expected Output:
//   - Every component receives its configuration explicitly
//   - No global or ambient settings

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace airbrakes {

/**
 * @brief Acquisition stage (IMU thread) configuration
 */
struct ImuConfig {
    std::string port;             ///< Serial port of the sensor (driver only)
    double sampling_frequency_hz; ///< Sensor data rate [Hz], sets receive timeout
    uint32_t join_timeout_ms;     ///< Bounded wait for the thread on stop()
    int thread_priority;          ///< SCHED_FIFO priority (0 = normal)
    int cpu_affinity;             ///< CPU core affinity (-1 = none)

    ImuConfig()
        : port("/dev/ttyACM0"),
          sampling_frequency_hz(100.0),
          join_timeout_ms(1000),
          thread_priority(0),  // Normal priority (SCHED_FIFO requires root)
          cpu_affinity(-1) {}

    /// Receive timeout derived from the sampling frequency [ms], at least 1 ms
    int receive_timeout_ms() const {
        return std::max(1, static_cast<int>(std::ceil(1000.0 / sampling_frequency_hz)));
    }

    void validate() const {
        if (!(sampling_frequency_hz > 0.0)) {
            throw std::invalid_argument("ImuConfig: sampling_frequency_hz must be positive");
        }
    }
};

/**
 * @brief Data processor configuration
 */
struct ProcessorConfig {
    size_t window_size;           ///< Estimated packets kept for rolling averages

    ProcessorConfig()
        : window_size(10) {}

    void validate() const {
        if (window_size == 0) {
            throw std::invalid_argument("ProcessorConfig: window_size must be positive");
        }
    }
};

/**
 * @brief Flight phase detection thresholds
 */
struct StateMachineConfig {
    double launch_accel_threshold;   ///< Avg accel magnitude that signals liftoff [m/s²]
    double launch_dwell_s;           ///< Time above launch threshold before MotorBurn [s]
    double burnout_accel_threshold;  ///< Avg accel magnitude below which the motor is out [m/s²]
    double burnout_dwell_s;          ///< Time below burnout threshold before Coast [s]
    double apogee_margin_m;          ///< Drop below max altitude that confirms apogee [m]
    double coast_extension;          ///< Extension commanded by the fixed coast policy [0, 1]

    StateMachineConfig()
        : launch_accel_threshold(12.0),
          launch_dwell_s(0.1),
          burnout_accel_threshold(5.0),
          burnout_dwell_s(0.1),
          apogee_margin_m(5.0),
          coast_extension(1.0) {}

    void validate() const {
        if (!(launch_accel_threshold > 0.0) || !(burnout_accel_threshold > 0.0)) {
            throw std::invalid_argument("StateMachineConfig: thresholds must be positive");
        }
        if (launch_dwell_s < 0.0 || burnout_dwell_s < 0.0) {
            throw std::invalid_argument("StateMachineConfig: dwell times must be non-negative");
        }
        if (apogee_margin_m < 0.0) {
            throw std::invalid_argument("StateMachineConfig: apogee_margin_m must be non-negative");
        }
        if (coast_extension < 0.0 || coast_extension > 1.0) {
            throw std::invalid_argument("StateMachineConfig: coast_extension must be in [0, 1]");
        }
    }
};

/**
 * @brief Flight data logger configuration
 */
struct LoggerConfig {
    std::string log_dir;          ///< Directory holding log_<n>.csv files
    bool flush_each_record;       ///< Flush the stream after every row
    uint32_t join_timeout_ms;     ///< Bounded wait for the drain on stop()

    LoggerConfig()
        : log_dir("logs"),
          flush_each_record(false),
          join_timeout_ms(2000) {}

    void validate() const {
        if (log_dir.empty()) {
            throw std::invalid_argument("LoggerConfig: log_dir must not be empty");
        }
    }
};

/**
 * @brief Complete airbrakes configuration
 */
struct AirbrakesConfig {
    ImuConfig imu;
    ProcessorConfig processor;
    StateMachineConfig state_machine;
    LoggerConfig logger;

    double control_rate_hz;       ///< Control loop pacing rate [Hz]
    double metrics_interval_s;    ///< Period of metrics log lines (0 = off) [s]

    AirbrakesConfig()
        : control_rate_hz(100.0),
          metrics_interval_s(1.0) {}

    void validate() const {
        imu.validate();
        processor.validate();
        state_machine.validate();
        logger.validate();
        if (!(control_rate_hz > 0.0)) {
            throw std::invalid_argument("AirbrakesConfig: control_rate_hz must be positive");
        }
    }
};

/**
 * @brief Acquisition thread statistics
 */
struct AcquisitionStats {
    uint64_t loop_count;          ///< receive() iterations
    uint64_t packets_received;    ///< Total packets from the source
    uint64_t raw_packets;         ///< Raw (0x80) packets
    uint64_t estimated_packets;   ///< Estimated (0x82) packets
    uint64_t batches_published;   ///< Non-empty batches handed to the slot
    uint64_t source_failures;     ///< Transient receive failures (retried)
    uint64_t packets_superseded;  ///< Packets replaced by a newer batch before the control loop read them

    AcquisitionStats()
        : loop_count(0),
          packets_received(0),
          raw_packets(0),
          estimated_packets(0),
          batches_published(0),
          source_failures(0),
          packets_superseded(0) {}
};

/**
 * @brief Flight logger statistics
 */
struct LoggerStats {
    uint64_t records_submitted;   ///< Rows handed to the channel
    uint64_t records_written;     ///< Rows written to the file
    uint64_t records_dropped;     ///< Rows not written (after stop() or a write failure)
    bool write_failed;            ///< Logger thread hit a fatal write error

    LoggerStats()
        : records_submitted(0),
          records_written(0),
          records_dropped(0),
          write_failed(false) {}
};

}  // namespace airbrakes
