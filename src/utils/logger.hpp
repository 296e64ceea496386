/**
 * @file logger.hpp
 * @brief Diagnostic logging for the flight computer (console)
 *
 * Purpose: printf-style logging macros shared by the control loop and the
 * background units. Each call emits exactly one line, so messages from the
 * acquisition and logger threads never interleave mid-line.
 *
 * This is operator diagnostics only. Flight data goes through FlightLogger
 * (service/flight_logger.hpp), never through these macros.
 *
 * Sample Input:
 *   LOG_INFO("Control loop rate: %.0f Hz", rate_hz);
 *
 * Expected Output:
 *   stdout: "[INFO] Control loop rate: 100 Hz"
 */

#ifndef AIRBRAKES_UTILS_LOGGER_HPP
#define AIRBRAKES_UTILS_LOGGER_HPP

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace airbrakes {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

namespace detail {

inline std::atomic<int>& min_log_level() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

__attribute__((format(printf, 2, 3)))
inline void log_line(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < min_log_level().load(std::memory_order_relaxed)) {
        return;
    }

    static const char* const kLabels[] = {"[DEBUG] ", "[INFO] ", "[WARN] ", "[ERROR] "};

    char message[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // Single fprintf per line: stdio locks the stream for the whole call
    std::FILE* stream = (level >= LogLevel::Warn) ? stderr : stdout;
    std::fprintf(stream, "%s%s\n", kLabels[static_cast<int>(level)], message);
}

} // namespace detail

/**
 * @brief Set the minimum level that reaches the console
 *
 * Tests lower chatter with set_log_level(LogLevel::Warn).
 */
inline void set_log_level(LogLevel level) {
    detail::min_log_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(detail::min_log_level().load(std::memory_order_relaxed));
}

} // namespace airbrakes

#define LOG_DEBUG(...) ::airbrakes::detail::log_line(::airbrakes::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::airbrakes::detail::log_line(::airbrakes::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::airbrakes::detail::log_line(::airbrakes::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::airbrakes::detail::log_line(::airbrakes::LogLevel::Error, __VA_ARGS__)

namespace airbrakes {

/**
 * @brief Control loop metrics for periodic logging
 */
struct LoopMetrics {
    uint64_t ticks;                 ///< Control loop iterations
    uint64_t packets_processed;     ///< Packets pulled from acquisition
    uint64_t packets_superseded;    ///< Acquired packets replaced before a tick read them
    uint64_t records_submitted;     ///< Log records handed to FlightLogger
    uint64_t source_failures;       ///< Transient source read failures
    uint32_t transitions;           ///< Flight phase transitions so far
    size_t log_queue_depth;         ///< Log records waiting for the writer
    double max_altitude_m;          ///< Highest altitude seen [m]
    const char* phase;              ///< Current flight phase label

    LoopMetrics()
        : ticks(0), packets_processed(0), packets_superseded(0),
          records_submitted(0), source_failures(0),
          transitions(0), log_queue_depth(0),
          max_altitude_m(0.0), phase("") {}
};

/**
 * @brief Log control loop metrics
 */
inline void log_metrics(const LoopMetrics& m) {
    LOG_INFO("Metrics: phase=%s transitions=%u ticks=%llu packets=%llu superseded=%llu "
             "records=%llu queued=%zu source_failures=%llu max_alt=%.1f m",
             m.phase,
             m.transitions,
             static_cast<unsigned long long>(m.ticks),
             static_cast<unsigned long long>(m.packets_processed),
             static_cast<unsigned long long>(m.packets_superseded),
             static_cast<unsigned long long>(m.records_submitted),
             m.log_queue_depth,
             static_cast<unsigned long long>(m.source_failures),
             m.max_altitude_m);
}

} // namespace airbrakes

#endif // AIRBRAKES_UTILS_LOGGER_HPP
