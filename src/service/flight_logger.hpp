// Flight Data Logger
//
// Purpose: Records every control decision together with the packets it was
// based on, on a background thread, so disk I/O never delays a tick.
//
// Key Features:
// - One CSV file per run: <log_dir>/log_<n+1>.csv, n = highest existing suffix
// - Fixed column set; columns that do not apply to a packet are left empty
// - Unbounded ordered channel: submit() never waits on the disk
// - stop() sends a stop marker behind the last record and waits (bounded)
//   until everything before it is on disk
// - A write error stops the logger thread only; it is reported through
//   write_failed() and the statistics, never to the control loop
//
// Sample Usage:
//   FlightLogger logger(config);        // creates file + header row
//   logger.start();
//   logger.submit("Coast", 0.5, batch); // one row per packet in batch
//   logger.stop();
//
// Expected Output:
//   state,extension,timestamp,gpsCorrelTimestampFlags,...,estCompensatedAccelZ
//   Coast,0.5,1500000000,,,,,,,,,,...,-9.5

#pragma once

#include "core/packet_types.hpp"
#include "core/record_channel.hpp"
#include "service/service_types.hpp"

#include <pthread.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace airbrakes {

/**
 * @brief One row of the flight log
 */
struct LogRecord {
    std::string phase;      ///< Flight phase label
    double extension;       ///< Commanded extension [0, 1]
    Packet packet;          ///< Packet of the tick's batch

    LogRecord() : extension(0.0) {}
    LogRecord(std::string phase_label, double ext, Packet p)
        : phase(std::move(phase_label)), extension(ext), packet(std::move(p)) {}
};

/// Sent once by stop(); never written to the file
struct StopMarker {};

using LogMessage = std::variant<LogRecord, StopMarker>;

class FlightLogger {
public:
    /**
     * @brief Create the log directory and a new numbered log file with header
     *
     * @param config Logger configuration
     * @throws std::invalid_argument on invalid configuration
     * @throws std::runtime_error if the directory or file cannot be created
     */
    explicit FlightLogger(const LoggerConfig& config = LoggerConfig());

    /**
     * @brief Destructor (stops thread if running)
     */
    ~FlightLogger();

    // Disable copy/move (manages thread lifetime)
    FlightLogger(const FlightLogger&) = delete;
    FlightLogger& operator=(const FlightLogger&) = delete;

    /**
     * @brief Start the writer thread
     * @return true if started successfully
     */
    bool start();

    /**
     * @brief Queue one row per packet of the batch
     *
     * Costs one channel insertion per packet. Rows are dropped (and
     * counted) once stop() was called or the writer failed.
     */
    void submit(const std::string& phase, double extension, const PacketBatch& batch);

    /**
     * @brief Drain and stop the writer thread
     *
     * Every row submitted before this call is written before it returns,
     * unless the drain exceeds config.join_timeout_ms. Rows the writer
     * could not write are counted as dropped.
     *
     * @return false on timeout or if the writer had failed
     */
    bool stop();

    bool is_running() const { return writer_->running.load(std::memory_order_acquire); }

    /// Set once a write error ended the writer thread
    bool write_failed() const { return writer_->write_failed.load(std::memory_order_acquire); }

    const std::string& log_path() const { return log_path_; }

    LoggerStats get_stats() const;

    /// Rows waiting in the channel
    size_t queue_depth() const { return writer_->channel.size(); }

    // === CSV schema ===

    /// Column names, in file order
    static const std::vector<std::string>& csv_headers();

    /// Format one record as a CSV line (no trailing newline)
    static std::string format_row(const LogRecord& record);

    /// <log_dir>/log_<n+1>.csv for the highest numeric suffix n found in log_dir
    static std::string next_log_path(const std::string& log_dir);

private:
    /**
     * @brief Everything the writer thread touches
     *
     * Held by shared_ptr from both the FlightLogger and the running thread,
     * so a writer abandoned by stop() never touches a destroyed logger.
     */
    struct Writer {
        Writer(std::string log_path, bool flush_each);

        /**
         * @brief Writer loop: drain the channel until the stop marker
         *
         * Flushes whenever the channel runs dry so a crash loses as little
         * as possible.
         */
        void run();

        /// Empty the channel, counting the records as dropped
        uint64_t discard_pending();

        const std::string path;
        const bool flush_each_record;

        RecordChannel<LogMessage> channel;
        std::atomic<bool> running;
        std::atomic<bool> write_failed;

        // === Statistics ===

        std::atomic<uint64_t> records_submitted;
        std::atomic<uint64_t> records_written;
        std::atomic<uint64_t> records_dropped;
    };

    static void* thread_entry(void* arg);

    LoggerConfig config_;
    std::string log_path_;
    std::shared_ptr<Writer> writer_;

    // === Thread Management ===

    pthread_t thread_;
    std::atomic<bool> accepting_;
    bool thread_created_;
    bool abandoned_;
};

}  // namespace airbrakes
