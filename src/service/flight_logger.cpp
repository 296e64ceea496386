// Flight Data Logger Implementation
//
// CSV writer thread fed by an unbounded ordered channel

#include "flight_logger.hpp"
#include "utils/logger.hpp"
#include "utils/thread_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace airbrakes {

namespace fs = std::filesystem;

namespace {

const LoggerConfig& validated(const LoggerConfig& config) {
    config.validate();
    return config;
}

// ========== Cell formatting ==========
// Absent channels and columns of the other packet kind are empty cells.

void put_float(std::ostringstream& row, const std::optional<float>& value) {
    row << ',';
    if (value) {
        row << std::setprecision(std::numeric_limits<float>::max_digits10) << *value;
    }
}

void put_double(std::ostringstream& row, const std::optional<double>& value) {
    row << ',';
    if (value) {
        row << std::setprecision(std::numeric_limits<double>::max_digits10) << *value;
    }
}

void put_uint(std::ostringstream& row, const std::optional<uint16_t>& value) {
    row << ',';
    if (value) {
        row << *value;
    }
}

void put_quaternion(std::ostringstream& row, const std::optional<Quaternion4f>& q) {
    for (size_t i = 0; i < 4; i++) {
        row << ',';
        if (q) {
            row << std::setprecision(std::numeric_limits<float>::max_digits10) << (*q)[i];
        }
    }
}

void put_empty(std::ostringstream& row, size_t count) {
    for (size_t i = 0; i < count; i++) {
        row << ',';
    }
}

constexpr size_t kRawColumns = 9;
constexpr size_t kEstimatedColumns = 20;

void put_raw(std::ostringstream& row, const RawPacket& p) {
    put_uint(row, p.gps_correl_timestamp_flags);
    put_double(row, p.gps_correl_timestamp_tow);
    put_uint(row, p.gps_correl_timestamp_week_num);
    put_float(row, p.scaled_accel_x);
    put_float(row, p.scaled_accel_y);
    put_float(row, p.scaled_accel_z);
    put_float(row, p.scaled_gyro_x);
    put_float(row, p.scaled_gyro_y);
    put_float(row, p.scaled_gyro_z);
}

void put_estimated(std::ostringstream& row, const EstimatedPacket& p) {
    put_double(row, p.est_filter_gps_time_tow);
    put_uint(row, p.est_filter_gps_time_week_num);
    put_quaternion(row, p.est_orient_quaternion);
    put_quaternion(row, p.est_attitude_uncert_quaternion);
    put_uint(row, p.est_filter_state);
    put_uint(row, p.est_filter_dynamics_mode);
    put_uint(row, p.est_filter_status_flags);
    put_float(row, p.est_pressure_alt);
    put_float(row, p.est_angular_rate_x);
    put_float(row, p.est_angular_rate_y);
    put_float(row, p.est_angular_rate_z);
    put_float(row, p.est_compensated_accel_x);
    put_float(row, p.est_compensated_accel_y);
    put_float(row, p.est_compensated_accel_z);
}

// Numeric suffix of "log_<n>.csv", or -1
long log_suffix(const fs::path& file) {
    const std::string name = file.filename().string();
    const std::string prefix = "log_";
    const std::string ext = ".csv";

    if (name.size() <= prefix.size() + ext.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
        return -1;
    }

    const std::string digits = name.substr(prefix.size(),
                                           name.size() - prefix.size() - ext.size());
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        return -1;
    }
    return std::strtol(digits.c_str(), nullptr, 10);
}

}  // namespace

// === Schema ===

const std::vector<std::string>& FlightLogger::csv_headers() {
    static const std::vector<std::string> headers = {
        "state", "extension", "timestamp",
        // RawPacket
        "gpsCorrelTimestampFlags", "gpsCorrelTimestampTow", "gpsCorrelTimestampWeekNum",
        "scaledAccelX", "scaledAccelY", "scaledAccelZ",
        "scaledGyroX", "scaledGyroY", "scaledGyroZ",
        // EstimatedPacket
        "estFilterGpsTimeTow", "estFilterGpsTimeWeekNum",
        "estOrientQuaternionW", "estOrientQuaternionX",
        "estOrientQuaternionY", "estOrientQuaternionZ",
        "estAttitudeUncertQuaternionW", "estAttitudeUncertQuaternionX",
        "estAttitudeUncertQuaternionY", "estAttitudeUncertQuaternionZ",
        "estFilterState", "estFilterDynamicsMode", "estFilterStatusFlags",
        "estPressureAlt",
        "estAngularRateX", "estAngularRateY", "estAngularRateZ",
        "estCompensatedAccelX", "estCompensatedAccelY", "estCompensatedAccelZ",
    };
    return headers;
}

std::string FlightLogger::format_row(const LogRecord& record) {
    std::ostringstream row;
    row << record.phase << ',' << record.extension << ',' << packet_timestamp(record.packet);

    if (const auto* raw = std::get_if<RawPacket>(&record.packet)) {
        put_raw(row, *raw);
        put_empty(row, kEstimatedColumns);
    } else {
        put_empty(row, kRawColumns);
        put_estimated(row, std::get<EstimatedPacket>(record.packet));
    }

    return row.str();
}

std::string FlightLogger::next_log_path(const std::string& log_dir) {
    long max_suffix = 0;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        if (entry.is_regular_file(ec)) {
            max_suffix = std::max(max_suffix, log_suffix(entry.path()));
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot list log directory " + log_dir + ": " + ec.message());
    }

    return (fs::path(log_dir) / ("log_" + std::to_string(max_suffix + 1) + ".csv")).string();
}

// === Constructor/Destructor ===

FlightLogger::Writer::Writer(std::string log_path, bool flush_each)
    : path(std::move(log_path)),
      flush_each_record(flush_each),
      running(false),
      write_failed(false),
      records_submitted(0),
      records_written(0),
      records_dropped(0) {}

FlightLogger::FlightLogger(const LoggerConfig& config)
    : config_(validated(config)),
      thread_(0),
      accepting_(true),
      thread_created_(false),
      abandoned_(false) {

    std::error_code ec;
    fs::create_directories(config_.log_dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create log directory " + config_.log_dir +
                                 ": " + ec.message());
    }

    log_path_ = next_log_path(config_.log_dir);

    std::ofstream file(log_path_, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot create log file " + log_path_);
    }

    const auto& headers = csv_headers();
    for (size_t i = 0; i < headers.size(); i++) {
        file << (i == 0 ? "" : ",") << headers[i];
    }
    file << '\n';

    if (!file.flush()) {
        throw std::runtime_error("Cannot write header to " + log_path_);
    }

    writer_ = std::make_shared<Writer>(log_path_, config_.flush_each_record);

    LOG_INFO("FlightLogger writing to %s", log_path_.c_str());
}

FlightLogger::~FlightLogger() {
    if (thread_created_) {
        LOG_WARN("FlightLogger destroyed while running, stopping...");
        stop();
    }
}

// === Thread Management ===

bool FlightLogger::start() {
    if (thread_created_ || is_running()) {
        LOG_WARN("FlightLogger already started");
        return false;
    }
    if (!accepting_.load(std::memory_order_acquire)) {
        LOG_WARN("FlightLogger cannot restart after stop()");
        return false;
    }

    writer_->running.store(true, std::memory_order_release);

    // The thread's own reference, released when the thread exits
    auto* thread_ref = new std::shared_ptr<Writer>(writer_);

    if (!spawn_worker(thread_, thread_entry, thread_ref, 0)) {
        delete thread_ref;
        writer_->running.store(false, std::memory_order_release);
        return false;
    }

    thread_created_ = true;
    LOG_INFO("FlightLogger started");
    return true;
}

void FlightLogger::submit(const std::string& phase, double extension, const PacketBatch& batch) {
    if (!accepting_.load(std::memory_order_acquire) || write_failed()) {
        writer_->records_dropped.fetch_add(batch.size(), std::memory_order_relaxed);
        return;
    }

    // Rows pushed after a concurrent write failure are counted by stop()
    for (const auto& packet : batch) {
        writer_->channel.push(LogRecord(phase, extension, packet));
    }
    writer_->records_submitted.fetch_add(batch.size(), std::memory_order_relaxed);
}

bool FlightLogger::stop() {
    if (!accepting_.exchange(false, std::memory_order_acq_rel)) {
        return !abandoned_ && !write_failed();  // Already stopped
    }

    if (!thread_created_) {
        const uint64_t pending = writer_->discard_pending();
        if (pending > 0) {
            LOG_WARN("FlightLogger stopped before start(), %llu rows not written",
                     static_cast<unsigned long long>(pending));
        }
        return pending == 0;
    }

    LOG_INFO("Stopping FlightLogger (%zu rows queued)...", writer_->channel.size());

    // Marker goes behind every record already submitted
    writer_->channel.push(StopMarker{});
    thread_created_ = false;

    if (!join_with_timeout(thread_, config_.join_timeout_ms)) {
        LOG_ERROR("FlightLogger did not drain within %u ms, abandoning %zu rows",
                  config_.join_timeout_ms, writer_->channel.size());
        pthread_detach(thread_);
        abandoned_ = true;
        return false;
    }

    // Whatever the writer left behind after a failure is lost
    const uint64_t unwritten = writer_->discard_pending();
    if (unwritten > 0) {
        LOG_ERROR("FlightLogger dropped %llu queued rows",
                  static_cast<unsigned long long>(unwritten));
    }

    LOG_INFO("FlightLogger stopped (written: %llu, dropped: %llu)",
             static_cast<unsigned long long>(writer_->records_written.load()),
             static_cast<unsigned long long>(writer_->records_dropped.load()));
    return !write_failed();
}

void* FlightLogger::thread_entry(void* arg) {
    std::unique_ptr<std::shared_ptr<Writer>> thread_ref(static_cast<std::shared_ptr<Writer>*>(arg));
    (*thread_ref)->run();
    return nullptr;
}

// === Writer Loop ===

void FlightLogger::Writer::run() {
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file) {
        LOG_ERROR("FlightLogger cannot open %s, flight data will NOT be recorded", path.c_str());
        write_failed.store(true, std::memory_order_release);
    }

    LogMessage message;
    while (file) {
        // Flush before blocking so the file is current whenever we are idle
        if (!channel.try_pop(message)) {
            file.flush();
            message = channel.pop();
        }

        if (std::holds_alternative<StopMarker>(message)) {
            break;
        }

        file << format_row(std::get<LogRecord>(message)) << '\n';
        if (flush_each_record) {
            file.flush();
        }

        if (!file) {
            LOG_ERROR("FlightLogger write to %s failed, logger thread exiting", path.c_str());
            write_failed.store(true, std::memory_order_release);
            records_dropped.fetch_add(1, std::memory_order_relaxed);
            break;
        }
        records_written.fetch_add(1, std::memory_order_relaxed);
    }

    if (file) {
        file.flush();
        if (!file) {
            LOG_ERROR("FlightLogger final flush of %s failed", path.c_str());
            write_failed.store(true, std::memory_order_release);
        }
    }

    running.store(false, std::memory_order_release);
}

uint64_t FlightLogger::Writer::discard_pending() {
    uint64_t discarded = 0;
    LogMessage message;
    while (channel.try_pop(message)) {
        if (std::holds_alternative<LogRecord>(message)) {
            discarded++;
        }
    }
    records_dropped.fetch_add(discarded, std::memory_order_relaxed);
    return discarded;
}

// === Statistics ===

LoggerStats FlightLogger::get_stats() const {
    LoggerStats stats;
    stats.records_submitted = writer_->records_submitted.load(std::memory_order_relaxed);
    stats.records_written = writer_->records_written.load(std::memory_order_relaxed);
    stats.records_dropped = writer_->records_dropped.load(std::memory_order_relaxed);
    stats.write_failed = write_failed();
    return stats;
}

}  // namespace airbrakes
