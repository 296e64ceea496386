/**
 * @file data_processor.cpp
 * @brief Implementation of the rolling-window data processor
 */

#include "data_processor.hpp"

#include <algorithm>
#include <variant>

namespace airbrakes {

namespace {

size_t validated_window(const ProcessorConfig& config) {
    config.validate();
    return config.window_size;
}

}  // namespace

DataProcessor::DataProcessor(const ProcessorConfig& config)
    : capacity_(validated_window(config)),
      avg_accel_(Vector3d::Zero()),
      avg_accel_mag_(0.0) {}

void DataProcessor::update(const PacketBatch& new_packets) {
    for (const auto& packet : new_packets) {
        const auto* est = std::get_if<EstimatedPacket>(&packet);
        if (est == nullptr) {
            continue;  // Raw packets never enter the window
        }

        window_.push_back(*est);
        if (window_.size() > capacity_) {
            window_.pop_front();
        }

        // Max altitude sees every sample, even one evicted within this batch
        if (est->est_pressure_alt) {
            double altitude = static_cast<double>(*est->est_pressure_alt);
            max_altitude_ = max_altitude_ ? std::max(*max_altitude_, altitude) : altitude;
        }
    }

    compute_averages();
    compute_altitude();
}

void DataProcessor::compute_averages() {
    Vector3d sum = Vector3d::Zero();
    Eigen::Vector3i count = Eigen::Vector3i::Zero();

    for (const auto& p : window_) {
        if (p.est_compensated_accel_x) { sum.x() += *p.est_compensated_accel_x; count.x()++; }
        if (p.est_compensated_accel_y) { sum.y() += *p.est_compensated_accel_y; count.y()++; }
        if (p.est_compensated_accel_z) { sum.z() += *p.est_compensated_accel_z; count.z()++; }
    }

    // Axis with no samples averages to zero
    for (int i = 0; i < 3; i++) {
        avg_accel_(i) = (count(i) > 0) ? sum(i) / count(i) : 0.0;
    }

    avg_accel_mag_ = avg_accel_.norm();
}

// Current altitude and vertical velocity come from the window only: once no
// entry carries an altitude, the current altitude is absent.
void DataProcessor::compute_altitude() {
    const EstimatedPacket* oldest = nullptr;
    const EstimatedPacket* newest = nullptr;

    for (const auto& p : window_) {
        if (!p.est_pressure_alt) {
            continue;
        }
        if (oldest == nullptr) {
            oldest = &p;
        }
        newest = &p;
    }

    if (newest != nullptr) {
        current_altitude_ = static_cast<double>(*newest->est_pressure_alt);
    } else {
        current_altitude_.reset();
    }

    if (oldest == nullptr || oldest == newest ||
        newest->timestamp_ns <= oldest->timestamp_ns) {
        vertical_velocity_.reset();
        return;
    }

    double dt = ns_to_seconds(newest->timestamp_ns - oldest->timestamp_ns);
    vertical_velocity_ =
        (static_cast<double>(*newest->est_pressure_alt) -
         static_cast<double>(*oldest->est_pressure_alt)) / dt;
}

ProcessedData DataProcessor::snapshot() const {
    ProcessedData data;
    data.avg_acceleration = avg_accel_;
    data.avg_acceleration_magnitude = avg_accel_mag_;
    data.current_altitude = current_altitude_;
    data.max_altitude = max_altitude_;
    data.vertical_velocity = vertical_velocity_;
    if (!window_.empty()) {
        data.timestamp_ns = window_.back().timestamp_ns;
    }
    data.window_size = window_.size();
    return data;
}

} // namespace airbrakes
