// Airbrakes Context Implementation
//
// One control tick = acquisition read, processing, phase decision,
// actuation and log submission, strictly in that order.

#include "airbrakes_context.hpp"
#include "utils/thread_utils.hpp"

#include <exception>
#include <utility>

namespace airbrakes {

namespace {

const AirbrakesConfig& validated(const AirbrakesConfig& config) {
    config.validate();
    return config;
}

}  // namespace

// === Constructor/Destructor ===

AirbrakesContext::AirbrakesContext(const AirbrakesConfig& config,
                                   PacketSource& source,
                                   ActuatorSink& servo,
                                   std::unique_ptr<CoastPolicy> coast_policy)
    : config_(validated(config)),
      servo_(servo),
      logger_(config_.logger),
      imu_(source, config_.imu),
      processor_(config_.processor),
      state_machine_(config_.state_machine, std::move(coast_policy)),
      shutdown_requested_(false),
      started_(false),
      stopped_(false),
      last_extension_(0.0),
      ticks_(0),
      packets_processed_(0),
      tick_errors_(0),
      last_metrics_ns_(0) {

    LOG_INFO("AirbrakesContext created (window: %zu, launch: %.1f m/s², "
             "burnout: %.1f m/s², apogee margin: %.1f m)",
             config_.processor.window_size,
             config_.state_machine.launch_accel_threshold,
             config_.state_machine.burnout_accel_threshold,
             config_.state_machine.apogee_margin_m);
}

AirbrakesContext::~AirbrakesContext() {
    if (started_ && !stopped_) {
        LOG_WARN("AirbrakesContext destroyed without stop(), stopping...");
        stop();
    }
}

// === Lifecycle ===

bool AirbrakesContext::start() {
    if (started_) {
        LOG_WARN("AirbrakesContext already started");
        return false;
    }

    // Stow the airbrake before anything else moves
    servo_.set_extension(0.0);

    if (!logger_.start()) {
        LOG_ERROR("Flight logger failed to start");
        return false;
    }

    if (!imu_.start()) {
        LOG_ERROR("IMU acquisition failed to start");
        logger_.stop();
        return false;
    }

    started_ = true;
    last_metrics_ns_ = monotonic_ns();
    LOG_INFO("AirbrakesContext started (phase: %s)", state_machine_.phase_label());
    return true;
}

bool AirbrakesContext::stop() {
    if (stopped_) {
        LOG_WARN("AirbrakesContext::stop() called more than once");
        return false;
    }
    stopped_ = true;
    request_shutdown();

    LOG_INFO("Shutting down (phase: %s, ticks: %llu)",
             state_machine_.phase_label(), static_cast<unsigned long long>(ticks_));

    bool imu_ok = imu_.stop();
    if (!imu_ok) {
        LOG_ERROR("IMU thread did not stop in time, continuing shutdown");
    }

    bool logger_ok = logger_.stop();
    if (!logger_ok) {
        LOG_ERROR("Flight log %s may be incomplete", logger_.log_path().c_str());
    }

    log_metrics(get_metrics());
    return imu_ok && logger_ok;
}

// === Control Tick ===

void AirbrakesContext::update() {
    try {
        tick();
    } catch (const std::exception& e) {
        tick_errors_++;
        LOG_ERROR("Control tick %llu failed: %s",
                  static_cast<unsigned long long>(ticks_), e.what());
    }
    ticks_++;

    maybe_log_metrics();
}

void AirbrakesContext::tick() {
    // Step 1: Latest batch acquired since the previous tick
    PacketBatch batch = imu_.get_latest_batch();
    packets_processed_ += batch.size();

    // Step 2: Derived quantities
    processor_.update(batch);
    const ProcessedData data = processor_.snapshot();

    // Step 3: Phase decision (at most one transition)
    state_machine_.update(data);
    state_machine_.next_phase_if_ready();

    // Step 4: Actuation
    const double extension = clamp_to_actuator_range(state_machine_.extension());
    servo_.set_extension(extension);
    last_extension_ = extension;

    // Step 5: Record the decision with every packet it saw
    logger_.submit(state_machine_.phase_label(), extension, batch);
}

// === Metrics ===

LoopMetrics AirbrakesContext::get_metrics() const {
    const AcquisitionStats acq = imu_.get_stats();
    const LoggerStats log = logger_.get_stats();

    LoopMetrics m;
    m.ticks = ticks_;
    m.packets_processed = packets_processed_;
    m.packets_superseded = acq.packets_superseded;
    m.records_submitted = log.records_submitted;
    m.source_failures = acq.source_failures;
    m.transitions = state_machine_.transition_count();
    m.log_queue_depth = logger_.queue_depth();
    m.max_altitude_m = processor_.max_altitude().value_or(0.0);
    m.phase = state_machine_.phase_label();
    return m;
}

void AirbrakesContext::maybe_log_metrics() {
    if (config_.metrics_interval_s <= 0.0 || !started_) {
        return;
    }

    const int64_t now = monotonic_ns();
    if (ns_to_seconds(now - last_metrics_ns_) < config_.metrics_interval_s) {
        return;
    }
    last_metrics_ns_ = now;

    log_metrics(get_metrics());

    if (logger_.write_failed()) {
        LOG_ERROR("Flight logger has failed, data since then is not recorded");
    }
    if (tick_errors_ > 0) {
        LOG_WARN("Control tick errors so far: %llu",
                 static_cast<unsigned long long>(tick_errors_));
    }
}

}  // namespace airbrakes
