// Airbrakes Flight Computer - Desktop Entry Point
//
// Runs the complete control loop against a synthetic flight replayed in real
// time, with a simulated servo. Stops on SIGINT/SIGTERM or once the replay is
// exhausted, then drains the background threads. Exit code 2 means a
// background thread had to be abandoned.
//
// Usage:
//   airbrakes [log_dir]

#include "actuation/servo.hpp"
#include "service/airbrakes_context.hpp"
#include "utils/logger.hpp"
#include "utils/thread_utils.hpp"
#include "validation/synthetic_flight.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <utility>

using namespace airbrakes;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    AirbrakesConfig config;
    if (argc > 1) {
        config.logger.log_dir = argv[1];
    }

    // 100 Hz estimated data, one raw packet per 5, paced at the sensor rate
    SyntheticFlight flight;
    PacketBatch packets = flight.generate(SyntheticFlight::nominal_profile(),
                                          config.imu.sampling_frequency_hz, 5);
    ScriptedPacketSource source(std::move(packets), 6,
                                static_cast<uint32_t>(5e6 / config.imu.sampling_frequency_hz));
    SimulatedServo servo;

    try {
        AirbrakesContext airbrakes(config, source, servo);

        if (!airbrakes.start()) {
            LOG_ERROR("Failed to start airbrakes");
            return 1;
        }

        while (!airbrakes.shutdown_requested()) {
            const int64_t cycle_start_ns = monotonic_ns();

            airbrakes.update();

            if (g_shutdown.load()) {
                LOG_INFO("Shutdown signal received");
                airbrakes.request_shutdown();
            } else if (source.exhausted() && airbrakes.phase() == FlightPhase::FreeFall) {
                LOG_INFO("Replay finished");
                airbrakes.request_shutdown();
            }

            const int64_t overrun_us = sleep_until_next_cycle(cycle_start_ns, config.control_rate_hz);
            if (overrun_us > 1000) {  // >1ms overrun
                LOG_WARN("Control cycle overrun: %lld µs", static_cast<long long>(overrun_us));
            }
        }

        const bool clean = airbrakes.stop();

        LOG_INFO("Flight log: %s (max extension commanded: %.2f)",
                 airbrakes.logger().log_path().c_str(), servo.max_extension());

        if (!clean) {
            // An abandoned acquisition thread may still be inside the driver
            LOG_ERROR("Shutdown incomplete, exiting without teardown");
            std::fflush(nullptr);
            std::_Exit(2);
        }
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: %s", e.what());
        return 1;
    }
}
