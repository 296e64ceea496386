// Worker Thread Utilities Implementation

#include "thread_utils.hpp"
#include "logger.hpp"

#include <cerrno>
#include <ctime>
#include <sched.h>

namespace airbrakes {

bool spawn_worker(pthread_t& thread, void* (*entry)(void*), void* arg, int priority) {
    pthread_attr_t attr;
    pthread_attr_init(&attr);

    // Set real-time priority (if permission available)
    if (priority > 0) {
        struct sched_param param;
        param.sched_priority = priority;

        int ret = pthread_attr_setinheritsched(&attr, PTHREAD_EXPLICIT_SCHED);
        if (ret == 0) {
            ret = pthread_attr_setschedpolicy(&attr, SCHED_FIFO);
        }
        if (ret == 0) {
            ret = pthread_attr_setschedparam(&attr, &param);
        }
        if (ret == 0) {
            LOG_INFO("Real-time priority requested (SCHED_FIFO, priority %d)", priority);
        } else {
            LOG_WARN("Failed to set SCHED_FIFO attributes: %d (normal priority used)", ret);
            pthread_attr_destroy(&attr);
            pthread_attr_init(&attr);
        }
    }

    int ret = pthread_create(&thread, &attr, entry, arg);

    if (ret == EPERM && priority > 0) {
        // Explicit scheduling refused at creation time; fall back
        LOG_WARN("SCHED_FIFO not permitted, starting worker with normal priority");
        pthread_attr_destroy(&attr);
        pthread_attr_init(&attr);
        ret = pthread_create(&thread, &attr, entry, arg);
    }

    pthread_attr_destroy(&attr);

    if (ret != 0) {
        LOG_ERROR("Failed to create worker thread: %d", ret);
        return false;
    }
    return true;
}

void pin_current_thread(int core_id) {
    if (core_id < 0) {
        return;
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);

    int ret = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
    if (ret == 0) {
        LOG_INFO("CPU affinity set to core %d", core_id);
    } else {
        LOG_WARN("Failed to set CPU affinity: %d", ret);
    }
}

bool join_with_timeout(pthread_t thread, uint32_t timeout_ms) {
    // pthread_timedjoin_np takes an absolute CLOCK_REALTIME deadline
    struct timespec deadline;
    clock_gettime(CLOCK_REALTIME, &deadline);

    deadline.tv_sec += static_cast<time_t>(timeout_ms / 1000);
    deadline.tv_nsec += static_cast<long>(timeout_ms % 1000) * 1000000L;
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec += 1;
        deadline.tv_nsec -= 1000000000L;
    }

    int ret = pthread_timedjoin_np(thread, nullptr, &deadline);
    if (ret == ETIMEDOUT) {
        return false;
    }
    if (ret != 0) {
        LOG_ERROR("pthread_timedjoin_np failed: %d", ret);
        return false;
    }
    return true;
}

int64_t monotonic_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

int64_t sleep_until_next_cycle(int64_t cycle_start_ns, double rate_hz) {
    int64_t period_ns = static_cast<int64_t>(1e9 / rate_hz);
    int64_t target_wake_ns = cycle_start_ns + period_ns;
    int64_t now_ns = monotonic_ns();

    if (now_ns < target_wake_ns) {
        int64_t sleep_ns = target_wake_ns - now_ns;

        struct timespec sleep_time;
        sleep_time.tv_sec = sleep_ns / 1000000000LL;
        sleep_time.tv_nsec = sleep_ns % 1000000000LL;

        nanosleep(&sleep_time, nullptr);
        return 0;
    }

    return (now_ns - target_wake_ns) / 1000;
}

}  // namespace airbrakes
