// Worker Thread Utilities
//
// Purpose: pthread helpers shared by the acquisition and logger threads:
// creation with optional real-time priority, CPU pinning, and a join with
// a deadline so shutdown never hangs on a stuck worker.
//
// Sample Usage:
//   pthread_t thread;
//   if (spawn_worker(thread, &Worker::thread_entry, this, 0)) { ... }
//   if (!join_with_timeout(thread, 1000)) { /* still running, abandoned */ }

#pragma once

#include <pthread.h>
#include <cstdint>

namespace airbrakes {

/**
 * @brief Create a joinable worker thread
 *
 * Requests SCHED_FIFO when priority > 0. If the scheduler attributes are
 * refused (no CAP_SYS_NICE) the thread is created with normal priority.
 *
 * @return true if the thread is running
 */
bool spawn_worker(pthread_t& thread, void* (*entry)(void*), void* arg, int priority);

/**
 * @brief Pin the calling thread to a CPU core (no-op for core_id < 0)
 */
void pin_current_thread(int core_id);

/**
 * @brief Join with a deadline
 *
 * @return true if the thread exited and was joined, false on timeout
 *         (the thread is left running and still joinable)
 */
bool join_with_timeout(pthread_t thread, uint32_t timeout_ms);

/**
 * @brief Current CLOCK_MONOTONIC time [nanoseconds]
 */
int64_t monotonic_ns();

/**
 * @brief Sleep until cycle_start_ns + period (returns overrun in µs, 0 if on time)
 */
int64_t sleep_until_next_cycle(int64_t cycle_start_ns, double rate_hz);

}  // namespace airbrakes
