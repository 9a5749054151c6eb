#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "strata/debug.hpp"

namespace strata {
namespace system {

/**
 * @brief Process-wide settings read from the environment.
 *
 * Recognized variables:
 * - STRATA_NUM_THREADS: worker threads used by host fan-out (0 = default)
 * - STRATA_QUEUES_PER_DEVICE: asynchronous queues created per device
 * - STRATA_QUEUE_TIMEOUT_MS: event wait timeout, unset waits forever
 * - STRATA_SYNC_QUEUES: "1" runs every queue inline on the caller
 * - STRATA_MEMORY_LIMIT_BYTES: per-device allocation limit
 * - STRATA_TRACE: trace categories, e.g. "alloc,copy" or "all"
 * - STRATA_TRACE_ECHO: "1" mirrors trace events to std::clog
 */
struct Config {
    size_t num_threads = 0;
    size_t queues_per_device = 2;
    int64_t queue_timeout_ms = -1;
    bool synchronous_queues = false;
    size_t memory_limit_bytes = 0;
    trace::Category trace_categories = trace::Category::None;
    bool trace_echo = false;
};

// Reads the environment into a fresh Config
Config load_config();

/**
 * @brief The active configuration.
 *
 * Loaded from the environment on first use. set_config() replaces it for
 * objects created afterwards.
 */
const Config &config();
void set_config(const Config &config);

// Value of an environment variable, or fallback when unset or empty
std::string env_or(const char *name, const std::string &fallback);

/**
 * @brief Checks if tests that depend on wall-clock timing should run.
 *
 * Returns false if the STRATA_SKIP_TIMING_TESTS environment variable is
 * set to "1".
 */
bool should_run_timing_tests();

} // namespace system
} // namespace strata
