#include "strata/system.hpp"

#include <cstdlib>
#include <mutex>

#include "strata/error.hpp"
#include "strata/parallel.hpp"

namespace strata::system {

namespace {

std::mutex config_mutex;

Config &active_config() {
    static Config config = [] {
        Config loaded = load_config();
        if (loaded.num_threads > 0)
            parallel::set_num_threads(loaded.num_threads);
        return loaded;
    }();
    return config;
}

int64_t parse_integer(const char *name, const std::string &value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error &) {
        throw StrataError(std::string("invalid integer '") + value +
                          "' in environment variable " + name);
    }
}

size_t parse_count(const char *name, const std::string &value) {
    int64_t parsed = parse_integer(name, value);
    if (parsed < 0) {
        throw StrataError(std::string("environment variable ") + name +
                          " must not be negative");
    }
    return static_cast<size_t>(parsed);
}

} // namespace

std::string env_or(const char *name, const std::string &fallback) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return fallback;
    return value;
}

Config load_config() {
    Config config;
    auto threads = env_or("STRATA_NUM_THREADS", "");
    if (!threads.empty())
        config.num_threads = parse_count("STRATA_NUM_THREADS", threads);

    auto queues = env_or("STRATA_QUEUES_PER_DEVICE", "");
    if (!queues.empty())
        config.queues_per_device =
            parse_count("STRATA_QUEUES_PER_DEVICE", queues);

    auto timeout = env_or("STRATA_QUEUE_TIMEOUT_MS", "");
    if (!timeout.empty())
        config.queue_timeout_ms =
            parse_integer("STRATA_QUEUE_TIMEOUT_MS", timeout);

    config.synchronous_queues = env_or("STRATA_SYNC_QUEUES", "0") == "1";

    auto limit = env_or("STRATA_MEMORY_LIMIT_BYTES", "");
    if (!limit.empty())
        config.memory_limit_bytes =
            parse_count("STRATA_MEMORY_LIMIT_BYTES", limit);

    config.trace_categories =
        trace::parse_categories(env_or("STRATA_TRACE", ""));
    config.trace_echo = env_or("STRATA_TRACE_ECHO", "0") == "1";
    return config;
}

const Config &config() {
    std::lock_guard<std::mutex> lock(config_mutex);
    return active_config();
}

void set_config(const Config &config) {
    std::lock_guard<std::mutex> lock(config_mutex);
    active_config() = config;
    if (config.num_threads > 0)
        parallel::set_num_threads(config.num_threads);
}

bool should_run_timing_tests() {
    return env_or("STRATA_SKIP_TIMING_TESTS", "0") != "1";
}

} // namespace strata::system
