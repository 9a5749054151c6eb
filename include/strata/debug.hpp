#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace strata {
namespace trace {

// Bit flags selecting which events are recorded
enum class Category : uint32_t {
    None = 0,
    DataAlloc = 1 << 0,
    DataCopy = 1 << 1,
    DataMutation = 1 << 2,
    QueueAlloc = 1 << 3,
    QueueSync = 1 << 4,
    Scheduling = 1 << 5,
    All = (1 << 6) - 1,
};

constexpr Category operator|(Category a, Category b) {
    return static_cast<Category>(static_cast<uint32_t>(a) |
                                 static_cast<uint32_t>(b));
}

constexpr bool any(Category a, Category b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

std::string category_name(Category category);

// Parses a comma separated list such as "alloc,copy" or "all"
Category parse_categories(const std::string &list);

struct TraceEvent {
    Category category;
    std::string op_name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
    size_t memory_bytes;
    bool materialized; // Did this op allocate new memory?
};

class Tracer {
  public:
    static Tracer &instance();

    void enable(Category categories = Category::All) {
        categories_.store(static_cast<uint32_t>(categories));
    }
    void disable() { categories_.store(0); }
    bool is_enabled() const { return categories_.load() != 0; }
    bool is_enabled(Category category) const {
        return any(static_cast<Category>(categories_.load()), category);
    }

    // Mirror every recorded event to std::clog
    void set_echo(bool echo) { echo_ = echo; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    void record(Category category, const std::string &op_name,
                const std::string &desc,
                std::chrono::nanoseconds duration = {},
                size_t memory_bytes = 0, bool materialized = false);

    std::string dump() const;

    // Snapshot of the recorded events
    std::vector<TraceEvent> events() const;
    size_t count(Category category) const;

  private:
    Tracer();
    std::atomic<uint32_t> categories_{0};
    std::atomic<bool> echo_{false};
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

inline void enable(Category categories = Category::All) {
    Tracer::instance().enable(categories);
}
inline void disable() { Tracer::instance().disable(); }
inline void clear() { Tracer::instance().clear(); }
inline std::string dump() { return Tracer::instance().dump(); }
inline bool is_enabled(Category category) {
    return Tracer::instance().is_enabled(category);
}

inline void record(Category category, const std::string &op_name,
                   const std::string &desc, size_t memory_bytes = 0,
                   bool materialized = false) {
    if (Tracer::instance().is_enabled(category)) {
        Tracer::instance().record(category, op_name, desc, {}, memory_bytes,
                                  materialized);
    }
}

class ScopedTrace {
  public:
    ScopedTrace(Category category, const std::string &op_name,
                const std::string &desc = "", size_t memory_bytes = 0,
                bool materialized = false);
    ~ScopedTrace();

    ScopedTrace(const ScopedTrace &) = delete;
    ScopedTrace &operator=(const ScopedTrace &) = delete;

  private:
    Category category_;
    std::string op_name_;
    std::string desc_;
    std::chrono::steady_clock::time_point start_;
    size_t memory_bytes_;
    bool materialized_;
};

} // namespace trace
} // namespace strata
