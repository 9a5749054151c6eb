#include "strata/debug.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "strata/system.hpp"

namespace strata {
namespace trace {

std::string category_name(Category category) {
    switch (category) {
    case Category::None:         return "none";
    case Category::DataAlloc:    return "alloc";
    case Category::DataCopy:     return "copy";
    case Category::DataMutation: return "mutation";
    case Category::QueueAlloc:   return "queue";
    case Category::QueueSync:    return "sync";
    case Category::Scheduling:   return "schedule";
    case Category::All:          return "all";
    }
    // combinations
    std::string names;
    for (uint32_t bit = 1; bit < static_cast<uint32_t>(Category::All);
         bit <<= 1) {
        if (any(category, static_cast<Category>(bit))) {
            if (!names.empty())
                names += "|";
            names += category_name(static_cast<Category>(bit));
        }
    }
    return names;
}

Category parse_categories(const std::string &list) {
    Category result = Category::None;
    std::istringstream iss(list);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token == "all" || token == "1")
            return Category::All;
        for (uint32_t bit = 1; bit < static_cast<uint32_t>(Category::All);
             bit <<= 1) {
            auto category = static_cast<Category>(bit);
            if (category_name(category) == token)
                result = result | category;
        }
    }
    return result;
}

Tracer &Tracer::instance() {
    static Tracer tracer;
    return tracer;
}

Tracer::Tracer() {
    const auto &config = system::config();
    categories_.store(static_cast<uint32_t>(config.trace_categories));
    echo_.store(config.trace_echo);
}

void Tracer::record(Category category, const std::string &op_name,
                    const std::string &desc, std::chrono::nanoseconds duration,
                    size_t memory_bytes, bool materialized) {
    if (!is_enabled(category))
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({category, op_name, desc,
                       std::chrono::steady_clock::now(), duration,
                       memory_bytes, materialized});
    if (echo_) {
        std::clog << "[strata:" << category_name(category) << "] " << op_name
                  << " " << desc << "\n";
    }
}

std::vector<TraceEvent> Tracer::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t Tracer::count(Category category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &event : events_) {
        if (any(event.category, category))
            ++n;
    }
    return n;
}

std::string Tracer::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "=== Strata Trace (" << events_.size() << " events) ===\n";
    oss << std::left << std::setw(10) << "Category" << std::setw(20)
        << "Operation" << std::setw(15) << "Duration(us)" << std::setw(15)
        << "Memory(KB)" << std::setw(12) << "Materialized"
        << "Description\n";
    oss << std::string(90, '-') << "\n";

    std::chrono::nanoseconds total_time{0};
    size_t total_memory = 0;
    size_t materialized_count = 0;

    for (const auto &event : events_) {
        double duration_us = event.duration.count() / 1000.0;
        double memory_kb = event.memory_bytes / 1024.0;

        oss << std::left << std::setw(10) << category_name(event.category)
            << std::setw(20) << event.op_name << std::setw(15) << std::fixed
            << std::setprecision(2) << duration_us << std::setw(15)
            << std::fixed << std::setprecision(2) << memory_kb
            << std::setw(12) << (event.materialized ? "yes" : "no")
            << event.description << "\n";

        total_time += event.duration;
        total_memory += event.memory_bytes;
        if (event.materialized)
            materialized_count++;
    }

    oss << std::string(90, '-') << "\n";
    oss << "Total time: " << (total_time.count() / 1000.0) << " us\n";
    oss << "Total memory allocated: " << (total_memory / 1024.0) << " KB\n";
    oss << "Materialized ops: " << materialized_count << " / " << events_.size()
        << "\n";

    return oss.str();
}

ScopedTrace::ScopedTrace(Category category, const std::string &op_name,
                         const std::string &desc, size_t memory_bytes,
                         bool materialized)
    : category_(category), op_name_(op_name), desc_(desc),
      memory_bytes_(memory_bytes), materialized_(materialized) {
    if (Tracer::instance().is_enabled(category_)) {
        start_ = std::chrono::steady_clock::now();
    }
}

ScopedTrace::~ScopedTrace() {
    if (Tracer::instance().is_enabled(category_)) {
        auto end = std::chrono::steady_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
        Tracer::instance().record(category_, op_name_, desc_, duration,
                                  memory_bytes_, materialized_);
    }
}

} // namespace trace
} // namespace strata
