#include "strata/device.hpp"

#include <thread>

#include "strata/debug.hpp"
#include "strata/error.hpp"

namespace strata {

namespace {
std::atomic<uint64_t> next_event_id{0};
} // namespace

// ============================================================================
// QueueEvent
// ============================================================================

QueueEvent::QueueEvent(Timeout timeout)
    : id_(next_event_id.fetch_add(1)), timeout_(timeout) {}

// ============================================================================
// DeviceQueue
// ============================================================================

DeviceQueue::DeviceQueue(int id, std::string name,
                         std::weak_ptr<ComputeDevice> device)
    : id_(id), name_(std::move(name)), device_(std::move(device)) {
    auto owner = device_.lock();
    device_id_ = owner ? owner->id() : -1;
}

std::shared_ptr<ComputeDevice> DeviceQueue::device() const {
    auto owner = device_.lock();
    if (!owner) {
        throw DeviceError("device of queue " + name_ + " no longer exists");
    }
    return owner;
}

Timeout DeviceQueue::timeout() const {
    int64_t ms = timeout_ms_.load();
    if (ms < 0)
        return std::nullopt;
    return std::chrono::milliseconds(ms);
}

void DeviceQueue::set_timeout(Timeout timeout) {
    timeout_ms_.store(timeout ? timeout->count() : -1);
}

std::exception_ptr DeviceQueue::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void DeviceQueue::check_error() const {
    if (auto error = last_error()) {
        std::rethrow_exception(error);
    }
}

void DeviceQueue::report(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (last_error_)
            return;
        last_error_ = error;
    }
    trace::record(trace::Category::Scheduling, "report_error", name_);
    if (auto owner = device_.lock()) {
        owner->report(error);
    }
}

void DeviceQueue::clear_error() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = nullptr;
}

void DeviceQueue::record(const std::shared_ptr<QueueEvent> &event) {
    check_error();
    trace::record(trace::Category::QueueSync, "record_event",
                  name_ + " event(" + std::to_string(event->id()) + ")");
    // signaling bypasses the error check so waiters are always released
    dispatch([event] { event->signal(); });
}

void DeviceQueue::wait(const std::shared_ptr<QueueEvent> &event) {
    if (event->occurred())
        return;
    trace::record(trace::Category::QueueSync, "wait_event",
                  name_ + " waits for event(" + std::to_string(event->id()) +
                      ")");
    enqueue([event] { event->wait(); });
}

void DeviceQueue::wait_until_complete() {
    auto event = create_event();
    record(event);
    event->wait();
    check_error();
}

void DeviceQueue::enqueue(Work work) {
    if (has_error())
        return;
    dispatch([this, work = std::move(work)] {
        if (has_error())
            return;
        try {
            work();
        } catch (...) {
            report(std::current_exception());
        }
    });
}

void DeviceQueue::delay(std::chrono::milliseconds at_least) {
    enqueue([at_least] { std::this_thread::sleep_for(at_least); });
}

void DeviceQueue::throw_test_error() {
    enqueue([this] { throw DeviceError::test_error(name_); });
}

// ============================================================================
// ComputeDevice
// ============================================================================

ComputeDevice::ComputeDevice(int id, std::string name,
                             MemoryAddressing addressing)
    : id_(id), name_(std::move(name)), addressing_(addressing) {}

std::shared_ptr<DeviceQueue> ComputeDevice::queue(size_t index) const {
    if (index >= queues_.size()) {
        throw IndexError::out_of_bounds(static_cast<int64_t>(index),
                                        static_cast<int64_t>(queues_.size()));
    }
    return queues_[index];
}

void ComputeDevice::set_timeout(Timeout timeout) {
    timeout_ = timeout;
    for (const auto &queue : queues_) {
        queue->set_timeout(timeout);
    }
}

void ComputeDevice::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_handler_ = std::move(handler);
}

void ComputeDevice::report(std::exception_ptr error) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        handler = error_handler_;
    }
    if (handler && handler(error))
        return;

    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!last_error_)
        last_error_ = error;
}

std::exception_ptr ComputeDevice::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ComputeDevice::clear_error() {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = nullptr;
    }
    for (const auto &queue : queues_) {
        queue->clear_error();
    }
}

void ComputeDevice::reserve(size_t bytes) {
    size_t limit = memory_limit_.load();
    size_t in_use = memory_in_use_.fetch_add(bytes);
    if (limit > 0 && in_use + bytes > limit) {
        memory_in_use_.fetch_sub(bytes);
        throw AllocationError::limit_exceeded(bytes, in_use, limit, name_);
    }
}

void ComputeDevice::release(size_t bytes) { memory_in_use_.fetch_sub(bytes); }

void ComputeDevice::add_queue(std::shared_ptr<DeviceQueue> queue) {
    queue->set_timeout(timeout_);
    queues_.push_back(std::move(queue));
}

} // namespace strata
