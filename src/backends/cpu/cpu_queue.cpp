#include "cpu_queue.hpp"

#include <cstring>

#include "strata/debug.hpp"
#include "strata/error.hpp"
#include "strata/storage.hpp"

namespace strata {
namespace backends {
namespace cpu {

// ============================================================================
// CpuEvent Implementation
// ============================================================================

CpuEvent::CpuEvent(Timeout timeout, std::string queue_name)
    : QueueEvent(timeout), queue_name_(std::move(queue_name)) {}

bool CpuEvent::occurred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return occurred_;
}

void CpuEvent::signal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        occurred_ = true;
    }
    signaled_.notify_all();
}

void CpuEvent::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto limit = timeout()) {
        if (!signaled_.wait_for(lock, *limit, [this] { return occurred_; })) {
            throw TimeoutError::event_wait(queue_name_, limit->count());
        }
    } else {
        signaled_.wait(lock, [this] { return occurred_; });
    }
}

// ============================================================================
// CpuQueue Implementation
// ============================================================================

CpuQueue::CpuQueue(int id, std::string name,
                   std::weak_ptr<ComputeDevice> device, bool synchronous)
    : DeviceQueue(id, std::move(name), std::move(device)),
      worker_([this] { run(); }) {
    set_execute_synchronously(synchronous);
}

CpuQueue::~CpuQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_ready_.notify_all();
    worker_.join();
}

std::shared_ptr<QueueEvent> CpuQueue::create_event() {
    return std::make_shared<CpuEvent>(timeout(), name());
}

void CpuQueue::copy_async(std::shared_ptr<DeviceArray> dst,
                          std::shared_ptr<const DeviceArray> src,
                          size_t bytes) {
    if (bytes > dst->size_bytes() || bytes > src->size_bytes()) {
        throw DeviceError("copy of " + std::to_string(bytes) +
                          " bytes exceeds buffer size on " + name());
    }
    enqueue([dst = std::move(dst), src = std::move(src), bytes] {
        trace::ScopedTrace scope(trace::Category::DataCopy, "copy_async",
                                 std::to_string(bytes) + " bytes", bytes);
        std::memcpy(dst->data(), src->data(), bytes);
    });
}

void CpuQueue::zero(std::shared_ptr<DeviceArray> array, size_t bytes) {
    if (bytes > array->size_bytes()) {
        throw DeviceError("zero of " + std::to_string(bytes) +
                          " bytes exceeds buffer size on " + name());
    }
    enqueue([array = std::move(array), bytes] {
        std::memset(array->data(), 0, bytes);
    });
}

void CpuQueue::dispatch(Work work) {
    if (execute_synchronously()) {
        wait_idle();
        work();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(work));
    }
    work_ready_.notify_one();
}

void CpuQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return pending_.empty() && !busy_; });
}

void CpuQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        work_ready_.wait(lock,
                         [this] { return stopping_ || !pending_.empty(); });
        if (pending_.empty()) {
            // stopping with nothing left to drain
            return;
        }
        Work work = std::move(pending_.front());
        pending_.pop_front();
        busy_ = true;
        lock.unlock();
        work();
        lock.lock();
        busy_ = false;
        if (pending_.empty())
            idle_.notify_all();
    }
}

} // namespace cpu
} // namespace backends
} // namespace strata
