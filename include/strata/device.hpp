#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class ComputeDevice;
class DeviceArray;

using Timeout = std::optional<std::chrono::milliseconds>;

// ============================================================================
// QueueEvent: completion marker recorded on one queue, awaited on others
// ============================================================================

class QueueEvent {
  public:
    explicit QueueEvent(Timeout timeout);
    virtual ~QueueEvent() = default;

    QueueEvent(const QueueEvent &) = delete;
    QueueEvent &operator=(const QueueEvent &) = delete;

    uint64_t id() const { return id_; }
    Timeout timeout() const { return timeout_; }

    virtual bool occurred() const = 0;

    // Marks the event as occurred and releases all waiters
    virtual void signal() = 0;

    // Blocks the calling thread until signaled, throws TimeoutError when
    // the timeout expires first
    virtual void wait() = 0;

  private:
    uint64_t id_;
    Timeout timeout_;
};

// ============================================================================
// DeviceQueue: ordered asynchronous executor with a sticky error state
// ============================================================================

class DeviceQueue : public std::enable_shared_from_this<DeviceQueue> {
  public:
    using Work = std::function<void()>;

    DeviceQueue(int id, std::string name,
                std::weak_ptr<ComputeDevice> device);
    virtual ~DeviceQueue() = default;

    DeviceQueue(const DeviceQueue &) = delete;
    DeviceQueue &operator=(const DeviceQueue &) = delete;

    int id() const { return id_; }
    const std::string &name() const { return name_; }
    int device_id() const { return device_id_; }

    // Owning device, throws DeviceError if it no longer exists
    std::shared_ptr<ComputeDevice> device() const;

    Timeout timeout() const;
    void set_timeout(Timeout timeout);

    bool execute_synchronously() const { return synchronous_.load(); }
    virtual void set_execute_synchronously(bool value) {
        synchronous_.store(value);
    }

    // ------------------------------------------------------------------------
    // Sticky error state
    // ------------------------------------------------------------------------

    std::exception_ptr last_error() const;
    bool has_error() const { return last_error() != nullptr; }

    // Rethrows the stored error, if any
    void check_error() const;

    // Stores the first error and forwards it to the device error sink
    void report(std::exception_ptr error);

    void clear_error();

    // ------------------------------------------------------------------------
    // Synchronization
    // ------------------------------------------------------------------------

    virtual std::shared_ptr<QueueEvent> create_event() = 0;

    // Signals event once all previously enqueued work has completed
    void record(const std::shared_ptr<QueueEvent> &event);

    // Makes subsequently enqueued work wait for event
    void wait(const std::shared_ptr<QueueEvent> &event);

    // Blocks the calling thread until all enqueued work has completed
    void wait_until_complete();

    // ------------------------------------------------------------------------
    // Work submission
    // ------------------------------------------------------------------------

    // Runs work in submission order. Work is skipped once the queue holds
    // an error; exceptions thrown by work are reported.
    void enqueue(Work work);

    // Copies bytes from the start of src to the start of dst
    virtual void copy_async(std::shared_ptr<DeviceArray> dst,
                            std::shared_ptr<const DeviceArray> src,
                            size_t bytes) = 0;
    virtual void zero(std::shared_ptr<DeviceArray> array, size_t bytes) = 0;

    // Debugging aids: stall the queue, or fail the next operation
    void delay(std::chrono::milliseconds at_least);
    void throw_test_error();

  protected:
    // Hands a ready-to-run item to the executor
    virtual void dispatch(Work work) = 0;

  private:
    int id_;
    std::string name_;
    std::weak_ptr<ComputeDevice> device_;
    int device_id_;
    std::atomic<int64_t> timeout_ms_{-1};
    std::atomic<bool> synchronous_{false};

    mutable std::mutex error_mutex_;
    std::exception_ptr last_error_;
};

// ============================================================================
// ComputeDevice: allocates buffers and owns a set of queues
// ============================================================================

enum class MemoryAddressing { Unified, Discrete };

class ComputeDevice : public std::enable_shared_from_this<ComputeDevice> {
  public:
    // Returns true if the error was handled and must not become sticky
    // on the device
    using ErrorHandler = std::function<bool(std::exception_ptr)>;

    ComputeDevice(int id, std::string name, MemoryAddressing addressing);
    virtual ~ComputeDevice() = default;

    ComputeDevice(const ComputeDevice &) = delete;
    ComputeDevice &operator=(const ComputeDevice &) = delete;

    int id() const { return id_; }
    const std::string &name() const { return name_; }
    MemoryAddressing addressing() const { return addressing_; }
    bool is_unified() const {
        return addressing_ == MemoryAddressing::Unified;
    }

    // Throws AllocationError if the request cannot be satisfied
    virtual std::shared_ptr<DeviceArray> allocate(size_t bytes) = 0;

    // ------------------------------------------------------------------------
    // Memory accounting, 0 means unlimited
    // ------------------------------------------------------------------------

    size_t memory_limit() const { return memory_limit_.load(); }
    void set_memory_limit(size_t bytes) { memory_limit_.store(bytes); }
    size_t memory_in_use() const { return memory_in_use_.load(); }

    // ------------------------------------------------------------------------
    // Queues
    // ------------------------------------------------------------------------

    const std::vector<std::shared_ptr<DeviceQueue>> &queues() const {
        return queues_;
    }
    std::shared_ptr<DeviceQueue> queue(size_t index) const;

    // Propagated to every queue owned by the device
    Timeout timeout() const { return timeout_; }
    void set_timeout(Timeout timeout);

    // ------------------------------------------------------------------------
    // Error sink
    // ------------------------------------------------------------------------

    void set_error_handler(ErrorHandler handler);
    void report(std::exception_ptr error);
    std::exception_ptr last_error() const;

    // Clears the device error and the error of every queue
    void clear_error();

    // Accounts for an allocation, throws AllocationError over the limit
    void reserve(size_t bytes);
    void release(size_t bytes);

  protected:
    void add_queue(std::shared_ptr<DeviceQueue> queue);

  private:
    int id_;
    std::string name_;
    MemoryAddressing addressing_;
    std::vector<std::shared_ptr<DeviceQueue>> queues_;
    Timeout timeout_;
    std::atomic<size_t> memory_limit_{0};
    std::atomic<size_t> memory_in_use_{0};

    mutable std::mutex error_mutex_;
    ErrorHandler error_handler_;
    std::exception_ptr last_error_;
};

// ============================================================================
// DeviceContext: explicit owner of the host device and any test devices
// ============================================================================

struct ContextOptions {
    // Asynchronous queues per device, in addition to the host queue
    size_t queues_per_device = 2;

    // Extra CPU-backed devices with discrete addressing
    size_t discrete_devices = 0;

    Timeout timeout;

    // Run every queue inline on the submitting thread
    bool synchronous_queues = false;

    // Per-device allocation limit in bytes, 0 means unlimited
    size_t memory_limit_bytes = 0;

    // Defaults taken from the environment, see system::config()
    static ContextOptions from_config();
};

class DeviceContext {
  public:
    static std::shared_ptr<DeviceContext>
    create(const ContextOptions &options = ContextOptions::from_config());

    DeviceContext(const DeviceContext &) = delete;
    DeviceContext &operator=(const DeviceContext &) = delete;

    // Synchronous queue of the host CPU device
    const std::shared_ptr<DeviceQueue> &host_queue() const {
        return host_queue_;
    }
    const std::shared_ptr<ComputeDevice> &host_device() const {
        return devices_.front();
    }

    // Device 0 is the host
    size_t device_count() const { return devices_.size(); }
    std::shared_ptr<ComputeDevice> device(size_t index) const;
    std::shared_ptr<DeviceQueue> queue(size_t device, size_t queue) const;

    bool is_host_queue(const DeviceQueue &queue) const {
        return &queue == host_queue_.get();
    }

    void set_timeout(Timeout timeout);
    void clear_errors();

    const ContextOptions &options() const { return options_; }

  private:
    explicit DeviceContext(const ContextOptions &options);

    ContextOptions options_;
    std::vector<std::shared_ptr<ComputeDevice>> devices_;
    std::shared_ptr<DeviceQueue> host_queue_;
};

using ContextPtr = std::shared_ptr<DeviceContext>;

} // namespace strata
