#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "strata/dtype.hpp"

namespace strata {

class DeviceContext;
class DeviceQueue;

// ============================================================================
// DeviceArray: a raw byte buffer owned by (or referenced on) one device
// ============================================================================

class DeviceArray {
  public:
    virtual ~DeviceArray() = default;

    virtual void *data() = 0;
    virtual const void *data() const = 0;

    virtual size_t size_bytes() const = 0;

    // Id of the device the bytes live on
    virtual int device_id() const = 0;

    // True if the bytes are owned by the caller, not by the device
    virtual bool is_reference() const = 0;
};

// ============================================================================
// Storage: reference counted, lazily allocated element buffer
// ============================================================================

class Storage {
  public:
    // Unallocated storage, the buffer is created on first access
    Storage(std::shared_ptr<DeviceContext> context, int64_t count, DType dtype,
            std::string name = "");

    // Storage initialized from host memory, allocated on the host device
    Storage(std::shared_ptr<DeviceContext> context, const void *host_data,
            int64_t count, DType dtype, std::string name = "");

    Storage(const Storage &) = delete;
    Storage &operator=(const Storage &) = delete;

    // Wraps caller-owned memory that must outlive every view of it.
    // The const overload produces a read-only storage.
    static std::shared_ptr<Storage>
    reference_to(std::shared_ptr<DeviceContext> context, const void *data,
                 int64_t count, DType dtype, std::string name = "");
    static std::shared_ptr<Storage>
    reference_to(std::shared_ptr<DeviceContext> context, void *data,
                 int64_t count, DType dtype, std::string name = "");

    // New storage with the same count and dtype whose contents are copied
    // from other on queue. The caller holds other's access mutex.
    static std::shared_ptr<Storage>
    copy_of(Storage &other, const std::shared_ptr<DeviceQueue> &queue);

    int64_t count() const { return count_; }
    DType dtype() const { return dtype_; }
    size_t size_bytes() const {
        return static_cast<size_t>(count_) * dtype_size(dtype_);
    }
    const std::string &name() const { return name_; }
    uint64_t id() const { return id_; }
    bool is_read_only() const { return read_only_; }
    bool is_allocated() const { return !replicas_.empty(); }

    const std::shared_ptr<DeviceContext> &context() const { return context_; }

    // Serializes access-protocol transactions on this storage
    std::mutex &access_mutex() const { return access_mutex_; }

    // ------------------------------------------------------------------------
    // Access metadata, guarded by access_mutex()
    // ------------------------------------------------------------------------

    const std::shared_ptr<DeviceQueue> &last_mutating_queue() const {
        return last_mutating_queue_;
    }
    void set_last_mutating_queue(std::shared_ptr<DeviceQueue> queue) {
        last_mutating_queue_ = std::move(queue);
    }

    // Set when the last read_write had to copy before mutating
    bool last_access_mutated_view() const {
        return last_access_mutated_view_.load();
    }
    void set_last_access_mutated_view(bool value) {
        last_access_mutated_view_.store(value);
    }

    // Base address of the buffer as seen from queue's device, allocating
    // or migrating the buffer first if needed. Requires access_mutex().
    void *buffer(const std::shared_ptr<DeviceQueue> &queue);

    // Buffer holding the current contents, null while unallocated
    std::shared_ptr<DeviceArray> device_array() const;

    // Device holding the current contents, -1 while unallocated
    int master_device() const { return master_device_; }
    size_t replica_count() const { return replicas_.size(); }

  private:
    Storage(std::shared_ptr<DeviceContext> context,
            std::shared_ptr<DeviceArray> array, int64_t count, DType dtype,
            std::string name, bool read_only);

    std::shared_ptr<DeviceContext> context_;
    // One buffer per device that has accessed a discrete copy
    std::map<int, std::shared_ptr<DeviceArray>> replicas_;
    int master_device_ = -1;
    int64_t count_;
    DType dtype_;
    std::string name_;
    uint64_t id_;
    bool read_only_ = false;

    mutable std::mutex access_mutex_;
    std::shared_ptr<DeviceQueue> last_mutating_queue_;
    std::atomic<bool> last_access_mutated_view_{false};
};

} // namespace strata
