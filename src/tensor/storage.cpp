#include "strata/storage.hpp"

#include <cstring>

#include "backends/cpu/cpu_storage.hpp"
#include "strata/debug.hpp"
#include "strata/device.hpp"
#include "strata/error.hpp"

namespace strata {

namespace {
std::atomic<uint64_t> next_storage_id{0};
} // namespace

// ============================================================================
// Construction
// ============================================================================

Storage::Storage(std::shared_ptr<DeviceContext> context, int64_t count,
                 DType dtype, std::string name)
    : context_(std::move(context)), count_(count), dtype_(dtype),
      name_(std::move(name)), id_(next_storage_id.fetch_add(1)) {
    if (!context_) {
        throw DeviceError("storage '" + name_ + "' requires a device context");
    }
    if (count_ < 0) {
        throw ShapeError("storage element count must not be negative, got " +
                         std::to_string(count_));
    }
}

Storage::Storage(std::shared_ptr<DeviceContext> context,
                 const void *host_data, int64_t count, DType dtype,
                 std::string name)
    : Storage(std::move(context), count, dtype, std::move(name)) {
    const auto &host = context_->host_device();
    auto array = host->allocate(size_bytes());
    if (size_bytes() > 0) {
        std::memcpy(array->data(), host_data, size_bytes());
    }
    replicas_[host->id()] = std::move(array);
    master_device_ = host->id();
}

Storage::Storage(std::shared_ptr<DeviceContext> context,
                 std::shared_ptr<DeviceArray> array, int64_t count,
                 DType dtype, std::string name, bool read_only)
    : Storage(std::move(context), count, dtype, std::move(name)) {
    read_only_ = read_only;
    master_device_ = array->device_id();
    replicas_[master_device_] = std::move(array);
}

std::shared_ptr<Storage>
Storage::reference_to(std::shared_ptr<DeviceContext> context, const void *data,
                      int64_t count, DType dtype, std::string name) {
    auto storage = reference_to(std::move(context), const_cast<void *>(data),
                                count, dtype, std::move(name));
    storage->read_only_ = true;
    return storage;
}

std::shared_ptr<Storage>
Storage::reference_to(std::shared_ptr<DeviceContext> context, void *data,
                      int64_t count, DType dtype, std::string name) {
    if (!context) {
        throw DeviceError("storage '" + name + "' requires a device context");
    }
    auto bytes = static_cast<size_t>(count) * dtype_size(dtype);
    int host_id = context->host_device()->id();
    auto array =
        std::make_shared<backends::cpu::CpuDeviceArray>(data, bytes, host_id);
    return std::shared_ptr<Storage>(new Storage(std::move(context),
                                                std::move(array), count, dtype,
                                                std::move(name), false));
}

std::shared_ptr<Storage>
Storage::copy_of(Storage &other, const std::shared_ptr<DeviceQueue> &queue) {
    queue->check_error();
    auto copy = std::make_shared<Storage>(other.context_, other.count_,
                                          other.dtype_, other.name_);
    auto source = other.device_array();
    if (!source) {
        // nothing was ever written, so there is nothing to copy
        return copy;
    }

    auto device = queue->device();
    auto array = device->allocate(other.size_bytes());
    queue->copy_async(array, source, other.size_bytes());
    // access on any other queue must wait for the copy
    copy->last_mutating_queue_ = queue;
    copy->master_device_ = device->id();
    copy->replicas_[device->id()] = std::move(array);

    trace::record(trace::Category::DataCopy | trace::Category::DataMutation,
                  "copy_on_write",
                  "storage(" + std::to_string(other.id_) + ") -> storage(" +
                      std::to_string(copy->id_) + ") on " + queue->name(),
                  other.size_bytes(), true);
    return copy;
}

// ============================================================================
// Buffer access
// ============================================================================

std::shared_ptr<DeviceArray> Storage::device_array() const {
    auto it = replicas_.find(master_device_);
    return it == replicas_.end() ? nullptr : it->second;
}

void *Storage::buffer(const std::shared_ptr<DeviceQueue> &queue) {
    int target = queue->device_id();
    if (replicas_.empty()) {
        auto array = queue->device()->allocate(size_bytes());
        trace::record(trace::Category::DataAlloc, "allocate",
                      "storage(" + std::to_string(id_) + ") " + name_ +
                          " on " + queue->name(),
                      size_bytes(), true);
        master_device_ = target;
        replicas_[target] = array;
        return array->data();
    }

    const auto &master = replicas_.at(master_device_);
    if (target == master_device_ || master->is_reference()) {
        return master->data();
    }

    // unified devices address the same memory
    auto device = queue->device();
    if (device->is_unified() &&
        context_->device(static_cast<size_t>(master_device_))->is_unified()) {
        return master->data();
    }

    auto &replica = replicas_[target];
    if (!replica) {
        replica = device->allocate(size_bytes());
    }
    queue->copy_async(replica, master, size_bytes());
    // later access on other queues must wait for the migration copy
    last_mutating_queue_ = queue;
    trace::record(trace::Category::DataCopy, "migrate",
                  "storage(" + std::to_string(id_) + ") device " +
                      std::to_string(master_device_) + " -> " +
                      std::to_string(target),
                  size_bytes());
    master_device_ = target;
    return replica->data();
}

} // namespace strata
