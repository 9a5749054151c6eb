#include "cpu_storage.hpp"

#include <new>

#include "cpu_queue.hpp"
#include "strata/debug.hpp"
#include "strata/error.hpp"

namespace strata {
namespace backends {
namespace cpu {

// ============================================================================
// CpuDeviceArray Implementation
// ============================================================================

CpuDeviceArray::CpuDeviceArray(size_t size_bytes,
                               std::shared_ptr<ComputeDevice> device)
    : owned_(std::make_unique<uint8_t[]>(size_bytes)), data_(owned_.get()),
      size_bytes_(size_bytes), device_(device), device_id_(device->id()) {}

CpuDeviceArray::CpuDeviceArray(void *external, size_t size_bytes,
                               int device_id)
    : data_(static_cast<uint8_t *>(external)), size_bytes_(size_bytes),
      device_id_(device_id) {}

CpuDeviceArray::~CpuDeviceArray() {
    if (auto device = device_.lock()) {
        device->release(size_bytes_);
    }
}

// ============================================================================
// CpuDevice Implementation
// ============================================================================

std::shared_ptr<CpuDevice> CpuDevice::create(int id, std::string name,
                                             MemoryAddressing addressing) {
    return std::make_shared<CpuDevice>(id, std::move(name), addressing);
}

CpuDevice::CpuDevice(int id, std::string name, MemoryAddressing addressing)
    : ComputeDevice(id, std::move(name), addressing) {}

std::shared_ptr<DeviceArray> CpuDevice::allocate(size_t bytes) {
    reserve(bytes);
    try {
        auto array = std::make_shared<CpuDeviceArray>(bytes, shared_from_this());
        trace::record(trace::Category::DataAlloc, "allocate",
                      name() + " " + std::to_string(bytes) + " bytes", bytes,
                      true);
        return array;
    } catch (const std::bad_alloc &) {
        release(bytes);
        throw AllocationError::allocation_failed(bytes, name());
    }
}

std::shared_ptr<DeviceQueue> CpuDevice::add_cpu_queue(const std::string &name,
                                                      bool synchronous) {
    auto queue = std::make_shared<CpuQueue>(static_cast<int>(queues().size()),
                                            this->name() + "_" + name,
                                            weak_from_this(), synchronous);
    trace::record(trace::Category::QueueAlloc, "create_queue",
                  queue->name() + (synchronous ? " (synchronous)" : ""));
    add_queue(queue);
    return queue;
}

} // namespace cpu
} // namespace backends
} // namespace strata
