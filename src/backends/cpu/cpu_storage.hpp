#pragma once

#include <cstdint>
#include <memory>

#include "strata/device.hpp"
#include "strata/storage.hpp"

namespace strata {
namespace backends {
namespace cpu {

// Host memory buffer, either owned by a device or referenced
class CpuDeviceArray : public DeviceArray {
  private:
    std::unique_ptr<uint8_t[]> owned_;
    uint8_t *data_;
    size_t size_bytes_;
    // accounting only, the context owns the device
    std::weak_ptr<ComputeDevice> device_;
    int device_id_;

  public:
    // Zero-initialized buffer accounted against device
    CpuDeviceArray(size_t size_bytes, std::shared_ptr<ComputeDevice> device);

    // Caller-owned memory, never freed here
    CpuDeviceArray(void *external, size_t size_bytes, int device_id);

    ~CpuDeviceArray() override;

    void *data() override { return data_; }
    const void *data() const override { return data_; }
    size_t size_bytes() const override { return size_bytes_; }
    int device_id() const override { return device_id_; }
    bool is_reference() const override { return owned_ == nullptr; }
};

// Device whose memory is host memory; addressing only changes whether
// buffers migrate when accessed from another device
class CpuDevice : public ComputeDevice {
  public:
    static std::shared_ptr<CpuDevice> create(int id, std::string name,
                                             MemoryAddressing addressing);

    CpuDevice(int id, std::string name, MemoryAddressing addressing);

    std::shared_ptr<DeviceArray> allocate(size_t bytes) override;

    // Adds a queue and returns it
    std::shared_ptr<DeviceQueue> add_cpu_queue(const std::string &name,
                                               bool synchronous);
};

} // namespace cpu
} // namespace backends
} // namespace strata
