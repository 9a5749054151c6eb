#include "strata/device.hpp"

#include <algorithm>

#include "cpu/cpu_storage.hpp"
#include "strata/error.hpp"
#include "strata/system.hpp"

namespace strata {

ContextOptions ContextOptions::from_config() {
    const auto &config = system::config();
    ContextOptions options;
    options.queues_per_device = config.queues_per_device;
    if (config.queue_timeout_ms >= 0) {
        options.timeout = std::chrono::milliseconds(config.queue_timeout_ms);
    }
    options.synchronous_queues = config.synchronous_queues;
    options.memory_limit_bytes = config.memory_limit_bytes;
    return options;
}

std::shared_ptr<DeviceContext>
DeviceContext::create(const ContextOptions &options) {
    return std::shared_ptr<DeviceContext>(new DeviceContext(options));
}

DeviceContext::DeviceContext(const ContextOptions &options)
    : options_(options) {
    using backends::cpu::CpuDevice;

    // The host device hosts the synchronous host queue at index 0
    auto host = CpuDevice::create(0, "cpu:0", MemoryAddressing::Unified);
    host_queue_ = host->add_cpu_queue("host", true);
    for (size_t q = 0; q < options.queues_per_device; ++q) {
        host->add_cpu_queue("q" + std::to_string(q + 1),
                            options.synchronous_queues);
    }
    devices_.push_back(host);

    // Discrete devices always get at least one queue
    size_t discrete_queues = std::max<size_t>(options.queues_per_device, 1);
    for (size_t d = 0; d < options.discrete_devices; ++d) {
        int id = static_cast<int>(d + 1);
        auto device = CpuDevice::create(id, "cpu:" + std::to_string(id),
                                        MemoryAddressing::Discrete);
        for (size_t q = 0; q < discrete_queues; ++q) {
            device->add_cpu_queue("q" + std::to_string(q),
                                  options.synchronous_queues);
        }
        devices_.push_back(device);
    }

    for (const auto &device : devices_) {
        device->set_memory_limit(options.memory_limit_bytes);
        device->set_timeout(options.timeout);
    }
}

std::shared_ptr<ComputeDevice> DeviceContext::device(size_t index) const {
    if (index >= devices_.size()) {
        throw IndexError::out_of_bounds(static_cast<int64_t>(index),
                                        static_cast<int64_t>(devices_.size()));
    }
    return devices_[index];
}

std::shared_ptr<DeviceQueue> DeviceContext::queue(size_t device,
                                                  size_t queue) const {
    return this->device(device)->queue(queue);
}

void DeviceContext::set_timeout(Timeout timeout) {
    options_.timeout = timeout;
    for (const auto &device : devices_) {
        device->set_timeout(timeout);
    }
}

void DeviceContext::clear_errors() {
    for (const auto &device : devices_) {
        device->clear_error();
    }
}

} // namespace strata
