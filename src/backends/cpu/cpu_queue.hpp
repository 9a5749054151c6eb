#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "strata/device.hpp"

namespace strata {
namespace backends {
namespace cpu {

class CpuEvent : public QueueEvent {
  public:
    CpuEvent(Timeout timeout, std::string queue_name);

    bool occurred() const override;
    void signal() override;
    void wait() override;

  private:
    mutable std::mutex mutex_;
    std::condition_variable signaled_;
    bool occurred_ = false;
    std::string queue_name_;
};

// Serial executor backed by one worker thread. In synchronous mode work
// runs inline on the submitting thread once earlier work has drained.
class CpuQueue : public DeviceQueue {
  public:
    CpuQueue(int id, std::string name, std::weak_ptr<ComputeDevice> device,
             bool synchronous);
    ~CpuQueue() override;

    std::shared_ptr<QueueEvent> create_event() override;

    void copy_async(std::shared_ptr<DeviceArray> dst,
                    std::shared_ptr<const DeviceArray> src,
                    size_t bytes) override;
    void zero(std::shared_ptr<DeviceArray> array, size_t bytes) override;

  protected:
    void dispatch(Work work) override;

  private:
    void run();
    void wait_idle();

    std::mutex mutex_;
    std::condition_variable work_ready_;
    std::condition_variable idle_;
    std::deque<Work> pending_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace cpu
} // namespace backends
} // namespace strata
