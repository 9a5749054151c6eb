#pragma once

#include <memory>
#include <optional>

#include "strata/device.hpp"
#include "strata/shape.hpp"
#include "strata/tensor.hpp"

namespace strata {

// Read/write protocol between tensors and device queues.
//
// Every access resolves its queue (null means the host queue), refuses
// to run on a queue holding an error, then under the storage's access
// mutex makes the queue wait for the storage's last mutating queue.
// Writes additionally copy a storage that is referenced by other tensors
// (unless the view is shared) and record the writing queue. Host access
// blocks until the host queue drains; device access only orders work.
class AccessCoordinator {
  public:
    // When array is given it receives the buffer behind the returned
    // address, read under the access mutex, so enqueued work can hold it.
    static const void *read_only(const Tensor &tensor, const QueuePtr &queue,
                                 std::shared_ptr<DeviceArray> *array = nullptr);
    static void *read_write(Tensor &tensor, const QueuePtr &queue,
                            std::shared_ptr<DeviceArray> *array = nullptr);

    static Tensor shared_view(Tensor &tensor, const QueuePtr &queue,
                              const std::optional<ShapeArray> &reshaped);

    // queue, or the host queue of the tensor's context when null
    static QueuePtr resolve(const Tensor &tensor, const QueuePtr &queue);

  private:
    // Orders queue after the storage's last mutating queue.
    // Requires the storage access mutex.
    static void synchronize(Storage &storage, const QueuePtr &queue);

    // Rebinds tensor to a copy of its storage unless it may mutate in
    // place. The replaced storage is handed to previous so the caller
    // releases it after unlocking its mutex.
    static void copy_if_mutates(Tensor &tensor, const QueuePtr &queue,
                                std::shared_ptr<Storage> &previous);

    static void require_storage(const Tensor &tensor);
};

} // namespace strata
