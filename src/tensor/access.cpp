#include "strata/access.hpp"

#include <mutex>

#include "strata/debug.hpp"
#include "strata/error.hpp"

namespace strata {

void AccessCoordinator::require_storage(const Tensor &tensor) {
    if (!tensor.storage_) {
        throw PreconditionViolation("access to a tensor without storage");
    }
}

QueuePtr AccessCoordinator::resolve(const Tensor &tensor,
                                    const QueuePtr &queue) {
    require_storage(tensor);
    return queue ? queue : tensor.storage_->context()->host_queue();
}

void AccessCoordinator::synchronize(Storage &storage, const QueuePtr &queue) {
    const auto &last = storage.last_mutating_queue();
    if (!last || last == queue)
        return;

    trace::ScopedTrace scope(trace::Category::QueueSync, "synchronize",
                             queue->name() + " after " + last->name() +
                                 " on storage(" +
                                 std::to_string(storage.id()) + ")");
    auto event = last->create_event();
    last->record(event);
    queue->wait(event);
}

void AccessCoordinator::copy_if_mutates(Tensor &tensor, const QueuePtr &queue,
                                        std::shared_ptr<Storage> &previous) {
    tensor.storage_->set_last_access_mutated_view(false);
    if (tensor.shared_ || tensor.storage_.use_count() == 1)
        return;

    auto copy = Storage::copy_of(*tensor.storage_, queue);
    copy->set_last_access_mutated_view(true);
    previous = std::move(tensor.storage_);
    tensor.storage_ = std::move(copy);
}

const void *AccessCoordinator::read_only(const Tensor &tensor,
                                         const QueuePtr &queue,
                                         std::shared_ptr<DeviceArray> *array) {
    auto resolved = resolve(tensor, queue);
    resolved->check_error();

    const auto &storage = tensor.storage_;
    void *base = nullptr;
    {
        std::lock_guard<std::mutex> lock(storage->access_mutex());
        synchronize(*storage, resolved);
        base = storage->buffer(resolved);
        if (array)
            *array = storage->device_array();
    }

    if (storage->context()->is_host_queue(*resolved)) {
        resolved->wait_until_complete();
    }
    return static_cast<const uint8_t *>(base) +
           tensor.offset_ * static_cast<int64_t>(tensor.itemsize());
}

void *AccessCoordinator::read_write(Tensor &tensor, const QueuePtr &queue,
                                    std::shared_ptr<DeviceArray> *array) {
    auto resolved = resolve(tensor, queue);
    if (tensor.storage_->is_read_only()) {
        throw PreconditionViolation::read_only_storage(
            tensor.storage_->name());
    }
    if (tensor.shape_.has_broadcast_dimension()) {
        throw PreconditionViolation("cannot write through a broadcast "
                                    "dimension of " +
                                    tensor.shape_.str());
    }
    resolved->check_error();

    // declared before the lock so a replaced storage outlives its mutex
    std::shared_ptr<Storage> previous;
    void *base = nullptr;
    {
        std::unique_lock<std::mutex> lock(tensor.storage_->access_mutex());
        synchronize(*tensor.storage_, resolved);
        copy_if_mutates(tensor, resolved, previous);
        tensor.storage_->set_last_mutating_queue(resolved);
        base = tensor.storage_->buffer(resolved);
        if (array)
            *array = tensor.storage_->device_array();
    }

    trace::record(trace::Category::DataMutation, "read_write",
                  "storage(" + std::to_string(tensor.storage_->id()) +
                      ") on " + resolved->name());

    if (tensor.storage_->context()->is_host_queue(*resolved)) {
        resolved->wait_until_complete();
    }
    return static_cast<uint8_t *>(base) +
           tensor.offset_ * static_cast<int64_t>(tensor.itemsize());
}

Tensor AccessCoordinator::shared_view(Tensor &tensor, const QueuePtr &queue,
                                      const std::optional<ShapeArray> &reshaped) {
    auto resolved = resolve(tensor, queue);
    resolved->check_error();

    std::shared_ptr<Storage> previous;
    {
        std::unique_lock<std::mutex> lock(tensor.storage_->access_mutex());
        synchronize(*tensor.storage_, resolved);
        copy_if_mutates(tensor, resolved, previous);
    }

    Shape shape = tensor.shape_;
    if (reshaped) {
        Shape target(*reshaped);
        if (target.count() != tensor.count()) {
            throw ShapeError::invalid_reshape(tensor.count(), target.count());
        }
        if (!tensor.shape_.is_row_major()) {
            throw ShapeError::not_contiguous("shared_view reshape");
        }
        shape = target;
    }
    return Tensor(shape, tensor.storage_, tensor.offset_, true);
}

} // namespace strata
