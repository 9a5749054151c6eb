#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "strata/device.hpp"
#include "strata/dtype.hpp"
#include "strata/error.hpp"
#include "strata/shape.hpp"
#include "strata/storage.hpp"

namespace strata {

class AccessCoordinator;

using QueuePtr = std::shared_ptr<DeviceQueue>;

// A view of a shared storage: shape + storage reference + element offset.
// Views derived from a tensor share its storage and never copy data; a
// mutation through a view that does not own its storage alone copies the
// storage first unless the view is shared.
class Tensor {
  private:
    Shape shape_;
    std::shared_ptr<Storage> storage_;
    int64_t offset_ = 0;
    bool shared_ = false;

    void check_dtype(DType expected) const;

    friend class AccessCoordinator;

  public:
    // Empty tensor without storage
    Tensor() = default;

    // Validates offset + span_count <= storage count
    Tensor(Shape shape, std::shared_ptr<Storage> storage, int64_t offset = 0,
           bool shared = false);

    // ========================================================================
    // Factories
    // ========================================================================

    // Dense tensor whose storage is allocated on first access
    static Tensor empty(const ContextPtr &context, const ShapeArray &extents,
                        DType dtype = DType::Float32,
                        const std::string &name = "");

    template <typename T>
    static Tensor from_data(const ContextPtr &context, const T *data,
                            const ShapeArray &extents,
                            const std::string &name = "") {
        Shape shape(extents);
        auto storage = std::make_shared<Storage>(context, data, shape.count(),
                                                 dtype_of_v<T>, name);
        return Tensor(shape, std::move(storage));
    }

    template <typename T>
    static Tensor from_vector(const ContextPtr &context,
                              const std::vector<T> &values,
                              const ShapeArray &extents,
                              const std::string &name = "") {
        Shape shape(extents);
        if (static_cast<int64_t>(values.size()) != shape.count()) {
            throw ShapeError("expected " + std::to_string(shape.count()) +
                             " values for extents " + extents.str() +
                             " but got " + std::to_string(values.size()));
        }
        return from_data(context, values.data(), extents, name);
    }

    // Single stored element repeated to extents through stride 0
    template <typename T>
    static Tensor repeating(const ContextPtr &context, T value,
                            const ShapeArray &extents,
                            const std::string &name = "") {
        auto storage = std::make_shared<Storage>(context, &value, 1,
                                                 dtype_of_v<T>, name);
        Shape shape(extents, ShapeArray::filled(extents.size(), 0));
        return Tensor(shape, std::move(storage));
    }

    // Views caller-owned memory, which must outlive the tensor. Const
    // memory yields a read-only tensor.
    template <typename T>
    static Tensor reference_to(const ContextPtr &context, const T *data,
                               const ShapeArray &extents,
                               const std::string &name = "") {
        Shape shape(extents);
        auto storage = Storage::reference_to(context, data, shape.count(),
                                             dtype_of_v<T>, name);
        return Tensor(shape, std::move(storage));
    }

    template <typename T>
    static Tensor reference_to(const ContextPtr &context, T *data,
                               const ShapeArray &extents,
                               const std::string &name = "") {
        Shape shape(extents);
        auto storage = Storage::reference_to(context, data, shape.count(),
                                             dtype_of_v<T>, name);
        return Tensor(shape, std::move(storage));
    }

    // ========================================================================
    // Attributes
    // ========================================================================

    const Shape &shape() const { return shape_; }
    const ShapeArray &extents() const { return shape_.extents(); }
    const ShapeArray &strides() const { return shape_.strides(); }
    size_t rank() const { return shape_.rank(); }
    int64_t count() const { return shape_.count(); }
    int64_t items() const { return shape_.items(); }
    int64_t offset() const { return offset_; }
    bool is_shared() const { return shared_; }
    bool is_contiguous() const { return shape_.is_contiguous(); }
    bool is_row_major() const { return shape_.is_row_major(); }
    bool is_empty() const { return storage_ == nullptr || shape_.is_empty(); }

    DType dtype() const;
    size_t itemsize() const { return dtype_size(dtype()); }
    std::string name() const;

    const std::shared_ptr<Storage> &storage() const { return storage_; }
    const ContextPtr &context() const;

    // True if no other tensor references this storage
    bool is_unique_reference() const { return storage_.use_count() == 1; }

    // True if the last read_write copied the storage before mutating
    bool last_access_mutated_view() const;

    // ========================================================================
    // Views
    // ========================================================================

    // Sub-region at offset (relative to this view) with explicit strides.
    // The region must lie within this view's span.
    Tensor create_view(const ShapeArray &offset, const ShapeArray &extents,
                       const ShapeArray &strides, bool shared) const;

    Tensor view(const ShapeArray &at, const ShapeArray &extents) const;
    Tensor view(const ShapeArray &at, const ShapeArray &extents,
                const ShapeArray &strides) const;

    // Items [offset, offset + count) along dimension 0
    Tensor view_items(int64_t offset, int64_t count) const;

    // Item index along dimension 0 with that dimension removed
    Tensor view_item(int64_t index) const;

    Tensor repeated(const ShapeArray &to) const;
    Tensor transposed(const ShapeArray &permutation = {}) const;
    Tensor squeezed(const std::vector<int64_t> &axes = {}) const;
    Tensor flattened(int64_t axis = 0) const;
    Tensor reshaped(const ShapeArray &extents) const;

    // Region [lower, upper) stepped by steps; negative bounds count from
    // the end of each dimension
    Tensor slice(const ShapeArray &lower, const ShapeArray &upper) const;
    Tensor slice(const ShapeArray &lower, const ShapeArray &upper,
                 const ShapeArray &steps) const;

    // Writes values into the region [lower, upper)
    void assign(const ShapeArray &lower, const ShapeArray &upper,
                const Tensor &values, const QueuePtr &queue = nullptr);

    // Self if row-major, otherwise a dense copy made on queue
    Tensor dense(const QueuePtr &queue = nullptr) const;
    Tensor realized(const QueuePtr &queue = nullptr) const {
        return dense(queue);
    }

    // ========================================================================
    // Access protocol
    // ========================================================================

    // Start of this view's window within the storage buffer, span_count
    // elements long. A null queue means the host queue and blocks until
    // the data is ready.
    const void *read_only_bytes(const QueuePtr &queue = nullptr) const;
    void *read_write_bytes(const QueuePtr &queue = nullptr);

    template <typename T>
    std::span<const T> read_only(const QueuePtr &queue = nullptr) const {
        check_dtype(dtype_of_v<T>);
        auto data = static_cast<const T *>(read_only_bytes(queue));
        return std::span<const T>(data,
                                  static_cast<size_t>(shape_.span_count()));
    }

    template <typename T>
    std::span<T> read_write(const QueuePtr &queue = nullptr) {
        check_dtype(dtype_of_v<T>);
        auto data = static_cast<T *>(read_write_bytes(queue));
        return std::span<T>(data, static_cast<size_t>(shape_.span_count()));
    }

    // Unique-storage view that opts out of copy-on-write, for concurrent
    // writes into disjoint regions
    Tensor shared_view(const QueuePtr &queue = nullptr,
                       const std::optional<ShapeArray> &reshaped = std::nullopt);

    // Splits dimension 0 into batches and runs body on each batch view
    // concurrently on the host. Batch failures are reported to the host
    // queue; all batches complete before returning.
    void host_multi_write(const std::function<void(Tensor &)> &body,
                          std::optional<int64_t> batch_size = std::nullopt,
                          bool synchronous = false);

    // ========================================================================
    // Host element helpers
    // ========================================================================

    template <typename T> T item(const ShapeArray &index) const {
        int64_t position = shape_.checked_linear_index(index);
        return read_only<T>()[static_cast<size_t>(position)];
    }

    template <typename T> void set_item(const ShapeArray &index, T value) {
        int64_t position = shape_.checked_linear_index(index);
        read_write<T>()[static_cast<size_t>(position)] = value;
    }

    // Value of a single-element tensor
    template <typename T> T element() const {
        if (count() != 1) {
            throw ShapeError("element() requires a single element tensor, "
                             "extents are " +
                             extents().str());
        }
        return read_only<T>()[0];
    }

    // Logical elements in row-major order
    template <typename T> std::vector<T> to_vector() const {
        auto data = read_only<T>();
        std::vector<T> result;
        result.reserve(static_cast<size_t>(count()));
        shape_.for_each_offset([&](int64_t position) {
            result.push_back(data[static_cast<size_t>(position)]);
        });
        return result;
    }

    std::string str() const;
    std::string repr() const;
};

} // namespace strata
