#include "strata/operations.hpp"

#include <array>

#include "strata/access.hpp"
#include "strata/debug.hpp"
#include "strata/dispatch.hpp"

namespace strata {
namespace ops {

// ============================================================================
// Copy
// ============================================================================

void copy(const Tensor &src, Tensor &dst, const QueuePtr &queue) {
    if (src.extents() != dst.extents()) {
        throw ShapeError::mismatch(dst.extents().to_vector(),
                                   src.extents().to_vector());
    }
    if (src.dtype() != dst.dtype()) {
        throw TypeError::dtype_mismatch(dtype_name(dst.dtype()),
                                        dtype_name(src.dtype()));
    }
    if (src.count() == 0)
        return;

    auto resolved = AccessCoordinator::resolve(dst, queue);
    std::shared_ptr<DeviceArray> in_array;
    std::shared_ptr<DeviceArray> out_array;
    auto in = static_cast<const uint8_t *>(
        AccessCoordinator::read_only(src, resolved, &in_array));
    auto out = static_cast<uint8_t *>(
        AccessCoordinator::read_write(dst, resolved, &out_array));

    size_t itemsize = src.itemsize();
    Shape src_shape = src.shape();
    Shape dst_shape = dst.shape();
    // the arrays ride along so the buffers outlive the tensors
    resolved->enqueue([in_array, out_array, in, out, itemsize, src_shape,
                       dst_shape] {
        trace::ScopedTrace scope(trace::Category::DataCopy, "copy",
                                 src_shape.extents().str(),
                                 src_shape.count() * itemsize);
        if (src_shape.is_row_major() && dst_shape.is_row_major()) {
            std::memcpy(out, in, src_shape.count() * itemsize);
            return;
        }
        std::vector<int64_t> targets;
        targets.reserve(static_cast<size_t>(dst_shape.count()));
        dst_shape.for_each_offset(
            [&](int64_t position) { targets.push_back(position); });
        size_t n = 0;
        src_shape.for_each_offset([&](int64_t position) {
            std::memcpy(out + targets[n++] * itemsize, in + position * itemsize,
                        itemsize);
        });
    });
}

// ============================================================================
// Fill
// ============================================================================

void fill_bytes(Tensor &dst, const void *value_bytes, const QueuePtr &queue) {
    if (dst.count() == 0)
        return;

    auto resolved = AccessCoordinator::resolve(dst, queue);
    std::shared_ptr<DeviceArray> out_array;
    auto out = static_cast<uint8_t *>(
        AccessCoordinator::read_write(dst, resolved, &out_array));

    size_t itemsize = dst.itemsize();
    std::array<uint8_t, 8> value{};
    std::memcpy(value.data(), value_bytes, itemsize);
    Shape shape = dst.shape();
    resolved->enqueue([out_array, out, itemsize, value, shape] {
        shape.for_each_offset([&](int64_t position) {
            std::memcpy(out + position * itemsize, value.data(), itemsize);
        });
    });
}

void fill_with_index(Tensor &dst, int64_t start, const QueuePtr &queue) {
    if (dst.count() == 0)
        return;

    auto resolved = AccessCoordinator::resolve(dst, queue);
    std::shared_ptr<DeviceArray> out_array;
    void *out = AccessCoordinator::read_write(dst, resolved, &out_array);
    Shape shape = dst.shape();

    dispatch(dst.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::value_type;
        auto data = static_cast<T *>(out);
        resolved->enqueue([out_array, data, start, shape] {
            int64_t value = start;
            shape.for_each_offset([&](int64_t position) {
                data[position] = static_cast<T>(value++);
            });
        });
    });
}

Tensor filled_with_index(const ContextPtr &context, const ShapeArray &extents,
                         DType dtype, int64_t start, const QueuePtr &queue) {
    auto result = Tensor::empty(context, extents, dtype, "index");
    fill_with_index(result, start, queue);
    return result;
}

// ============================================================================
// Concatenate
// ============================================================================

Tensor concatenate(const std::vector<Tensor> &tensors, int64_t axis,
                   const QueuePtr &queue) {
    if (tensors.empty()) {
        throw ShapeError("concatenate requires at least one tensor");
    }
    const auto &first = tensors.front();
    std::vector<Shape> others;
    for (size_t i = 1; i < tensors.size(); ++i) {
        if (tensors[i].dtype() != first.dtype()) {
            throw TypeError::dtype_mismatch(dtype_name(first.dtype()),
                                            dtype_name(tensors[i].dtype()));
        }
        others.push_back(tensors[i].shape());
    }
    Shape joined = first.shape().joined(others, axis);
    auto dim = static_cast<size_t>(first.shape().make_positive(axis));

    auto result = Tensor::empty(first.context(), joined.extents(),
                                first.dtype(), "concat");
    auto resolved = AccessCoordinator::resolve(result, queue);
    Tensor shared = result.shared_view(resolved);

    auto index = ShapeArray::filled(joined.rank(), 0);
    for (const auto &tensor : tensors) {
        Tensor region = shared.view(index, tensor.extents());
        copy(tensor, region, resolved);
        index[dim] += tensor.extents()[dim];
    }
    return result;
}

} // namespace ops
} // namespace strata
