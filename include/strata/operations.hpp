#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "strata/tensor.hpp"

namespace strata {
namespace ops {

// Element-wise copy of src into dst in logical order. Extents and dtypes
// must match; strides may differ.
void copy(const Tensor &src, Tensor &dst, const QueuePtr &queue = nullptr);

// Stores value_bytes (one element of dst's dtype) into every element
void fill_bytes(Tensor &dst, const void *value_bytes,
                const QueuePtr &queue = nullptr);

template <typename T>
void fill(Tensor &dst, T value, const QueuePtr &queue = nullptr) {
    if (dst.dtype() != dtype_of_v<T>) {
        throw TypeError::dtype_mismatch(dtype_name(dst.dtype()),
                                        dtype_name(dtype_of_v<T>));
    }
    fill_bytes(dst, &value, queue);
}

// Element i in logical row-major order becomes start + i
void fill_with_index(Tensor &dst, int64_t start = 0,
                     const QueuePtr &queue = nullptr);

// Dense tensor of the given extents holding start, start + 1, ...
Tensor filled_with_index(const ContextPtr &context, const ShapeArray &extents,
                         DType dtype = DType::Float32, int64_t start = 0,
                         const QueuePtr &queue = nullptr);

// Joins tensors along axis into a new dense tensor
Tensor concatenate(const std::vector<Tensor> &tensors, int64_t axis = 0,
                   const QueuePtr &queue = nullptr);

} // namespace ops
} // namespace strata
