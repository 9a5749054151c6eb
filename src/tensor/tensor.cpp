#include "strata/tensor.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <sstream>

#include "strata/access.hpp"
#include "strata/debug.hpp"
#include "strata/dispatch.hpp"
#include "strata/operations.hpp"
#include "strata/parallel.hpp"

namespace strata {

// ============================================================================
// Construction
// ============================================================================

Tensor::Tensor(Shape shape, std::shared_ptr<Storage> storage, int64_t offset,
               bool shared)
    : shape_(std::move(shape)), storage_(std::move(storage)), offset_(offset),
      shared_(shared) {
    if (!storage_) {
        throw PreconditionViolation("tensor requires a storage");
    }
    if (offset_ < 0 || offset_ + shape_.span_count() > storage_->count()) {
        throw ShapeError::out_of_span(
            "offset " + std::to_string(offset_) + " + span " +
            std::to_string(shape_.span_count()) + " exceeds storage of " +
            std::to_string(storage_->count()) + " elements");
    }
}

Tensor Tensor::empty(const ContextPtr &context, const ShapeArray &extents,
                     DType dtype, const std::string &name) {
    Shape shape(extents);
    auto storage =
        std::make_shared<Storage>(context, shape.count(), dtype, name);
    return Tensor(shape, std::move(storage));
}

void Tensor::check_dtype(DType expected) const {
    if (dtype() != expected) {
        throw TypeError::dtype_mismatch(dtype_name(dtype()),
                                        dtype_name(expected));
    }
}

DType Tensor::dtype() const {
    return storage_ ? storage_->dtype() : DType::Float32;
}

std::string Tensor::name() const { return storage_ ? storage_->name() : ""; }

const ContextPtr &Tensor::context() const {
    if (!storage_) {
        throw PreconditionViolation("tensor without storage has no context");
    }
    return storage_->context();
}

bool Tensor::last_access_mutated_view() const {
    return storage_ && storage_->last_access_mutated_view();
}

// ============================================================================
// Views
// ============================================================================

Tensor Tensor::create_view(const ShapeArray &offset, const ShapeArray &extents,
                           const ShapeArray &strides, bool shared) const {
    if (offset.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), offset.size());
    }
    if (extents.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), extents.size());
    }
    if (!shape_.contains(offset, extents)) {
        throw ShapeError::out_of_span("view at " + offset.str() +
                                      " with extents " + extents.str() +
                                      " in " + shape_.str());
    }
    return Tensor(Shape(extents, strides), storage_,
                  offset_ + shape_.linear_index(offset), shared);
}

Tensor Tensor::view(const ShapeArray &at, const ShapeArray &extents) const {
    return create_view(at, extents, strides(), shared_);
}

Tensor Tensor::view(const ShapeArray &at, const ShapeArray &extents,
                    const ShapeArray &strides) const {
    return create_view(at, extents, strides, shared_);
}

Tensor Tensor::view_items(int64_t offset, int64_t count) const {
    if (offset < 0 || count < 0 || offset + count > items()) {
        throw ShapeError::out_of_span(
            "items [" + std::to_string(offset) + ", " +
            std::to_string(offset + count) + ") of " +
            std::to_string(items()));
    }
    auto at = ShapeArray::filled(rank(), 0);
    at[0] = offset;
    ShapeArray sub = extents();
    sub[0] = count;
    return view(at, sub);
}

Tensor Tensor::view_item(int64_t index) const {
    if (index < 0 || index >= items()) {
        throw IndexError::out_of_bounds(index, items(), 0);
    }
    Tensor item = view_items(index, 1);
    return rank() > 1 ? item.squeezed({0}) : item;
}

Tensor Tensor::repeated(const ShapeArray &to) const {
    return Tensor(shape_.repeated(to), storage_, offset_, shared_);
}

Tensor Tensor::transposed(const ShapeArray &permutation) const {
    return Tensor(shape_.transposed(permutation), storage_, offset_, shared_);
}

Tensor Tensor::squeezed(const std::vector<int64_t> &axes) const {
    return Tensor(shape_.squeezed(axes), storage_, offset_, shared_);
}

Tensor Tensor::flattened(int64_t axis) const {
    return Tensor(shape_.flattened(axis), storage_, offset_, shared_);
}

Tensor Tensor::reshaped(const ShapeArray &extents) const {
    Shape target(extents);
    if (target.count() != count()) {
        throw ShapeError::invalid_reshape(count(), target.count());
    }
    if (!is_row_major()) {
        throw ShapeError::not_contiguous("reshaped");
    }
    return Tensor(target, storage_, offset_, shared_);
}

Tensor Tensor::slice(const ShapeArray &lower, const ShapeArray &upper) const {
    return slice(lower, upper, ShapeArray::filled(rank(), 1));
}

Tensor Tensor::slice(const ShapeArray &lower, const ShapeArray &upper,
                     const ShapeArray &steps) const {
    if (lower.size() != rank() || upper.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), lower.size());
    }
    ShapeArray from = lower;
    ShapeArray to = upper;
    for (size_t i = 0; i < rank(); ++i) {
        if (from[i] < 0)
            from[i] += extents()[i];
        if (to[i] < 0)
            to[i] += extents()[i];
    }
    Shape region = shape_.stepped(from, to, steps);
    if (region.is_empty()) {
        return Tensor(region, storage_, offset_, shared_);
    }
    return create_view(from, region.extents(), region.strides(), shared_);
}

void Tensor::assign(const ShapeArray &lower, const ShapeArray &upper,
                    const Tensor &values, const QueuePtr &queue) {
    auto resolved = AccessCoordinator::resolve(*this, queue);
    Tensor target = shared_view(resolved).slice(lower, upper);
    ops::copy(values, target, resolved);
}

Tensor Tensor::dense(const QueuePtr &queue) const {
    if (is_row_major())
        return *this;

    trace::ScopedTrace scope(trace::Category::DataCopy, "dense",
                             shape_.str(), count() * itemsize(), true);
    auto result = Tensor::empty(context(), extents(), dtype(), name());
    ops::copy(*this, result, queue);
    return result;
}

// ============================================================================
// Access protocol
// ============================================================================

const void *Tensor::read_only_bytes(const QueuePtr &queue) const {
    return AccessCoordinator::read_only(*this, queue);
}

void *Tensor::read_write_bytes(const QueuePtr &queue) {
    return AccessCoordinator::read_write(*this, queue);
}

Tensor Tensor::shared_view(const QueuePtr &queue,
                           const std::optional<ShapeArray> &reshaped) {
    return AccessCoordinator::shared_view(*this, queue, reshaped);
}

void Tensor::host_multi_write(const std::function<void(Tensor &)> &body,
                              std::optional<int64_t> batch_size,
                              bool synchronous) {
    int64_t item_count = items();
    if (batch_size && (*batch_size <= 0 || *batch_size > item_count)) {
        throw ShapeError("batch size " + std::to_string(*batch_size) +
                         " must be in [1, " + std::to_string(item_count) +
                         "]");
    }
    const auto &host = context()->host_queue();
    host->check_error();
    if (item_count == 0)
        return;

    int64_t size =
        batch_size.value_or(item_count / static_cast<int64_t>(
                                             parallel::get_num_threads()));
    if (size == 0)
        size = item_count;

    // make the data local to the host once for all batches
    Tensor shared = shared_view(host);
    shared.read_write_bytes(host);

    int64_t batches = (item_count + size - 1) / size;
    trace::record(trace::Category::Scheduling, "host_multi_write",
                  std::to_string(batches) + " batches of " +
                      std::to_string(size) + " items");

    // the first failure is held back so sibling batches still see a
    // clean host queue
    std::mutex failure_mutex;
    std::exception_ptr failure;
    auto run_batch = [&](int64_t b) {
        int64_t start = b * size;
        try {
            Tensor batch =
                shared.view_items(start, std::min(size, item_count - start));
            body(batch);
        } catch (...) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure)
                failure = std::current_exception();
        }
    };

#ifdef STRATA_USE_OPENMP
    if (!synchronous && batches > 1) {
#pragma omp parallel for schedule(dynamic)
        for (int64_t b = 0; b < batches; ++b) {
            run_batch(b);
        }
    } else {
        for (int64_t b = 0; b < batches; ++b) {
            run_batch(b);
        }
    }
#else
    (void)synchronous;
    for (int64_t b = 0; b < batches; ++b) {
        run_batch(b);
    }
#endif

    if (failure) {
        host->report(failure);
        std::rethrow_exception(failure);
    }
}

// ============================================================================
// Formatting
// ============================================================================

std::string Tensor::repr() const {
    std::ostringstream oss;
    oss << "Tensor(extents=" << extents().str()
        << ", strides=" << strides().str() << ", dtype=" << dtype_name(dtype())
        << ", offset=" << offset_;
    if (shared_)
        oss << ", shared";
    if (storage_)
        oss << ", storage=" << storage_->id();
    oss << ")";
    return oss.str();
}

std::string Tensor::str() const {
    if (is_empty())
        return repr();

    std::ostringstream oss;
    oss << repr() << "\n[";
    dispatch(dtype(), [&](auto tag) {
        using T = typename decltype(tag)::value_type;
        auto values = to_vector<T>();
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0)
                oss << ", ";
            if constexpr (sizeof(T) == 1 && !std::is_same_v<T, bool>) {
                oss << static_cast<int>(values[i]);
            } else {
                oss << values[i];
            }
        }
    });
    oss << "]";
    return oss.str();
}

} // namespace strata
