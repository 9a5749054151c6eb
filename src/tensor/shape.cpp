#include "strata/shape.hpp"

#include <algorithm>
#include <sstream>

#include "strata/error.hpp"

namespace strata {

// ============================================================================
// ShapeArray
// ============================================================================

ShapeArray::ShapeArray(std::initializer_list<int64_t> values) {
    if (values.size() > kMaxRank) {
        throw ShapeError::invalid_rank(values.size(), kMaxRank);
    }
    for (int64_t value : values) {
        values_[rank_++] = value;
    }
}

ShapeArray::ShapeArray(const std::vector<int64_t> &values) {
    if (values.size() > kMaxRank) {
        throw ShapeError::invalid_rank(values.size(), kMaxRank);
    }
    for (int64_t value : values) {
        values_[rank_++] = value;
    }
}

ShapeArray ShapeArray::filled(size_t rank, int64_t value) {
    if (rank > kMaxRank) {
        throw ShapeError::invalid_rank(rank, kMaxRank);
    }
    ShapeArray result;
    for (size_t i = 0; i < rank; ++i) {
        result.push_back(value);
    }
    return result;
}

void ShapeArray::push_back(int64_t value) {
    if (rank_ == kMaxRank) {
        throw ShapeError::invalid_rank(rank_ + 1, kMaxRank);
    }
    values_[rank_++] = value;
}

int64_t ShapeArray::product() const {
    int64_t result = 1;
    for (int64_t value : *this) {
        result *= value;
    }
    return result;
}

std::vector<int64_t> ShapeArray::to_vector() const {
    return std::vector<int64_t>(begin(), end());
}

std::string ShapeArray::str() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < rank_; ++i) {
        if (i > 0)
            oss << ", ";
        oss << values_[i];
    }
    oss << "]";
    return oss.str();
}

bool ShapeArray::operator==(const ShapeArray &other) const {
    return rank_ == other.rank_ && std::equal(begin(), end(), other.begin());
}

// ============================================================================
// Shape construction
// ============================================================================

Shape::Shape() : extents_{0}, strides_{1} {}

Shape::Shape(const ShapeArray &extents)
    : Shape(extents, dense_strides(extents)) {}

Shape::Shape(std::initializer_list<int64_t> extents)
    : Shape(ShapeArray(extents)) {}

Shape::Shape(const ShapeArray &extents, const ShapeArray &strides)
    : extents_(extents), strides_(strides) {
    validate();
    count_ = element_count(extents_);
    span_count_ = span_count(extents_, strides_);
}

void Shape::validate() const {
    if (extents_.empty() || extents_.size() > kMaxRank) {
        throw ShapeError::invalid_rank(extents_.size(), kMaxRank);
    }
    if (strides_.size() != extents_.size()) {
        throw ShapeError::rank_mismatch(extents_.size(), strides_.size());
    }
    for (size_t i = 0; i < extents_.size(); ++i) {
        if (extents_[i] < 0) {
            throw ShapeError("negative extent " +
                             std::to_string(extents_[i]) + " in dimension " +
                             std::to_string(i));
        }
        if (strides_[i] < 0) {
            throw ShapeError("negative stride " +
                             std::to_string(strides_[i]) + " in dimension " +
                             std::to_string(i));
        }
    }
}

bool Shape::has_broadcast_dimension() const {
    for (size_t i = 0; i < rank(); ++i) {
        if (strides_[i] == 0 && extents_[i] > 1)
            return true;
    }
    return false;
}

bool Shape::is_row_major() const {
    if (!is_contiguous())
        return false;
    auto expected = dense_strides(extents_);
    for (size_t i = 0; i < rank(); ++i) {
        if (extents_[i] != 1 && strides_[i] != expected[i])
            return false;
    }
    return true;
}

// ============================================================================
// Static layout helpers
// ============================================================================

ShapeArray Shape::dense_strides(const ShapeArray &extents) {
    auto strides = ShapeArray::filled(extents.size(), 1);
    for (size_t i = extents.size(); i > 1; --i) {
        strides[i - 2] = extents[i - 1] * strides[i - 1];
    }
    return strides;
}

ShapeArray Shape::column_major_strides(const ShapeArray &extents) {
    auto strides = ShapeArray::filled(extents.size(), 1);
    for (size_t i = 1; i < extents.size(); ++i) {
        strides[i] = extents[i - 1] * strides[i - 1];
    }
    return strides;
}

int64_t Shape::element_count(const ShapeArray &extents) {
    return extents.product();
}

int64_t Shape::span_count(const ShapeArray &extents,
                          const ShapeArray &strides) {
    if (extents.size() != strides.size()) {
        throw ShapeError::rank_mismatch(extents.size(), strides.size());
    }
    int64_t span = 1;
    for (size_t i = 0; i < extents.size(); ++i) {
        // an empty dimension addresses nothing
        if (extents[i] == 0)
            return 0;
        span += (extents[i] - 1) * strides[i];
    }
    return span;
}

// ============================================================================
// Indexing
// ============================================================================

int64_t Shape::linear_index(const ShapeArray &index) const {
    int64_t result = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        result += index[i] * strides_[i];
    }
    return result;
}

int64_t Shape::checked_linear_index(const ShapeArray &index) const {
    if (index.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), index.size());
    }
    for (size_t i = 0; i < rank(); ++i) {
        if (index[i] < 0 || index[i] >= extents_[i]) {
            throw IndexError::out_of_bounds(index[i], extents_[i],
                                            static_cast<int>(i));
        }
    }
    return linear_index(index);
}

ShapeArray Shape::unravel_index(int64_t position) const {
    auto index = ShapeArray::filled(rank(), 0);
    for (size_t i = rank(); i > 0; --i) {
        int64_t extent = extents_[i - 1];
        if (extent == 0)
            return index;
        index[i - 1] = position % extent;
        position /= extent;
    }
    return index;
}

bool Shape::contains(const ShapeArray &offset,
                     const ShapeArray &extents) const {
    if (offset.size() != rank() || extents.size() != rank())
        return false;
    for (int64_t value : offset) {
        if (value < 0)
            return false;
    }
    return linear_index(offset) + span_count(extents, strides_) <=
           span_count_;
}

bool Shape::contains(const Shape &other) const {
    return other.span_count_ <= span_count_;
}

ShapeArray Shape::make_positive(const ShapeArray &dims) const {
    ShapeArray result;
    for (int64_t dim : dims) {
        result.push_back(make_positive(dim));
    }
    return result;
}

int64_t Shape::make_positive(int64_t axis) const {
    auto r = static_cast<int64_t>(rank());
    int64_t positive = axis < 0 ? axis + r : axis;
    if (positive < 0 || positive >= r) {
        throw ShapeError::invalid_axis(axis, rank());
    }
    return positive;
}

// ============================================================================
// Transformations
// ============================================================================

Shape Shape::repeated(const ShapeArray &to) const {
    if (to.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), to.size());
    }
    ShapeArray strides = strides_;
    for (size_t i = 0; i < rank(); ++i) {
        if (extents_[i] == to[i])
            continue;
        if (extents_[i] != 1) {
            throw ShapeError::not_broadcastable(extents_.str() + " to " +
                                                to.str());
        }
        strides[i] = 0;
    }
    return Shape(to, strides);
}

Shape Shape::transposed(const ShapeArray &permutation) const {
    if (rank() < 2)
        return *this;

    ShapeArray extents = extents_;
    ShapeArray strides = strides_;
    if (permutation.empty()) {
        std::swap(extents[rank() - 1], extents[rank() - 2]);
        std::swap(strides[rank() - 1], strides[rank() - 2]);
        return Shape(extents, strides);
    }

    if (permutation.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), permutation.size());
    }
    auto mapping = make_positive(permutation);
    std::array<bool, kMaxRank> seen{};
    for (size_t i = 0; i < rank(); ++i) {
        auto source = static_cast<size_t>(mapping[i]);
        if (seen[source]) {
            throw ShapeError("invalid permutation " + permutation.str());
        }
        seen[source] = true;
        extents[i] = extents_[source];
        strides[i] = strides_[source];
    }
    return Shape(extents, strides);
}

Shape Shape::joined(const std::vector<Shape> &others, int64_t axis) const {
    auto dim = static_cast<size_t>(make_positive(axis));
    ShapeArray extents = extents_;
    for (const auto &other : others) {
        if (other.rank() != rank()) {
            throw ShapeError::rank_mismatch(rank(), other.rank());
        }
        for (size_t i = 0; i < rank(); ++i) {
            if (i != dim && other.extents_[i] != extents_[i]) {
                throw ShapeError("cannot join " + other.extents_.str() +
                                 " with " + extents_.str() + " along axis " +
                                 std::to_string(axis));
            }
        }
        extents[dim] += other.extents_[dim];
    }
    return Shape(extents);
}

Shape Shape::squeezed(const std::vector<int64_t> &axes) const {
    std::array<bool, kMaxRank> drop{};
    if (axes.empty()) {
        for (size_t i = 0; i < rank(); ++i) {
            drop[i] = extents_[i] == 1;
        }
    } else {
        for (int64_t axis : axes) {
            auto dim = static_cast<size_t>(make_positive(axis));
            if (extents_[dim] != 1) {
                throw ShapeError("cannot squeeze axis " +
                                 std::to_string(axis) + " with extent " +
                                 std::to_string(extents_[dim]));
            }
            drop[dim] = true;
        }
    }

    ShapeArray extents;
    ShapeArray strides;
    for (size_t i = 0; i < rank(); ++i) {
        if (!drop[i]) {
            extents.push_back(extents_[i]);
            strides.push_back(strides_[i]);
        }
    }
    if (extents.empty()) {
        return Shape({1}, {1});
    }
    return Shape(extents, strides);
}

Shape Shape::flattened(int64_t axis) const {
    auto dim = static_cast<size_t>(make_positive(axis));
    if (!is_row_major()) {
        throw ShapeError::not_contiguous("flattened");
    }
    ShapeArray extents;
    for (size_t i = 0; i < dim; ++i) {
        extents.push_back(extents_[i]);
    }
    int64_t tail = 1;
    for (size_t i = dim; i < rank(); ++i) {
        tail *= extents_[i];
    }
    extents.push_back(tail);
    return Shape(extents);
}

Shape Shape::dense() const {
    return is_row_major() ? *this : Shape(extents_);
}

Shape Shape::column_major() const {
    if (rank() < 2 || strides_[rank() - 1] >= strides_[rank() - 2])
        return *this;

    ShapeArray swapped = extents_;
    std::swap(swapped[rank() - 1], swapped[rank() - 2]);
    auto strides = dense_strides(swapped);
    std::swap(strides[rank() - 1], strides[rank() - 2]);
    return Shape(extents_, strides);
}

Shape Shape::stepped(const ShapeArray &lower, const ShapeArray &upper,
                     const ShapeArray &steps) const {
    if (lower.size() != rank() || upper.size() != rank() ||
        steps.size() != rank()) {
        throw ShapeError::rank_mismatch(rank(), lower.size());
    }
    ShapeArray extents;
    ShapeArray strides;
    for (size_t i = 0; i < rank(); ++i) {
        if (steps[i] <= 0) {
            throw IndexError::invalid_slice("step must be positive, got " +
                                            std::to_string(steps[i]));
        }
        if (lower[i] < 0 || upper[i] > extents_[i] || lower[i] > upper[i]) {
            throw ShapeError::out_of_span(
                "bounds [" + std::to_string(lower[i]) + ", " +
                std::to_string(upper[i]) + ") outside extent " +
                std::to_string(extents_[i]) + " in dimension " +
                std::to_string(i));
        }
        int64_t span = upper[i] - lower[i];
        extents.push_back((span + steps[i] - 1) / steps[i]);
        strides.push_back(strides_[i] * steps[i]);
    }
    return Shape(extents, strides);
}

std::string Shape::str() const {
    return "Shape(extents=" + extents_.str() + ", strides=" + strides_.str() +
           ")";
}

} // namespace strata
