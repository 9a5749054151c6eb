#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace strata {

// Highest rank a shape can describe
constexpr size_t kMaxRank = 5;

// ============================================================================
// ShapeArray: inline fixed-capacity array of signed extents/strides/indices
// ============================================================================

class ShapeArray {
  public:
    ShapeArray() = default;
    ShapeArray(std::initializer_list<int64_t> values);
    explicit ShapeArray(const std::vector<int64_t> &values);

    static ShapeArray filled(size_t rank, int64_t value);

    size_t size() const { return rank_; }
    bool empty() const { return rank_ == 0; }

    int64_t &operator[](size_t i) { return values_[i]; }
    int64_t operator[](size_t i) const { return values_[i]; }

    int64_t *begin() { return values_.data(); }
    int64_t *end() { return values_.data() + rank_; }
    const int64_t *begin() const { return values_.data(); }
    const int64_t *end() const { return values_.data() + rank_; }

    int64_t front() const { return values_[0]; }
    int64_t back() const { return values_[rank_ - 1]; }

    void push_back(int64_t value);

    int64_t product() const;
    std::vector<int64_t> to_vector() const;
    std::string str() const;

    bool operator==(const ShapeArray &other) const;
    bool operator!=(const ShapeArray &other) const { return !(*this == other); }

  private:
    std::array<int64_t, kMaxRank> values_{};
    size_t rank_ = 0;
};

// ============================================================================
// Shape: immutable extents + strides with derived count and span
// ============================================================================

class Shape {
  public:
    // Rank 1, zero elements
    Shape();

    // Dense row-major shape
    explicit Shape(const ShapeArray &extents);
    Shape(std::initializer_list<int64_t> extents);

    // Strided shape, strides of 0 denote broadcast dimensions
    Shape(const ShapeArray &extents, const ShapeArray &strides);

    const ShapeArray &extents() const { return extents_; }
    const ShapeArray &strides() const { return strides_; }
    size_t rank() const { return extents_.size(); }

    // Number of logical elements
    int64_t count() const { return count_; }

    // Number of storage elements the shape can address
    int64_t span_count() const { return span_count_; }

    // Extent of dimension 0
    int64_t items() const { return extents_[0]; }

    bool is_contiguous() const { return count_ == span_count_; }

    // Contiguous and laid out in row-major order, ignoring extent-1 dims
    bool is_row_major() const;
    bool is_empty() const { return count_ == 0; }
    bool is_scalar() const { return count_ == 1; }
    bool has_broadcast_dimension() const;

    // ------------------------------------------------------------------------
    // Static layout helpers
    // ------------------------------------------------------------------------

    static ShapeArray dense_strides(const ShapeArray &extents);
    static ShapeArray column_major_strides(const ShapeArray &extents);
    static int64_t element_count(const ShapeArray &extents);
    static int64_t span_count(const ShapeArray &extents,
                              const ShapeArray &strides);

    // ------------------------------------------------------------------------
    // Indexing
    // ------------------------------------------------------------------------

    // Dot product of index and strides, no bounds checks
    int64_t linear_index(const ShapeArray &index) const;

    // Throws IndexError when any component lies outside its extent
    int64_t checked_linear_index(const ShapeArray &index) const;

    // Multi-index of the logical row-major position
    ShapeArray unravel_index(int64_t position) const;

    // Calls fn(linear_index) for every element in logical row-major order
    template <typename Fn> void for_each_offset(Fn &&fn) const {
        if (count_ == 0)
            return;
        auto index = ShapeArray::filled(rank(), 0);
        int64_t offset = 0;
        for (int64_t n = 0; n < count_; ++n) {
            fn(offset);
            for (size_t d = rank(); d > 0; --d) {
                size_t dim = d - 1;
                if (++index[dim] < extents_[dim]) {
                    offset += strides_[dim];
                    break;
                }
                offset -= (extents_[dim] - 1) * strides_[dim];
                index[dim] = 0;
            }
        }
    }

    // True if the region at offset with extents, using these strides,
    // lies inside this shape's span
    bool contains(const ShapeArray &offset, const ShapeArray &extents) const;
    bool contains(const Shape &other) const;

    // Normalizes negative axes by adding the rank
    ShapeArray make_positive(const ShapeArray &dims) const;
    int64_t make_positive(int64_t axis) const;

    // ------------------------------------------------------------------------
    // Transformations
    // ------------------------------------------------------------------------

    // Broadcast extent-1 dimensions to the target extents via stride 0
    Shape repeated(const ShapeArray &to) const;

    // Permute dimensions; an empty permutation swaps the last two
    Shape transposed(const ShapeArray &permutation = {}) const;

    // Extents summed along axis; other dimensions must match
    Shape joined(const std::vector<Shape> &others, int64_t axis = 0) const;

    // Drop extent-1 dimensions, all of them or the given subset
    Shape squeezed(const std::vector<int64_t> &axes = {}) const;

    // Collapse dimensions axis..rank-1 into one
    Shape flattened(int64_t axis = 0) const;

    // Dense row-major shape with the same extents
    Shape dense() const;

    // Last two dimensions laid out column-major
    Shape column_major() const;

    // Extents and strides of the stepped region [lower, upper) by steps
    Shape stepped(const ShapeArray &lower, const ShapeArray &upper,
                  const ShapeArray &steps) const;

    // Equal extents
    bool operator==(const Shape &other) const {
        return extents_ == other.extents_;
    }
    bool operator!=(const Shape &other) const { return !(*this == other); }

    // Equal extents and strides
    bool same_layout(const Shape &other) const {
        return extents_ == other.extents_ && strides_ == other.strides_;
    }

    std::string str() const;

  private:
    ShapeArray extents_;
    ShapeArray strides_;
    int64_t count_ = 0;
    int64_t span_count_ = 0;

    void validate() const;
};

} // namespace strata
