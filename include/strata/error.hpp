#pragma once

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>

namespace strata {

// ============================================================================
// Base Strata Exception
// ============================================================================

class StrataError : public std::exception {
  public:
    explicit StrataError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Shape-related errors
// ============================================================================

class ShapeError : public StrataError {
  public:
    explicit ShapeError(const std::string &message)
        : StrataError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        std::ostringstream oss;
        oss << "expected extents [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << expected[i];
        }
        oss << "] but got [";
        for (size_t i = 0; i < got.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << got[i];
        }
        oss << "]";
        return ShapeError(oss.str());
    }

    static ShapeError rank_mismatch(size_t expected, size_t got) {
        return ShapeError("expected rank " + std::to_string(expected) +
                          " but got " + std::to_string(got));
    }

    static ShapeError invalid_rank(size_t rank, size_t max_rank) {
        return ShapeError("rank " + std::to_string(rank) +
                          " is not supported, must be in [1, " +
                          std::to_string(max_rank) + "]");
    }

    static ShapeError not_broadcastable(const std::string &details) {
        return ShapeError("extents are not broadcastable: " + details);
    }

    static ShapeError invalid_axis(int64_t axis, size_t rank) {
        return ShapeError("axis " + std::to_string(axis) +
                          " out of bounds for shape of rank " +
                          std::to_string(rank));
    }

    static ShapeError out_of_span(const std::string &details) {
        return ShapeError("region exceeds the addressable span: " + details);
    }

    static ShapeError not_contiguous(const std::string &operation) {
        return ShapeError(operation + " requires a contiguous shape");
    }

    static ShapeError invalid_reshape(int64_t from_count, int64_t to_count) {
        return ShapeError("cannot reshape view of " +
                          std::to_string(from_count) + " elements to " +
                          std::to_string(to_count) + " elements");
    }
};

// ============================================================================
// Type-related errors
// ============================================================================

class TypeError : public StrataError {
  public:
    explicit TypeError(const std::string &message)
        : StrataError("TypeError: " + message) {}

    static TypeError dtype_mismatch(const std::string &expected,
                                    const std::string &got) {
        return TypeError("expected dtype " + expected + " but got " + got);
    }

    static TypeError unsupported_dtype(const std::string &dtype,
                                       const std::string &operation) {
        return TypeError("unsupported dtype '" + dtype + "' for " + operation);
    }
};

// ============================================================================
// Index-related errors
// ============================================================================

class IndexError : public StrataError {
  public:
    explicit IndexError(const std::string &message)
        : StrataError("IndexError: " + message) {}

    static IndexError out_of_bounds(int64_t index, int64_t size,
                                    int dim = -1) {
        std::ostringstream oss;
        oss << "index " << index << " out of bounds for ";
        if (dim >= 0)
            oss << "dimension " << dim << " with ";
        oss << "extent " << size;
        return IndexError(oss.str());
    }

    static IndexError invalid_slice(const std::string &details) {
        return IndexError("invalid slice: " + details);
    }
};

// ============================================================================
// Allocation errors
// ============================================================================

class AllocationError : public StrataError {
  public:
    explicit AllocationError(const std::string &message)
        : StrataError("AllocationError: " + message) {}

    static AllocationError allocation_failed(size_t bytes,
                                             const std::string &device) {
        return AllocationError("failed to allocate " + std::to_string(bytes) +
                               " bytes on " + device);
    }

    static AllocationError limit_exceeded(size_t bytes, size_t in_use,
                                          size_t limit,
                                          const std::string &device) {
        return AllocationError(
            "request for " + std::to_string(bytes) + " bytes on " + device +
            " exceeds memory limit (" + std::to_string(in_use) + " of " +
            std::to_string(limit) + " bytes in use)");
    }
};

// ============================================================================
// Device-related errors (sticky on a queue until cleared)
// ============================================================================

class DeviceError : public StrataError {
  public:
    explicit DeviceError(const std::string &message)
        : StrataError("DeviceError: " + message) {}

    static DeviceError test_error(const std::string &queue) {
        return DeviceError("test error raised on " + queue);
    }

  protected:
    struct NoPrefix {};
    DeviceError(NoPrefix, const std::string &message) : StrataError(message) {}
};

class TimeoutError : public DeviceError {
  public:
    explicit TimeoutError(const std::string &message)
        : DeviceError(NoPrefix{}, "TimeoutError: " + message) {}

    static TimeoutError event_wait(const std::string &queue,
                                   int64_t timeout_ms) {
        return TimeoutError("event wait on " + queue + " exceeded " +
                            std::to_string(timeout_ms) + " ms");
    }
};

// ============================================================================
// Programmer errors that are not expected to be recovered from
// ============================================================================

class PreconditionViolation : public StrataError {
  public:
    explicit PreconditionViolation(const std::string &message)
        : StrataError("PreconditionViolation: " + message) {}

    static PreconditionViolation read_only_storage(const std::string &name) {
        return PreconditionViolation("storage '" + name +
                                     "' is read only and cannot be mutated");
    }
};

// ============================================================================
// Serialization errors
// ============================================================================

class SerializationError : public StrataError {
  public:
    explicit SerializationError(const std::string &message)
        : StrataError("SerializationError: " + message) {}

  protected:
    struct NoPrefix {};
    SerializationError(NoPrefix, const std::string &message)
        : StrataError(message) {}
};

class FileFormatError : public SerializationError {
  public:
    explicit FileFormatError(const std::string &message)
        : SerializationError(NoPrefix{}, "FileFormatError: " + message) {}
};

} // namespace strata
