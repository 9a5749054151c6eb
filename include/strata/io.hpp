#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "strata/tensor.hpp"

namespace strata {
namespace io {

// Version information for file format compatibility
constexpr uint32_t STRATA_FILE_VERSION = 1;
constexpr uint32_t STRATA_MAGIC_NUMBER = 0x41525453; // "STRA"

// File format header structure, followed by rank int64 extents and the
// elements in logical row-major order
struct StrataFileHeader {
    uint32_t magic;          // Magic number for file identification
    uint32_t version;        // File format version
    uint32_t dtype;          // Data type (cast from DType enum)
    uint32_t rank;           // Number of dimensions
    uint64_t total_elements; // Total number of elements
    uint64_t data_size;      // Size of data in bytes
};

enum class FileFormat { Strata, Unknown };

// ============================================================================
// Core serialization functions
// ============================================================================

/**
 * Write tensor to a binary stream as {extents, elements}. Strided and
 * broadcast views are written densely.
 */
void encode(const Tensor &tensor, std::ostream &stream);

/**
 * Read a tensor written by encode. The result is dense with offset 0
 * and is not shared.
 */
Tensor decode(const ContextPtr &context, std::istream &stream);

/**
 * Save tensor to a .strata file
 */
void save(const Tensor &tensor, const std::string &filename);

/**
 * Load tensor from a .strata file
 */
Tensor load(const ContextPtr &context, const std::string &filename);

// Inspects the leading magic number without consuming the stream
FileFormat detect_format(std::istream &stream);
FileFormat detect_format(const std::string &filename);

} // namespace io
} // namespace strata
