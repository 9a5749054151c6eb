#include "strata/io.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <vector>

#include "strata/debug.hpp"

namespace strata {
namespace io {

// ============================================================================
// Helper functions
// ============================================================================

namespace {

template <typename T> void write_value(std::ostream &stream, const T &value) {
    stream.write(reinterpret_cast<const char *>(&value), sizeof(T));
}

template <typename T> T read_value(std::istream &stream) {
    T value;
    stream.read(reinterpret_cast<char *>(&value), sizeof(T));
    if (!stream.good()) {
        throw FileFormatError("unexpected end of stream");
    }
    return value;
}

StrataFileHeader create_header(const Tensor &tensor) {
    StrataFileHeader header = {};
    header.magic = STRATA_MAGIC_NUMBER;
    header.version = STRATA_FILE_VERSION;
    header.dtype = static_cast<uint32_t>(tensor.dtype());
    header.rank = static_cast<uint32_t>(tensor.rank());
    header.total_elements = static_cast<uint64_t>(tensor.count());
    header.data_size =
        static_cast<uint64_t>(tensor.count()) * tensor.itemsize();
    return header;
}

void validate_header(const StrataFileHeader &header) {
    if (header.magic != STRATA_MAGIC_NUMBER) {
        throw FileFormatError("invalid magic number - not a strata stream");
    }
    if (header.version > STRATA_FILE_VERSION) {
        throw FileFormatError("unsupported file version: " +
                              std::to_string(header.version));
    }
    if (header.rank == 0 || header.rank > kMaxRank) {
        throw FileFormatError("unsupported rank: " +
                              std::to_string(header.rank));
    }
    if (header.dtype > UINT8_MAX ||
        !is_valid_dtype(static_cast<uint8_t>(header.dtype))) {
        throw FileFormatError("unknown dtype code: " +
                              std::to_string(header.dtype));
    }
    auto dtype = static_cast<DType>(header.dtype);
    if (header.data_size != header.total_elements * dtype_size(dtype)) {
        throw FileFormatError("data size " + std::to_string(header.data_size) +
                              " does not match " +
                              std::to_string(header.total_elements) +
                              " elements of " + dtype_name(dtype));
    }
}

} // namespace

// ============================================================================
// Streams
// ============================================================================

void encode(const Tensor &tensor, std::ostream &stream) {
    trace::ScopedTrace scope(trace::Category::DataCopy, "encode",
                             tensor.extents().str());
    auto header = create_header(tensor);
    write_value(stream, header);
    for (int64_t extent : tensor.extents()) {
        write_value(stream, extent);
    }

    if (tensor.count() > 0) {
        Tensor dense = tensor.dense();
        auto data = static_cast<const char *>(dense.read_only_bytes());
        stream.write(data, static_cast<std::streamsize>(header.data_size));
    }
    if (!stream.good()) {
        throw SerializationError("failed to write tensor to stream");
    }
}

Tensor decode(const ContextPtr &context, std::istream &stream) {
    trace::ScopedTrace scope(trace::Category::DataAlloc, "decode");
    auto header = read_value<StrataFileHeader>(stream);
    validate_header(header);

    ShapeArray extents;
    for (uint32_t i = 0; i < header.rank; ++i) {
        auto extent = read_value<int64_t>(stream);
        if (extent < 0) {
            throw FileFormatError("negative extent " + std::to_string(extent));
        }
        extents.push_back(extent);
    }
    if (static_cast<uint64_t>(extents.product()) != header.total_elements) {
        throw FileFormatError("extents " + extents.str() +
                              " do not match element count " +
                              std::to_string(header.total_elements));
    }

    std::vector<char> bytes(header.data_size);
    if (header.data_size > 0) {
        stream.read(bytes.data(),
                    static_cast<std::streamsize>(header.data_size));
        if (static_cast<uint64_t>(stream.gcount()) != header.data_size) {
            throw FileFormatError("expected " +
                                  std::to_string(header.data_size) +
                                  " bytes of element data");
        }
    }

    Shape shape(extents);
    auto storage = std::make_shared<Storage>(
        context, static_cast<const void *>(bytes.data()), shape.count(),
        static_cast<DType>(header.dtype), "decoded");
    return Tensor(shape, std::move(storage));
}

// ============================================================================
// Files
// ============================================================================

void save(const Tensor &tensor, const std::string &filename) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw SerializationError("cannot open file for writing: " + filename);
    }
    encode(tensor, file);
}

Tensor load(const ContextPtr &context, const std::string &filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw SerializationError("cannot open file for reading: " + filename);
    }
    return decode(context, file);
}

FileFormat detect_format(std::istream &stream) {
    auto start = stream.tellg();
    uint32_t magic = 0;
    stream.read(reinterpret_cast<char *>(&magic), sizeof(magic));
    bool complete = stream.gcount() == sizeof(magic);
    stream.clear();
    stream.seekg(start);
    if (complete && magic == STRATA_MAGIC_NUMBER)
        return FileFormat::Strata;
    return FileFormat::Unknown;
}

FileFormat detect_format(const std::string &filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw SerializationError("cannot open file for reading: " + filename);
    }
    return detect_format(file);
}

} // namespace io
} // namespace strata
