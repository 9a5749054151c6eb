#include "strata/dtype.hpp"

#include "strata/error.hpp"

namespace strata {

std::string dtype_name(DType dtype) {
    switch (dtype) {
    case DType::Bool:    return "bool";
    case DType::Int8:    return "int8";
    case DType::Int16:   return "int16";
    case DType::Int32:   return "int32";
    case DType::Int64:   return "int64";
    case DType::UInt8:   return "uint8";
    case DType::UInt16:  return "uint16";
    case DType::UInt32:  return "uint32";
    case DType::UInt64:  return "uint64";
    case DType::Float32: return "float32";
    case DType::Float64: return "float64";
    }
    return "unknown";
}

DType dtype_from_name(const std::string &name) {
    for (uint8_t raw = 0; is_valid_dtype(raw); ++raw) {
        auto dtype = static_cast<DType>(raw);
        if (dtype_name(dtype) == name)
            return dtype;
    }
    throw TypeError("unknown dtype name '" + name + "'");
}

bool is_valid_dtype(uint8_t raw) {
    return raw <= static_cast<uint8_t>(DType::Float64);
}

} // namespace strata
