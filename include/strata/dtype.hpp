#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace strata {

// Closed set of element types a storage can hold
enum class DType : uint8_t {
    Bool,

    Int8,
    Int16,
    Int32,
    Int64,

    UInt8,
    UInt16,
    UInt32,
    UInt64,

    Float32,
    Float64,
};

constexpr size_t dtype_size(DType dtype) {
    switch (dtype) {
    case DType::Bool:
    case DType::Int8:
    case DType::UInt8:
        return 1;
    case DType::Int16:
    case DType::UInt16:
        return 2;
    case DType::Int32:
    case DType::UInt32:
    case DType::Float32:
        return 4;
    case DType::Int64:
    case DType::UInt64:
    case DType::Float64:
        return 8;
    }
    return 0;
}

std::string dtype_name(DType dtype);

// Inverse of dtype_name, throws TypeError for unknown names
DType dtype_from_name(const std::string &name);

bool is_valid_dtype(uint8_t raw);

template <typename T> struct dtype_of;

template <> struct dtype_of<bool> {
    static constexpr DType value = DType::Bool;
};
template <> struct dtype_of<int8_t> {
    static constexpr DType value = DType::Int8;
};
template <> struct dtype_of<int16_t> {
    static constexpr DType value = DType::Int16;
};
template <> struct dtype_of<int32_t> {
    static constexpr DType value = DType::Int32;
};
template <> struct dtype_of<int64_t> {
    static constexpr DType value = DType::Int64;
};
template <> struct dtype_of<uint8_t> {
    static constexpr DType value = DType::UInt8;
};
template <> struct dtype_of<uint16_t> {
    static constexpr DType value = DType::UInt16;
};
template <> struct dtype_of<uint32_t> {
    static constexpr DType value = DType::UInt32;
};
template <> struct dtype_of<uint64_t> {
    static constexpr DType value = DType::UInt64;
};
template <> struct dtype_of<float> {
    static constexpr DType value = DType::Float32;
};
template <> struct dtype_of<double> {
    static constexpr DType value = DType::Float64;
};

template <typename T>
constexpr DType dtype_of_v = dtype_of<std::remove_cv_t<T>>::value;

} // namespace strata
