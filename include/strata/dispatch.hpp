#pragma once

#include <cstdint>
#include <variant>

#include "strata/dtype.hpp"
#include "strata/error.hpp"

namespace strata {

// Carries an element type through std::visit
template <typename T> struct TypeTag {
    using value_type = T;
};

using TypeVariant =
    std::variant<TypeTag<bool>, TypeTag<int8_t>, TypeTag<int16_t>,
                 TypeTag<int32_t>, TypeTag<int64_t>, TypeTag<uint8_t>,
                 TypeTag<uint16_t>, TypeTag<uint32_t>, TypeTag<uint64_t>,
                 TypeTag<float>, TypeTag<double>>;

namespace detail {

inline TypeVariant dtype_to_variant(DType dtype) {
    switch (dtype) {
    case DType::Bool:
        return TypeTag<bool>();
    case DType::Int8:
        return TypeTag<int8_t>();
    case DType::Int16:
        return TypeTag<int16_t>();
    case DType::Int32:
        return TypeTag<int32_t>();
    case DType::Int64:
        return TypeTag<int64_t>();
    case DType::UInt8:
        return TypeTag<uint8_t>();
    case DType::UInt16:
        return TypeTag<uint16_t>();
    case DType::UInt32:
        return TypeTag<uint32_t>();
    case DType::UInt64:
        return TypeTag<uint64_t>();
    case DType::Float32:
        return TypeTag<float>();
    case DType::Float64:
        return TypeTag<double>();
    }
    throw TypeError::unsupported_dtype(
        std::to_string(static_cast<int>(dtype)), "dispatch");
}

} // namespace detail

// Universal dispatch: invokes fn with the TypeTag matching dtype
template <typename Fn> decltype(auto) dispatch(DType dtype, Fn &&fn) {
    return std::visit(std::forward<Fn>(fn), detail::dtype_to_variant(dtype));
}

} // namespace strata
