// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILITIES_DTYPE_H
#define MOESHARD_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>

//! Element types a host Tensor can carry. Expert features are FP32, routing
//! indices and counts INT32, serialized expert blobs BYTE.
enum class ETensorDType : int {
    FP32,
    INT32,
    BYTE
};

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return sizeof(float);
        case ETensorDType::INT32: return sizeof(std::int32_t);
        case ETensorDType::BYTE: return 1;
    }
    throw std::logic_error("get_dtype_size: unknown dtype");
}

constexpr const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::INT32: return "int32";
        case ETensorDType::BYTE: return "byte";
    }
    return "<unknown>";
}

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

#endif //MOESHARD_SRC_UTILITIES_DTYPE_H
