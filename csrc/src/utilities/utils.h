// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILS_UTILS_H
#define MOESHARD_SRC_UTILS_UTILS_H

#include <concepts>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

//! Checked integer conversion.
//! @throws std::out_of_range if @p input does not fit into Dst.
template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if (std::cmp_less(input, std::numeric_limits<Dst>::min())) {
        throw std::out_of_range("Out of range in integer conversion: underflow");
    }
    if (std::cmp_greater(input, std::numeric_limits<Dst>::max())) {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }
    return static_cast<Dst>(input);
}

/// Case-insensitive ASCII comparison.
bool iequals(std::string_view lhs, std::string_view rhs);

#endif //MOESHARD_SRC_UTILS_UTILS_H
