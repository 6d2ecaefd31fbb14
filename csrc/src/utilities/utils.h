// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_UTILS_UTILS_H
#define LOWBIT_SRC_UTILS_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lowbit {

/// Base class of all errors raised by the codec and the optimizer kernels.
/// Every one of them is raised before any output buffer is modified.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid static parameters: unknown codebook kind, bad block size, hyperparameter out of domain.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/// Buffer lengths or dtypes that disagree with the declared element count, block size or bit width.
class ShapeMismatchError : public Error {
public:
    using Error::Error;
};

/// Non-finite values where the computation requires finite ones (e.g. NaN absmax from NaN input).
class NumericOverflowError : public Error {
public:
    using Error::Error;
};

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

template<std::integral T>
constexpr bool is_power_of_two(T value) {
    return value > 0 && (value & (value - 1)) == 0;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (std::cmp_greater(input, std::numeric_limits<Dst>::max()))
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
bool iequals(std::string_view lhs, std::string_view rhs);

} // namespace lowbit

#endif //LOWBIT_SRC_UTILS_UTILS_H
