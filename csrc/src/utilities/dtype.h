// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_UTILS_DTYPE_H
#define LOWBIT_SRC_UTILS_DTYPE_H

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace lowbit {

enum class ETensorDType : int {
    FP32,
    BF16,
    FP16,
    BYTE
};

//! 16-bit brain float, storage only. Arithmetic happens in float.
struct bfloat16 {
    std::uint16_t bits = 0;
};

//! IEEE 754 binary16, storage only. Arithmetic happens in float.
struct float16 {
    std::uint16_t bits = 0;
};

// ----------------------------------------------------------------------------
// Conversions. All narrowing conversions round to nearest even.

inline std::uint16_t float_to_bf16_bits(float f) {
    std::uint32_t u = std::bit_cast<std::uint32_t>(f);
    if ((u & 0x7FFFFFFFu) > 0x7F800000u) {
        // keep NaN a (quiet) NaN after truncation
        return static_cast<std::uint16_t>((u >> 16) | 0x0040u);
    }
    std::uint32_t lsb = (u >> 16) & 1u;
    std::uint32_t rounding_bias = 0x7FFFu + lsb;
    u += rounding_bias;
    return static_cast<std::uint16_t>(u >> 16);
}

inline float bf16_bits_to_float(std::uint16_t h) {
    return std::bit_cast<float>(static_cast<std::uint32_t>(h) << 16);
}

inline std::uint16_t float_to_half_bits(float f) {
    const std::uint32_t x = std::bit_cast<std::uint32_t>(f);
    const std::uint32_t sign = (x >> 16) & 0x8000u;
    const std::uint32_t abs = x & 0x7FFFFFFFu;

    if (abs >= 0x7F800000u) {
        return static_cast<std::uint16_t>(sign | 0x7C00u | (abs > 0x7F800000u ? 0x0200u : 0u));
    }
    // 65520 and above round to infinity
    if (abs >= 0x477FF000u) {
        return static_cast<std::uint16_t>(sign | 0x7C00u);
    }
    // below 2^-14: subnormal half
    if (abs < 0x38800000u) {
        if (abs < 0x33000000u) {
            return static_cast<std::uint16_t>(sign);
        }
        const std::uint32_t exp = abs >> 23;
        const std::uint32_t mant = (abs & 0x007FFFFFu) | 0x00800000u;
        const std::uint32_t shift = 126u - exp;
        std::uint32_t m = mant >> shift;
        const std::uint32_t rem = mant & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1u);
        if (rem > halfway || (rem == halfway && (m & 1u))) {
            ++m;
        }
        return static_cast<std::uint16_t>(sign | m);
    }

    std::uint32_t h = (abs >> 13) - (112u << 10);
    const std::uint32_t rem = abs & 0x1FFFu;
    if (rem > 0x1000u || (rem == 0x1000u && (h & 1u))) {
        ++h;
    }
    return static_cast<std::uint16_t>(sign | h);
}

inline float half_bits_to_float(std::uint16_t h) {
    const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000u) << 16;
    const std::uint32_t exp = (h >> 10) & 0x1Fu;
    const std::uint32_t mant = h & 0x03FFu;

    if (exp == 0) {
        const float value = std::ldexp(static_cast<float>(mant), -24);
        return sign ? -value : value;
    }
    if (exp == 31) {
        return std::bit_cast<float>(sign | 0x7F800000u | (mant << 13));
    }
    return std::bit_cast<float>(sign | ((exp + 112u) << 23) | (mant << 13));
}

inline float to_float(float v) { return v; }
inline float to_float(bfloat16 v) { return bf16_bits_to_float(v.bits); }
inline float to_float(float16 v) { return half_bits_to_float(v.bits); }

template<typename T>
T from_float(float f);

template<> inline float from_float<float>(float f) { return f; }
template<> inline bfloat16 from_float<bfloat16>(float f) { return bfloat16{float_to_bf16_bits(f)}; }
template<> inline float16 from_float<float16>(float f) { return float16{float_to_half_bits(f)}; }

// ----------------------------------------------------------------------------

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<bfloat16> = ETensorDType::BF16;
template<> inline constexpr ETensorDType dtype_from_type<float16> = ETensorDType::FP16;
template<> inline constexpr ETensorDType dtype_from_type<std::uint8_t> = ETensorDType::BYTE;

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::BF16: return 2;
        case ETensorDType::FP16: return 2;
        case ETensorDType::BYTE: return 1;
    }
    return 0;
}

const char* dtype_to_str(ETensorDType dtype);

//! True for the element types the codec accepts as full-precision input.
constexpr bool is_float_dtype(ETensorDType dtype) {
    return dtype == ETensorDType::FP32 || dtype == ETensorDType::BF16 || dtype == ETensorDType::FP16;
}

} // namespace lowbit

#endif //LOWBIT_SRC_UTILS_DTYPE_H
