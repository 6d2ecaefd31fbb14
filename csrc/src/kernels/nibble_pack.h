// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// 4-bit code packing. Element i lives in byte i/2; even elements use the low nibble,
// odd elements the high nibble.

#ifndef LOWBIT_SRC_KERNELS_NIBBLE_PACK_H
#define LOWBIT_SRC_KERNELS_NIBBLE_PACK_H

#include <cstddef>
#include <cstdint>

namespace lowbit {

/// @brief Packed storage size in bytes for @p num_elements codes of @p bits (8 or 4) bits each.
constexpr std::size_t packed_size(std::size_t num_elements, int bits) {
    return bits == 4 ? (num_elements + 1) / 2 : num_elements;
}

/// @brief Pack two 4-bit codes into one byte.
constexpr std::uint8_t pack_nibble_pair(std::uint8_t lo, std::uint8_t hi) {
    return static_cast<std::uint8_t>(((hi & 0x0F) << 4) | (lo & 0x0F));
}

/// @brief Read the 4-bit code of element @p index.
inline std::uint8_t get_nibble(const std::uint8_t* packed, std::size_t index) {
    const unsigned shift = static_cast<unsigned>(index & 1u) * 4u;
    return static_cast<std::uint8_t>((packed[index >> 1] >> shift) & 0x0F);
}

/**
 * @brief Pack @p n 4-bit codes (one per byte in @p codes) into `packed_size(n, 4)` bytes.
 *
 * For odd @p n the unused high nibble of the last byte is zero.
 */
inline void pack_nibbles(std::uint8_t* packed, const std::uint8_t* codes, std::size_t n) {
    for (std::size_t i = 0; i + 1 < n; i += 2) {
        packed[i >> 1] = pack_nibble_pair(codes[i], codes[i + 1]);
    }
    if (n & 1u) {
        packed[n >> 1] = pack_nibble_pair(codes[n - 1], 0);
    }
}

/// @brief Unpack @p n 4-bit codes into one byte each.
inline void unpack_nibbles(std::uint8_t* codes, const std::uint8_t* packed, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        codes[i] = get_nibble(packed, i);
    }
}

} // namespace lowbit

#endif // LOWBIT_SRC_KERNELS_NIBBLE_PACK_H
