// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Blockwise quantization with per-block absmax scaling.
// Based on bitsandbytes implementation: https://github.com/TimDettmers/bitsandbytes

#ifndef LOWBIT_SRC_KERNELS_BLOCKWISE_QUANT_H
#define LOWBIT_SRC_KERNELS_BLOCKWISE_QUANT_H

#include <cstddef>
#include <cstdint>

#include "kernels/codebook.h"
#include "kernels/nibble_pack.h"
#include "utilities/dtype.h"
#include "utilities/parallel.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

namespace lowbit {

// Block sizes are powers of two in [MIN_BLOCK_SIZE, MAX_BLOCK_SIZE]. Even block sizes keep
// every packed 4-bit byte inside a single block, so blocks never share a byte.
constexpr int MIN_BLOCK_SIZE = 2;
constexpr int MAX_BLOCK_SIZE = 1 << 20;
constexpr int DEFAULT_BLOCK_SIZE = 256;

/// @brief Throws ConfigurationError unless @p block_size is a power of two within range.
void check_block_size(int block_size);

/// @brief Number of blocks (and absmax entries) for @p num_elements elements.
constexpr std::size_t num_blocks(std::size_t num_elements, int block_size) {
    return div_ceil(num_elements, static_cast<std::size_t>(block_size));
}

/**
 * @brief Validates the buffers of a quantized tensor against its element count.
 *
 * @param what Name of the buffer used in error messages.
 * @throws ConfigurationError on an invalid block size.
 * @throws ShapeMismatchError if `codes_len != packed_size(n, bits)` or
 *         `absmax_len != num_blocks(n, block_size)`.
 */
void check_quantized_shapes(const char* what, std::size_t num_elements, std::size_t codes_len,
                            std::size_t absmax_len, int block_size, int bits);

namespace detail {

/**
 * @brief Encodes one block of @p count values scaled by @p absmax.
 *
 * @param codes Packed output of the block (first byte of the block).
 * @param scratch At least @p count bytes, only used for 4-bit codebooks.
 */
template<typename T>
inline void encode_block(std::uint8_t* codes, const T* values, int count, float absmax,
                         const Codebook& codebook, std::uint8_t* scratch) {
    const float* table = codebook.data();
    const int size = codebook.size();
    const auto zero = static_cast<std::uint8_t>(codebook.zero_code());
    std::uint8_t* out = codebook.bits() == 8 ? codes : scratch;

    if (absmax == 0.0f) {
        for (int i = 0; i < count; ++i) out[i] = zero;
    } else {
        for (int i = 0; i < count; ++i) {
            const float normed = to_float(values[i]) / absmax;
            out[i] = static_cast<std::uint8_t>(nearest_code(normed, table, size));
        }
    }

    if (codebook.bits() == 4) {
        pack_nibbles(codes, scratch, static_cast<std::size_t>(count));
    }
}

/// @brief Decodes one block: `out[i] = codebook[code_i] * absmax`.
inline void decode_block(float* out, const std::uint8_t* codes, int count, float absmax, const Codebook& codebook) {
    const float* table = codebook.data();
    if (codebook.bits() == 8) {
        for (int i = 0; i < count; ++i) out[i] = table[codes[i]] * absmax;
    } else {
        for (int i = 0; i < count; ++i) out[i] = table[get_nibble(codes, static_cast<std::size_t>(i))] * absmax;
    }
}

/// @brief Byte offset of the first code of block @p block.
inline std::size_t block_code_offset(std::size_t block, int block_size, int bits) {
    return packed_size(block * static_cast<std::size_t>(block_size), bits);
}

} // namespace detail

/**
 * @brief Blockwise quantization of @p n elements.
 *
 * Computes one absmax per block of @p block_size elements, then maps each element
 * `x / absmax` to its nearest code. All validation (shapes, block size, finite absmax)
 * happens before @p codes or @p absmax are written.
 *
 * @param[out] codes Packed codes, `packed_size(n, codebook.bits())` bytes.
 * @param[out] absmax Per-block scales, `num_blocks(n, block_size)` floats.
 * @throws ConfigurationError, ShapeMismatchError, NumericOverflowError
 */
template<typename T>
void quantize_blockwise(std::uint8_t* codes, std::size_t codes_len, float* absmax, std::size_t absmax_len,
                        const T* in, std::size_t n, int block_size, const Codebook& codebook, const ExecContext& ctx);

/**
 * @brief Blockwise dequantization: `out[i] = codebook[code_i] * absmax[i / block_size]`.
 * @throws ConfigurationError, ShapeMismatchError
 */
template<typename T>
void dequantize_blockwise(T* out, std::size_t n, const std::uint8_t* codes, std::size_t codes_len,
                          const float* absmax, std::size_t absmax_len, int block_size,
                          const Codebook& codebook, const ExecContext& ctx);

/// @brief Tensor-based blockwise quantization; @p in may be FP32, BF16 or FP16.
void quantize_blockwise(Tensor& codes, Tensor& absmax, const Tensor& in, int block_size,
                        const Codebook& codebook, const ExecContext& ctx);

/// @brief Tensor-based blockwise dequantization; @p out may be FP32, BF16 or FP16.
void dequantize_blockwise(Tensor& out, const Tensor& codes, const Tensor& absmax, int block_size,
                          const Codebook& codebook, const ExecContext& ctx);

} // namespace lowbit

#endif // LOWBIT_SRC_KERNELS_BLOCKWISE_QUANT_H
