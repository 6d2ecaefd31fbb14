// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Nested quantization of the per-block absmax statistics of a 4-bit tensor.

#ifndef LOWBIT_SRC_KERNELS_DOUBLE_QUANT_H
#define LOWBIT_SRC_KERNELS_DOUBLE_QUANT_H

#include <cstddef>
#include <cstdint>

#include "utilities/parallel.h"

namespace lowbit {

//! Number of absmax values sharing one second-level scale.
constexpr int ABSMAX_GROUP_SIZE = 256;

/**
 * @brief Quantizes an absmax array to 8 bits.
 *
 * The mean of @p absmax is subtracted first and returned in @p offset; the residual is
 * quantized with the signed dynamic codebook in groups of ABSMAX_GROUP_SIZE values, one
 * float scale per group.
 *
 * @param[out] codes `n` bytes.
 * @param[out] scales `ceil(n / ABSMAX_GROUP_SIZE)` floats.
 * @param[out] offset Mean of @p absmax.
 * @throws ShapeMismatchError on inconsistent buffer lengths.
 * @throws NumericOverflowError if @p absmax contains non-finite values.
 */
void quantize_absmax_double(std::uint8_t* codes, std::size_t codes_len, float* scales, std::size_t scales_len,
                            float& offset, const float* absmax, std::size_t n, const ExecContext& ctx);

/**
 * @brief Inverse of quantize_absmax_double: `absmax[i] = dynamic[codes[i]] * scales[i / 256] + offset`.
 * @throws ShapeMismatchError on inconsistent buffer lengths.
 */
void dequantize_absmax_double(float* absmax, std::size_t n, const std::uint8_t* codes, std::size_t codes_len,
                              const float* scales, std::size_t scales_len, float offset, const ExecContext& ctx);

} // namespace lowbit

#endif // LOWBIT_SRC_KERNELS_DOUBLE_QUANT_H
