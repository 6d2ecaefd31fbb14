// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_QUANTIZED_STATE_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_QUANTIZED_STATE_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

#include "kernels/blockwise_quant.h"
#include "kernels/codebook.h"
#include "utilities/parallel.h"
#include "utilities/tensor.h"

namespace lowbit {

/**
 * @brief Owned quantized buffer: packed codes plus one absmax per block.
 *
 * Used for compressed optimizer moments. The codes hold `packed_size(NumElements, bits)`
 * bytes and AbsMax holds `num_blocks(NumElements, BlockSize)` floats; validate() checks both.
 */
struct QuantizedState {
    ECodebookKind Kind = ECodebookKind::DYNAMIC;
    int BlockSize = DEFAULT_BLOCK_SIZE;
    std::size_t NumElements = 0;
    std::vector<std::uint8_t> Codes;
    std::vector<float> AbsMax;

    //! State representing all zeros: every code is the zero code, every absmax is 0.
    static QuantizedState zeros(std::size_t n, int block_size, ECodebookKind kind);

    //! Quantizes @p values into a new state.
    static QuantizedState from_values(std::span<const float> values, int block_size, ECodebookKind kind,
                                      const ExecContext& ctx);

    [[nodiscard]] const Codebook& codebook() const { return get_codebook(Kind); }
    [[nodiscard]] int bits() const { return codebook_bits(Kind); }

    Tensor codes_tensor() { return Tensor::from_vector(Codes); }
    [[nodiscard]] Tensor codes_tensor() const { return Tensor::from_vector(Codes); }
    Tensor absmax_tensor() { return Tensor::from_vector(AbsMax); }
    [[nodiscard]] Tensor absmax_tensor() const { return Tensor::from_vector(AbsMax); }

    //! Throws ConfigurationError / ShapeMismatchError if the buffers are inconsistent.
    void validate() const;

    //! Throws NumericOverflowError if an absmax is NaN, infinite or negative.
    void check_absmax(std::string_view what) const;

    [[nodiscard]] std::vector<float> dequantize(const ExecContext& ctx) const;
};

/**
 * @brief Writes @p state as `[int32 n][int32 block_size][int8 kind][codes][absmax float32...]`,
 * all little-endian.
 *
 * @throws ShapeMismatchError if the element count does not fit the int32 header.
 * @throws std::runtime_error on stream failure.
 */
void save_state(std::ostream& out, const QuantizedState& state);

/**
 * @brief Reads a state written by save_state.
 *
 * @throws ConfigurationError for an unknown kind or an invalid block size.
 * @throws ShapeMismatchError for a negative element count.
 * @throws NumericOverflowError for a non-finite or negative absmax.
 * @throws std::runtime_error for truncated input.
 */
QuantizedState load_state(std::istream& in);

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_QUANTIZED_STATE_H
