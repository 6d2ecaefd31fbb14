// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "double_quant.h"

#include <cmath>
#include <vector>

#include <fmt/format.h>

#include "kernels/blockwise_quant.h"
#include "kernels/codebook.h"

namespace lowbit {

void quantize_absmax_double(std::uint8_t* codes, std::size_t codes_len, float* scales, std::size_t scales_len,
                            float& offset, const float* absmax, std::size_t n, const ExecContext& ctx) {
    const Codebook& codebook = get_codebook(ECodebookKind::DYNAMIC);
    check_quantized_shapes("quantize_absmax_double", n, codes_len, scales_len, ABSMAX_GROUP_SIZE, codebook.bits());

    // serial sum in double: the offset is independent of the thread count
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(absmax[i])) {
            throw NumericOverflowError(fmt::format("quantize_absmax_double: absmax[{}] is {}", i, absmax[i]));
        }
        sum += absmax[i];
    }
    const float mean = n == 0 ? 0.0f : static_cast<float>(sum / static_cast<double>(n));

    std::vector<float> residual(n);
    for (std::size_t i = 0; i < n; ++i) {
        residual[i] = absmax[i] - mean;
    }

    quantize_blockwise(codes, codes_len, scales, scales_len, residual.data(), n, ABSMAX_GROUP_SIZE, codebook, ctx);
    offset = mean;
}

void dequantize_absmax_double(float* absmax, std::size_t n, const std::uint8_t* codes, std::size_t codes_len,
                              const float* scales, std::size_t scales_len, float offset, const ExecContext& ctx) {
    dequantize_blockwise(absmax, n, codes, codes_len, scales, scales_len, ABSMAX_GROUP_SIZE,
                         get_codebook(ECodebookKind::DYNAMIC), ctx);
    for (std::size_t i = 0; i < n; ++i) {
        absmax[i] += offset;
    }
}

} // namespace lowbit
