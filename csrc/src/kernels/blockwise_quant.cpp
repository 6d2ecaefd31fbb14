// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "blockwise_quant.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include <fmt/format.h>

#include "kernels/block_stats.h"

namespace lowbit {

void check_block_size(int block_size) {
    if (!is_power_of_two(block_size) || block_size < MIN_BLOCK_SIZE || block_size > MAX_BLOCK_SIZE) {
        throw ConfigurationError(fmt::format("Block size must be a power of two in [{}, {}], got {}",
                                             MIN_BLOCK_SIZE, MAX_BLOCK_SIZE, block_size));
    }
}

void check_quantized_shapes(const char* what, std::size_t num_elements, std::size_t codes_len,
                            std::size_t absmax_len, int block_size, int bits) {
    check_block_size(block_size);
    const std::size_t expected_codes = packed_size(num_elements, bits);
    if (codes_len != expected_codes) {
        throw ShapeMismatchError(fmt::format("{}: {} elements at {} bits need {} code bytes, got {}",
                                             what, num_elements, bits, expected_codes, codes_len));
    }
    const std::size_t expected_blocks = num_blocks(num_elements, block_size);
    if (absmax_len != expected_blocks) {
        throw ShapeMismatchError(fmt::format("{}: {} elements with block size {} need {} absmax values, got {}",
                                             what, num_elements, block_size, expected_blocks, absmax_len));
    }
}

template<typename T>
void quantize_blockwise(std::uint8_t* codes, std::size_t codes_len, float* absmax, std::size_t absmax_len,
                        const T* in, std::size_t n, int block_size, const Codebook& codebook, const ExecContext& ctx) {
    const int bits = codebook.bits();
    check_quantized_shapes("quantize_blockwise", n, codes_len, absmax_len, block_size, bits);

    const long blocks = static_cast<long>(num_blocks(n, block_size));
    auto block_count = [&](long b) {
        return static_cast<int>(std::min<std::size_t>(block_size, n - static_cast<std::size_t>(b) * block_size));
    };

    // pass 1: statistics only, so a non-finite block is reported before anything is written
    std::vector<float> block_absmax(blocks);
    parallel_for_blocks(blocks, ctx, [&](long begin, long end) {
        for (long b = begin; b < end; ++b) {
            block_absmax[b] = compute_block_absmax(in + static_cast<std::size_t>(b) * block_size, block_count(b));
        }
    });

    for (long b = 0; b < blocks; ++b) {
        if (!std::isfinite(block_absmax[b])) {
            throw NumericOverflowError(fmt::format("quantize_blockwise: block {} (elements {}..{}) has non-finite absmax {}",
                                                   b, b * static_cast<long>(block_size),
                                                   b * static_cast<long>(block_size) + block_count(b) - 1,
                                                   block_absmax[b]));
        }
    }

    // pass 2: encode
    parallel_for_blocks(blocks, ctx, [&](long begin, long end) {
        std::vector<std::uint8_t> scratch(bits == 4 ? block_size : 0);
        for (long b = begin; b < end; ++b) {
            const std::size_t first = static_cast<std::size_t>(b) * block_size;
            absmax[b] = block_absmax[b];
            detail::encode_block(codes + detail::block_code_offset(b, block_size, bits), in + first,
                                 block_count(b), block_absmax[b], codebook, scratch.data());
        }
    });
}

template<typename T>
void dequantize_blockwise(T* out, std::size_t n, const std::uint8_t* codes, std::size_t codes_len,
                          const float* absmax, std::size_t absmax_len, int block_size,
                          const Codebook& codebook, const ExecContext& ctx) {
    const int bits = codebook.bits();
    check_quantized_shapes("dequantize_blockwise", n, codes_len, absmax_len, block_size, bits);

    const long blocks = static_cast<long>(num_blocks(n, block_size));
    parallel_for_blocks(blocks, ctx, [&](long begin, long end) {
        std::vector<float> values(block_size);
        for (long b = begin; b < end; ++b) {
            const std::size_t first = static_cast<std::size_t>(b) * block_size;
            const int count = static_cast<int>(std::min<std::size_t>(block_size, n - first));
            detail::decode_block(values.data(), codes + detail::block_code_offset(b, block_size, bits),
                                 count, absmax[b], codebook);
            for (int i = 0; i < count; ++i) {
                out[first + i] = from_float<T>(values[i]);
            }
        }
    });
}

template void quantize_blockwise<float>(std::uint8_t*, std::size_t, float*, std::size_t, const float*, std::size_t, int, const Codebook&, const ExecContext&);
template void quantize_blockwise<bfloat16>(std::uint8_t*, std::size_t, float*, std::size_t, const bfloat16*, std::size_t, int, const Codebook&, const ExecContext&);
template void quantize_blockwise<float16>(std::uint8_t*, std::size_t, float*, std::size_t, const float16*, std::size_t, int, const Codebook&, const ExecContext&);

template void dequantize_blockwise<float>(float*, std::size_t, const std::uint8_t*, std::size_t, const float*, std::size_t, int, const Codebook&, const ExecContext&);
template void dequantize_blockwise<bfloat16>(bfloat16*, std::size_t, const std::uint8_t*, std::size_t, const float*, std::size_t, int, const Codebook&, const ExecContext&);
template void dequantize_blockwise<float16>(float16*, std::size_t, const std::uint8_t*, std::size_t, const float*, std::size_t, int, const Codebook&, const ExecContext&);

// ----------------------------------------------------------------------------
// Tensor-based wrappers

void quantize_blockwise(Tensor& codes, Tensor& absmax, const Tensor& in, int block_size,
                        const Codebook& codebook, const ExecContext& ctx) {
    std::uint8_t* c = codes.get<std::uint8_t>();
    float* a = absmax.get<float>();
    switch (in.DType) {
        case ETensorDType::FP32:
            quantize_blockwise(c, codes.nelem(), a, absmax.nelem(), in.get<float>(), in.nelem(), block_size, codebook, ctx);
            break;
        case ETensorDType::BF16:
            quantize_blockwise(c, codes.nelem(), a, absmax.nelem(), in.get<bfloat16>(), in.nelem(), block_size, codebook, ctx);
            break;
        case ETensorDType::FP16:
            quantize_blockwise(c, codes.nelem(), a, absmax.nelem(), in.get<float16>(), in.nelem(), block_size, codebook, ctx);
            break;
        default:
            throw ShapeMismatchError(fmt::format("quantize_blockwise: unsupported input dtype {}", dtype_to_str(in.DType)));
    }
}

void dequantize_blockwise(Tensor& out, const Tensor& codes, const Tensor& absmax, int block_size,
                          const Codebook& codebook, const ExecContext& ctx) {
    const std::uint8_t* c = codes.get<std::uint8_t>();
    const float* a = absmax.get<float>();
    switch (out.DType) {
        case ETensorDType::FP32:
            dequantize_blockwise(out.get<float>(), out.nelem(), c, codes.nelem(), a, absmax.nelem(), block_size, codebook, ctx);
            break;
        case ETensorDType::BF16:
            dequantize_blockwise(out.get<bfloat16>(), out.nelem(), c, codes.nelem(), a, absmax.nelem(), block_size, codebook, ctx);
            break;
        case ETensorDType::FP16:
            dequantize_blockwise(out.get<float16>(), out.nelem(), c, codes.nelem(), a, absmax.nelem(), block_size, codebook, ctx);
            break;
        default:
            throw ShapeMismatchError(fmt::format("dequantize_blockwise: unsupported output dtype {}", dtype_to_str(out.DType)));
    }
}

} // namespace lowbit
