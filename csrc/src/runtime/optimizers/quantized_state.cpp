// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "quantized_state.h"

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>

#include <fmt/format.h>

namespace lowbit {

namespace {

void write_u32(std::ostream& out, std::uint32_t value) {
    const std::array<char, 4> bytes = {
        static_cast<char>(value & 0xFF),
        static_cast<char>((value >> 8) & 0xFF),
        static_cast<char>((value >> 16) & 0xFF),
        static_cast<char>((value >> 24) & 0xFF)
    };
    out.write(bytes.data(), bytes.size());
}

std::uint32_t read_u32(std::istream& in, const char* what) {
    std::array<unsigned char, 4> bytes{};
    if (!in.read(reinterpret_cast<char*>(bytes.data()), bytes.size())) {
        throw std::runtime_error(fmt::format("Truncated quantized state: could not read {}", what));
    }
    return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8) |
           (static_cast<std::uint32_t>(bytes[2]) << 16) | (static_cast<std::uint32_t>(bytes[3]) << 24);
}

//! Grows @p codes at most one chunk ahead of the bytes actually read.
void read_codes(std::istream& in, std::vector<std::uint8_t>& codes, std::size_t count) {
    constexpr std::size_t chunk = std::size_t{1} << 20;
    while (codes.size() < count) {
        const std::size_t offset = codes.size();
        const std::size_t len = std::min(chunk, count - offset);
        codes.resize(offset + len);
        if (!in.read(reinterpret_cast<char*>(codes.data() + offset), static_cast<std::streamsize>(len))) {
            throw std::runtime_error(fmt::format("Truncated quantized state: expected {} code bytes", count));
        }
    }
}

} // namespace

QuantizedState QuantizedState::zeros(std::size_t n, int block_size, ECodebookKind kind) {
    check_block_size(block_size);
    const Codebook& codebook = get_codebook(kind);

    QuantizedState state;
    state.Kind = kind;
    state.BlockSize = block_size;
    state.NumElements = n;
    state.AbsMax.assign(num_blocks(n, block_size), 0.0f);
    const auto zero = static_cast<std::uint8_t>(codebook.zero_code());
    if (codebook.bits() == 4) {
        // odd tails keep a zero high nibble, as pack_nibbles writes them
        state.Codes.assign(packed_size(n, 4), pack_nibble_pair(zero, zero));
        if (n & 1u) {
            state.Codes.back() = pack_nibble_pair(zero, 0);
        }
    } else {
        state.Codes.assign(n, zero);
    }
    return state;
}

QuantizedState QuantizedState::from_values(std::span<const float> values, int block_size, ECodebookKind kind,
                                           const ExecContext& ctx) {
    QuantizedState state = zeros(values.size(), block_size, kind);
    quantize_blockwise(state.Codes.data(), state.Codes.size(), state.AbsMax.data(), state.AbsMax.size(),
                       values.data(), values.size(), block_size, state.codebook(), ctx);
    return state;
}

void QuantizedState::validate() const {
    check_quantized_shapes("quantized state", NumElements, Codes.size(), AbsMax.size(), BlockSize, bits());
}

void QuantizedState::check_absmax(std::string_view what) const {
    for (std::size_t b = 0; b < AbsMax.size(); ++b) {
        if (!std::isfinite(AbsMax[b]) || AbsMax[b] < 0.0f) {
            throw NumericOverflowError(fmt::format("{}: invalid absmax {} in block {}", what, AbsMax[b], b));
        }
    }
}

std::vector<float> QuantizedState::dequantize(const ExecContext& ctx) const {
    std::vector<float> out(NumElements);
    dequantize_blockwise(out.data(), out.size(), Codes.data(), Codes.size(), AbsMax.data(), AbsMax.size(),
                         BlockSize, codebook(), ctx);
    return out;
}

void save_state(std::ostream& out, const QuantizedState& state) {
    state.validate();
    if (state.NumElements > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw ShapeMismatchError(fmt::format("Quantized state with {} elements does not fit the int32 header",
                                             state.NumElements));
    }

    write_u32(out, static_cast<std::uint32_t>(state.NumElements));
    write_u32(out, static_cast<std::uint32_t>(state.BlockSize));
    out.put(static_cast<char>(static_cast<std::int8_t>(state.Kind)));
    out.write(reinterpret_cast<const char*>(state.Codes.data()), static_cast<std::streamsize>(state.Codes.size()));
    for (float a : state.AbsMax) {
        write_u32(out, std::bit_cast<std::uint32_t>(a));
    }
    if (!out) {
        throw std::runtime_error("Failed to write quantized state");
    }
}

QuantizedState load_state(std::istream& in) {
    const auto n = static_cast<std::int32_t>(read_u32(in, "element count"));
    const auto block_size = static_cast<std::int32_t>(read_u32(in, "block size"));
    char kind_byte = 0;
    if (!in.get(kind_byte)) {
        throw std::runtime_error("Truncated quantized state: could not read codebook kind");
    }

    const ECodebookKind kind = codebook_kind_from_int(static_cast<std::int8_t>(kind_byte));
    check_block_size(block_size);
    if (n < 0) {
        throw ShapeMismatchError(fmt::format("Quantized state has negative element count {}", n));
    }

    QuantizedState state;
    state.Kind = kind;
    state.BlockSize = block_size;
    state.NumElements = static_cast<std::size_t>(n);
    read_codes(in, state.Codes, packed_size(state.NumElements, codebook_bits(kind)));
    const std::size_t blocks = num_blocks(state.NumElements, block_size);
    for (std::size_t b = 0; b < blocks; ++b) {
        state.AbsMax.push_back(std::bit_cast<float>(read_u32(in, "absmax")));
    }
    state.check_absmax("quantized state");
    return state;
}

} // namespace lowbit
