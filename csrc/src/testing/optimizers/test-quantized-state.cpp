// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_all.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "runtime/optimizers/quantized_state.h"
#include "utilities/utils.h"

using namespace lowbit;

namespace {

std::string bytes_of(const std::vector<std::uint8_t>& v) {
    return std::string(reinterpret_cast<const char*>(v.data()), v.size());
}

std::string serialize(const QuantizedState& state) {
    std::ostringstream out(std::ios::binary);
    save_state(out, state);
    return out.str();
}

QuantizedState deserialize(const std::string& data) {
    std::istringstream in(data, std::ios::binary);
    return load_state(in);
}

std::string header(std::uint32_t n, std::uint32_t block_size, std::uint8_t kind) {
    std::vector<std::uint8_t> h = {
        static_cast<std::uint8_t>(n), static_cast<std::uint8_t>(n >> 8),
        static_cast<std::uint8_t>(n >> 16), static_cast<std::uint8_t>(n >> 24),
        static_cast<std::uint8_t>(block_size), static_cast<std::uint8_t>(block_size >> 8),
        static_cast<std::uint8_t>(block_size >> 16), static_cast<std::uint8_t>(block_size >> 24),
        kind
    };
    return bytes_of(h);
}

} // anonymous namespace

TEST_CASE("Zero states", "[quantized-state]") {
    SECTION("8-bit") {
        const QuantizedState state = QuantizedState::zeros(10, 4, ECodebookKind::DYNAMIC);
        const auto zero = static_cast<std::uint8_t>(state.codebook().zero_code());
        REQUIRE(state.Codes == std::vector<std::uint8_t>(10, zero));
        REQUIRE(state.AbsMax == std::vector<float>(3, 0.0f));
        REQUIRE(state.dequantize(ExecContext{}) == std::vector<float>(10, 0.0f));
    }
    SECTION("4-bit with an odd tail") {
        const QuantizedState state = QuantizedState::zeros(3, 2, ECodebookKind::NF4);
        REQUIRE(state.codebook().zero_code() == 7);
        REQUIRE(state.Codes == std::vector<std::uint8_t>{0x77, 0x07});
        REQUIRE(state.AbsMax.size() == 2);
        REQUIRE_NOTHROW(state.validate());
    }
    SECTION("invalid block size") {
        REQUIRE_THROWS_AS(QuantizedState::zeros(10, 3, ECodebookKind::DYNAMIC), ConfigurationError);
        REQUIRE_THROWS_AS(QuantizedState::zeros(10, 1, ECodebookKind::DYNAMIC), ConfigurationError);
    }
}

TEST_CASE("Tensor views share the state buffers", "[quantized-state]") {
    const std::vector<float> values = {0.5f, -0.25f, 1.0f, 0.0f, 0.75f};
    QuantizedState state = QuantizedState::from_values(values, 2, ECodebookKind::NF4, ExecContext{});

    const Tensor codes = state.codes_tensor();
    REQUIRE(codes.DType == ETensorDType::BYTE);
    REQUIRE(codes.nelem() == 3);
    REQUIRE(codes.get<std::uint8_t>() == state.Codes.data());

    std::vector<float> out(values.size());
    Tensor out_t = Tensor::from_vector(out);
    dequantize_blockwise(out_t, codes, state.absmax_tensor(), state.BlockSize, state.codebook(), ExecContext{});
    REQUIRE(out == state.dequantize(ExecContext{}));

    Tensor absmax = state.absmax_tensor();
    absmax.get<float>()[0] = 0.0f;
    REQUIRE(state.AbsMax[0] == 0.0f);
}

TEST_CASE("Validate rejects inconsistent buffers", "[quantized-state]") {
    QuantizedState state = QuantizedState::zeros(9, 4, ECodebookKind::DYNAMIC);
    SECTION("codes") {
        state.Codes.pop_back();
        REQUIRE_THROWS_AS(state.validate(), ShapeMismatchError);
    }
    SECTION("absmax") {
        state.AbsMax.push_back(0.0f);
        REQUIRE_THROWS_AS(state.validate(), ShapeMismatchError);
    }
    SECTION("block size") {
        state.BlockSize = 6;
        REQUIRE_THROWS_AS(state.validate(), ConfigurationError);
    }
}

TEST_CASE("Serialized layout is little-endian and byte exact", "[quantized-state][io]") {
    const std::vector<float> values = {0.0f, 0.5f, -1.0f, 0.25f, 2.0f};
    const QuantizedState state = QuantizedState::from_values(values, 4, ECodebookKind::DYNAMIC, ExecContext{});
    REQUIRE(state.AbsMax == std::vector<float>{1.0f, 2.0f});
    REQUIRE(state.Codes[0] == state.codebook().zero_code());
    REQUIRE(state.Codes[2] == 0);
    REQUIRE(state.Codes[4] == 255);

    std::string expected = header(5, 4, 0);
    expected += bytes_of(state.Codes);
    expected += bytes_of({0x00, 0x00, 0x80, 0x3F});    // 1.0f
    expected += bytes_of({0x00, 0x00, 0x00, 0x40});    // 2.0f

    const std::string data = serialize(state);
    REQUIRE(data == expected);

    const QuantizedState loaded = deserialize(data);
    REQUIRE(loaded.Kind == state.Kind);
    REQUIRE(loaded.BlockSize == state.BlockSize);
    REQUIRE(loaded.NumElements == state.NumElements);
    REQUIRE(loaded.Codes == state.Codes);
    REQUIRE(loaded.AbsMax == state.AbsMax);
}

TEST_CASE("4-bit states survive serialization", "[quantized-state][io]") {
    const std::vector<float> values = {0.1f, -0.7f, 0.3f, 0.9f, -0.2f, 0.05f, 1.5f};
    const QuantizedState state = QuantizedState::from_values(values, 2, ECodebookKind::FP4, ExecContext{});
    const std::string data = serialize(state);
    REQUIRE(data.size() == 9 + 4 + 4 * 4);
    REQUIRE(static_cast<std::uint8_t>(data[8]) == static_cast<std::uint8_t>(ECodebookKind::FP4));

    const QuantizedState loaded = deserialize(data);
    REQUIRE(loaded.Codes == state.Codes);
    REQUIRE(loaded.AbsMax == state.AbsMax);
    REQUIRE(loaded.dequantize(ExecContext{}) == state.dequantize(ExecContext{}));
}

TEST_CASE("Loading malformed states", "[quantized-state][io]") {
    SECTION("unknown codebook kind") {
        REQUIRE_THROWS_AS(deserialize(header(2, 4, 9) + std::string(2 + 4, '\0')), ConfigurationError);
    }
    SECTION("block size that is not a power of two") {
        REQUIRE_THROWS_AS(deserialize(header(2, 3, 0) + std::string(2 + 4, '\0')), ConfigurationError);
    }
    SECTION("negative element count") {
        REQUIRE_THROWS_AS(deserialize(header(0xFFFFFFFFu, 4, 0)), ShapeMismatchError);
    }
    SECTION("truncated header") {
        REQUIRE_THROWS_AS(deserialize(header(2, 4, 0).substr(0, 6)), std::runtime_error);
    }
    SECTION("truncated absmax") {
        const QuantizedState state = QuantizedState::zeros(10, 4, ECodebookKind::LINEAR);
        std::string data = serialize(state);
        data.pop_back();
        REQUIRE_THROWS_AS(deserialize(data), std::runtime_error);
    }
    SECTION("header claims more codes than the stream holds") {
        REQUIRE_THROWS_AS(deserialize(header(0x7FFFFFFFu, 256, 0) + std::string(16, '\0')), std::runtime_error);
    }
    SECTION("non-finite or negative absmax") {
        const QuantizedState state = QuantizedState::zeros(8, 4, ECodebookKind::DYNAMIC);
        const std::string data = serialize(state);
        const std::vector<std::string> bad_bits = {
            std::string("\x00\x00\xC0\x7F", 4),   // NaN
            std::string("\x00\x00\x80\x7F", 4),   // +Inf
            std::string("\x00\x00\x80\xBF", 4)    // -1.0
        };
        for (const std::string& bits : bad_bits) {
            std::string corrupt = data;
            corrupt.replace(corrupt.size() - 4, 4, bits);
            REQUIRE_THROWS_AS(deserialize(corrupt), NumericOverflowError);
        }
    }
    SECTION("empty state round trips") {
        const QuantizedState state = QuantizedState::zeros(0, 256, ECodebookKind::DYNAMIC);
        const QuantizedState loaded = deserialize(serialize(state));
        REQUIRE(loaded.NumElements == 0);
        REQUIRE(loaded.Codes.empty());
        REQUIRE(loaded.AbsMax.empty());
    }
}
