// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "codebook.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "utilities/utils.h"

namespace lowbit {

namespace {

// NF4 codebook values (quantiles of a standard normal, normalized to [-1, 1])
constexpr float NF4_CODEBOOK[16] = {
    -1.0f, -0.6961928009986877f, -0.5250730514526367f, -0.39491748809814453f,
    -0.28444138169288635f, -0.18477343022823334f, -0.09105003625154495f, 0.0f,
    0.07958029955625534f, 0.16093020141124725f, 0.24611230194568634f, 0.33791524171829224f,
    0.44070982933044434f, 0.5626170039176941f, 0.7229568362236023f, 1.0f
};

// FP4 (E2M1 with a subnormal step) values {0, 0.0625, 2, 3, 4, 6, 8, 12} / 12, both signs,
// in ascending order. The two zeros stand for +0 and -0.
constexpr float FP4_CODEBOOK[16] = {
    -1.0f, -0.6666666865348816f, -0.5f, -0.3333333432674408f,
    -0.25f, -0.1666666716337204f, -0.005208333488553762f, 0.0f,
    0.0f, 0.005208333488553762f, 0.1666666716337204f, 0.25f,
    0.3333333432674408f, 0.5f, 0.6666666865348816f, 1.0f
};

std::vector<float> linspace(float start, float end, int count) {
    std::vector<float> values(count);
    if (count == 1) {
        values[0] = start;
        return values;
    }
    const float span = end - start;
    for (int i = 0; i < count; ++i) {
        values[i] = start + span * static_cast<float>(i) / static_cast<float>(count - 1);
    }
    return values;
}

} // namespace

ECodebookKind codebook_kind_from_int(int value) {
    if (value < 0 || value >= NUM_CODEBOOK_KINDS) {
        throw ConfigurationError(fmt::format("Unknown codebook kind: {}", value));
    }
    return static_cast<ECodebookKind>(value);
}

ECodebookKind codebook_kind_from_str(std::string_view str) {
    if (iequals(str, "dynamic")) {
        return ECodebookKind::DYNAMIC;
    } else if (iequals(str, "dynamic_unsigned")) {
        return ECodebookKind::DYNAMIC_UNSIGNED;
    } else if (iequals(str, "linear")) {
        return ECodebookKind::LINEAR;
    } else if (iequals(str, "nf4")) {
        return ECodebookKind::NF4;
    } else if (iequals(str, "fp4")) {
        return ECodebookKind::FP4;
    }
    throw ConfigurationError("Unknown codebook kind: " + std::string(str));
}

std::string_view codebook_kind_to_str(ECodebookKind kind) {
    switch (kind) {
        case ECodebookKind::DYNAMIC: return "dynamic";
        case ECodebookKind::DYNAMIC_UNSIGNED: return "dynamic_unsigned";
        case ECodebookKind::LINEAR: return "linear";
        case ECodebookKind::NF4: return "nf4";
        case ECodebookKind::FP4: return "fp4";
    }
    return "unknown";
}

int codebook_bits(ECodebookKind kind) {
    switch (kind) {
        case ECodebookKind::DYNAMIC:
        case ECodebookKind::DYNAMIC_UNSIGNED:
        case ECodebookKind::LINEAR:
            return 8;
        case ECodebookKind::NF4:
        case ECodebookKind::FP4:
            return 4;
    }
    throw ConfigurationError(fmt::format("Unknown codebook kind: {}", static_cast<int>(kind)));
}

// ----------------------------------------------------------------------------

Codebook::Codebook(ECodebookKind kind, std::vector<float> values) : mKind(kind), mValues(std::move(values)) {
    if (mValues.size() != (1u << codebook_bits(kind))) {
        throw ConfigurationError(fmt::format("Codebook '{}' needs {} entries, got {}",
                                             codebook_kind_to_str(kind), 1u << codebook_bits(kind), mValues.size()));
    }
    if (!std::is_sorted(mValues.begin(), mValues.end())) {
        throw ConfigurationError(fmt::format("Codebook '{}' is not sorted", codebook_kind_to_str(kind)));
    }
    auto zero = std::find(mValues.begin(), mValues.end(), 0.0f);
    if (zero == mValues.end()) {
        throw ConfigurationError(fmt::format("Codebook '{}' has no zero entry", codebook_kind_to_str(kind)));
    }
    mZeroCode = static_cast<int>(zero - mValues.begin());
}

int Codebook::nearest(float value) const {
    return nearest_code(value, mValues.data(), size());
}

float Codebook::gap_at(float value) const {
    const int n = size();
    auto it = std::lower_bound(mValues.begin(), mValues.end(), value);
    int hi = static_cast<int>(it - mValues.begin());
    hi = std::clamp(hi, 1, n - 1);
    return mValues[hi] - mValues[hi - 1];
}

// ----------------------------------------------------------------------------

void create_dynamic_quantization_map(float* code, bool signed_map) {
    constexpr int max_exponent_bits = 7;
    constexpr int total_bits = 8;
    constexpr int non_sign_bits = total_bits - 1;
    constexpr int total_values = 1 << total_bits;

    std::vector<float> data;
    data.reserve(total_values);

    for (int i = 0; i < max_exponent_bits; ++i) {
        const int fraction_items = signed_map
            ? (1 << (i + non_sign_bits - max_exponent_bits)) + 1
            : (1 << (i + non_sign_bits - max_exponent_bits + 1)) + 1;
        const std::vector<float> boundaries = linspace(0.1f, 1.0f, fraction_items);
        const double scale = std::pow(10.0, -(max_exponent_bits - 1) + i);
        for (int j = 0; j + 1 < fraction_items; ++j) {
            const float mean = (boundaries[j] + boundaries[j + 1]) / 2.0f;
            data.push_back(static_cast<float>(scale * mean));
            if (signed_map) {
                data.push_back(static_cast<float>(-scale * mean));
            }
        }
    }

    data.push_back(0.0f);
    data.push_back(1.0f);
    while (data.size() < static_cast<std::size_t>(total_values)) {
        data.push_back(0.0f);
    }

    std::sort(data.begin(), data.end());
    std::copy(data.begin(), data.end(), code);
}

void create_linear_quantization_map(float* code) {
    // 255 values so that zero is representable; the missing slot is filled with a second zero
    constexpr int total_values = 255;
    int out = 0;
    for (int j = 0; j < total_values; ++j) {
        const float v = static_cast<float>(2 * j - (total_values - 1)) / static_cast<float>(total_values - 1);
        code[out++] = v;
        if (j == total_values / 2) {
            code[out++] = 0.0f;
        }
    }
}

Codebook build_codebook(ECodebookKind kind) {
    switch (kind) {
        case ECodebookKind::DYNAMIC: {
            std::vector<float> values(256);
            create_dynamic_quantization_map(values.data(), true);
            return Codebook(kind, std::move(values));
        }
        case ECodebookKind::DYNAMIC_UNSIGNED: {
            std::vector<float> values(256);
            create_dynamic_quantization_map(values.data(), false);
            return Codebook(kind, std::move(values));
        }
        case ECodebookKind::LINEAR: {
            std::vector<float> values(256);
            create_linear_quantization_map(values.data());
            return Codebook(kind, std::move(values));
        }
        case ECodebookKind::NF4:
            return Codebook(kind, std::vector<float>(std::begin(NF4_CODEBOOK), std::end(NF4_CODEBOOK)));
        case ECodebookKind::FP4:
            return Codebook(kind, std::vector<float>(std::begin(FP4_CODEBOOK), std::end(FP4_CODEBOOK)));
    }
    throw ConfigurationError(fmt::format("Unknown codebook kind: {}", static_cast<int>(kind)));
}

const Codebook& get_codebook(ECodebookKind kind) {
    // function-local statics: built once on first use, thread-safe, immutable afterwards
    switch (kind) {
        case ECodebookKind::DYNAMIC: {
            static const Codebook codebook = build_codebook(ECodebookKind::DYNAMIC);
            return codebook;
        }
        case ECodebookKind::DYNAMIC_UNSIGNED: {
            static const Codebook codebook = build_codebook(ECodebookKind::DYNAMIC_UNSIGNED);
            return codebook;
        }
        case ECodebookKind::LINEAR: {
            static const Codebook codebook = build_codebook(ECodebookKind::LINEAR);
            return codebook;
        }
        case ECodebookKind::NF4: {
            static const Codebook codebook = build_codebook(ECodebookKind::NF4);
            return codebook;
        }
        case ECodebookKind::FP4: {
            static const Codebook codebook = build_codebook(ECodebookKind::FP4);
            return codebook;
        }
    }
    throw ConfigurationError(fmt::format("Unknown codebook kind: {}", static_cast<int>(kind)));
}

} // namespace lowbit
