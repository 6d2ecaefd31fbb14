// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Codebooks for blockwise quantization.
// Based on bitsandbytes implementation: https://github.com/TimDettmers/bitsandbytes

#ifndef LOWBIT_SRC_KERNELS_CODEBOOK_H
#define LOWBIT_SRC_KERNELS_CODEBOOK_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lowbit {

/**
 * @brief Supported codebooks. The numeric value is the on-disk kind byte.
 */
enum class ECodebookKind : std::int8_t {
    DYNAMIC = 0,            // signed dynamic tree map, 256 entries in [-1, 1]
    DYNAMIC_UNSIGNED = 1,   // unsigned dynamic tree map, 256 entries in [0, 1]
    LINEAR = 2,             // 256 evenly spaced entries in [-1, 1]
    NF4 = 3,                // 4-bit normal float
    FP4 = 4                 // 4-bit float (E2M1), sorted
};

constexpr int NUM_CODEBOOK_KINDS = 5;

/**
 * @brief Convert a raw kind value (e.g. read from a checkpoint) to ECodebookKind.
 * @throws ConfigurationError if @p value does not name a kind.
 */
ECodebookKind codebook_kind_from_int(int value);

/**
 * @brief Convert string to ECodebookKind ("dynamic", "dynamic_unsigned", "linear", "nf4", "fp4").
 * @throws ConfigurationError for unknown names.
 */
ECodebookKind codebook_kind_from_str(std::string_view str);

std::string_view codebook_kind_to_str(ECodebookKind kind);

//! Number of bits per code: 8 for the 256-entry maps, 4 for NF4/FP4.
int codebook_bits(ECodebookKind kind);

/**
 * @brief Immutable, sorted table of normalized code values.
 *
 * Values are non-decreasing, so nearest-code lookup is a binary search.
 */
class Codebook {
public:
    Codebook(ECodebookKind kind, std::vector<float> values);

    [[nodiscard]] ECodebookKind kind() const { return mKind; }
    [[nodiscard]] int bits() const { return codebook_bits(mKind); }
    [[nodiscard]] int size() const { return static_cast<int>(mValues.size()); }
    [[nodiscard]] const float* data() const { return mValues.data(); }
    [[nodiscard]] std::span<const float> values() const { return mValues; }
    [[nodiscard]] float operator[](int code) const { return mValues[code]; }

    //! Lowest index whose value is exactly zero.
    [[nodiscard]] int zero_code() const { return mZeroCode; }

    //! Index of the entry closest to @p value; ties go to the lower index.
    [[nodiscard]] int nearest(float value) const;

    //! Distance between the two entries straddling @p value (the end gap outside the table range).
    [[nodiscard]] float gap_at(float value) const;

private:
    ECodebookKind mKind;
    std::vector<float> mValues;
    int mZeroCode = 0;
};

/**
 * @brief Index of the entry of the sorted table @p code closest to @p value.
 *
 * Binary search for the first entry >= value, then compares the two straddling
 * entries; ties go to the lower index. Values beyond either end clamp to the end
 * index, so the result is always in `[0, size)`.
 */
inline int nearest_code(float value, const float* code, int size) {
    int lo = 0;
    int hi = size;
    while (lo < hi) {
        const int mid = (lo + hi) / 2;
        if (code[mid] < value) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    if (lo == 0) return 0;
    if (lo == size) return size - 1;
    const float below = value - code[lo - 1];
    const float above = code[lo] - value;
    return above < below ? lo : lo - 1;
}

inline int nearest_code(float value, const Codebook& codebook) {
    return nearest_code(value, codebook.data(), codebook.size());
}

/**
 * @brief Creates a dynamic quantization map.
 *
 * Codepoints are allocated per decade: the i-th decade `[10^(i-7), 10^(i-6)]` gets
 * twice as many codepoints as the one below it, so small magnitudes have fine
 * resolution. Zero and 1.0 are always present. The result is sorted.
 *
 * @param[out] code Output array of 256 float values.
 * @param signed_map If true, creates a signed map for [-1, 1]; otherwise [0, 1].
 */
void create_dynamic_quantization_map(float* code, bool signed_map);

/**
 * @brief Creates a linear map: 255 evenly spaced values in [-1, 1] with zero duplicated.
 * @param[out] code Output array of 256 float values.
 */
void create_linear_quantization_map(float* code);

/**
 * @brief Builds the table for @p kind. Pure and deterministic.
 * @throws ConfigurationError for an unknown kind.
 */
Codebook build_codebook(ECodebookKind kind);

/**
 * @brief Process-wide codebook for @p kind, built on first use and immutable afterwards.
 *
 * Safe to call concurrently; the first call per kind builds the table.
 * @throws ConfigurationError for an unknown kind.
 */
const Codebook& get_codebook(ECodebookKind kind);

} // namespace lowbit

#endif // LOWBIT_SRC_KERNELS_CODEBOOK_H
