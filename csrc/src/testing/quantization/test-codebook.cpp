// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Unit tests for the quantization codebooks

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <vector>

#include "kernels/codebook.h"
#include "utilities/utils.h"

using Catch::Approx;
using namespace lowbit;

namespace {

// Sixteen entries k/8 for k in [-8, 7]; exact binary fractions so midpoints are exact too.
Codebook make_eighths() {
    std::vector<float> values;
    for (int k = -8; k < 8; ++k) {
        values.push_back(static_cast<float>(k) / 8.0f);
    }
    return Codebook(ECodebookKind::NF4, values);
}

} // anonymous namespace

TEST_CASE("Signed dynamic map layout", "[quantization][codebook]") {
    const Codebook& code = get_codebook(ECodebookKind::DYNAMIC);
    REQUIRE(code.size() == 256);
    REQUIRE(code.bits() == 8);
    REQUIRE(std::is_sorted(code.values().begin(), code.values().end()));
    REQUIRE(code.zero_code() == 127);
    REQUIRE(code[127] == 0.0f);
    REQUIRE(code[255] == 1.0f);
    REQUIRE(code[0] == Approx(-0.99296875f).margin(1e-6));
    REQUIRE(code[254] == Approx(0.99296875f).margin(1e-6));

    // 127 negative values mirror the positive ones below 1.0
    for (int i = 0; i < 127; ++i) {
        INFO("i = " << i);
        REQUIRE(code[i] == -code[254 - i]);
    }
}

TEST_CASE("Unsigned dynamic map layout", "[quantization][codebook]") {
    const Codebook& code = get_codebook(ECodebookKind::DYNAMIC_UNSIGNED);
    REQUIRE(code.size() == 256);
    REQUIRE(code.zero_code() == 0);
    REQUIRE(code[0] == 0.0f);
    REQUIRE(code[255] == 1.0f);
    for (float v : code.values()) {
        REQUIRE(v >= 0.0f);
        REQUIRE(v <= 1.0f);
    }
    REQUIRE(std::adjacent_find(code.values().begin(), code.values().end()) == code.values().end());
}

TEST_CASE("Linear map layout", "[quantization][codebook]") {
    const Codebook& code = get_codebook(ECodebookKind::LINEAR);
    REQUIRE(code.size() == 256);
    REQUIRE(code[0] == -1.0f);
    REQUIRE(code[255] == 1.0f);
    REQUIRE(code.zero_code() == 127);
    REQUIRE(code[128] == 0.0f);
    REQUIRE(code[129] == Approx(2.0f / 254.0f));
}

TEST_CASE("Fixed 4-bit tables", "[quantization][codebook]") {
    for (ECodebookKind kind : {ECodebookKind::NF4, ECodebookKind::FP4}) {
        const Codebook& code = get_codebook(kind);
        INFO("kind = " << codebook_kind_to_str(kind));
        REQUIRE(code.size() == 16);
        REQUIRE(code.bits() == 4);
        REQUIRE(code.zero_code() == 7);
        REQUIRE(code[0] == -1.0f);
        REQUIRE(code[15] == 1.0f);
        REQUIRE(std::is_sorted(code.values().begin(), code.values().end()));
    }
    REQUIRE(get_codebook(ECodebookKind::NF4)[8] == Approx(0.07958029955625534f));
    REQUIRE(get_codebook(ECodebookKind::FP4)[13] == 0.5f);
}

TEST_CASE("Codebook construction is idempotent", "[quantization][codebook]") {
    for (int raw = 0; raw < NUM_CODEBOOK_KINDS; ++raw) {
        const ECodebookKind kind = codebook_kind_from_int(raw);
        const Codebook first = build_codebook(kind);
        const Codebook second = build_codebook(kind);
        const Codebook& shared = get_codebook(kind);
        INFO("kind = " << codebook_kind_to_str(kind));
        REQUIRE(std::equal(first.values().begin(), first.values().end(), second.values().begin(), second.values().end()));
        REQUIRE(std::equal(first.values().begin(), first.values().end(), shared.values().begin(), shared.values().end()));
        REQUIRE(&shared == &get_codebook(kind));
    }
}

TEST_CASE("Codebook kind conversions", "[quantization][codebook]") {
    REQUIRE(codebook_kind_from_str("dynamic") == ECodebookKind::DYNAMIC);
    REQUIRE(codebook_kind_from_str("NF4") == ECodebookKind::NF4);
    REQUIRE(codebook_kind_to_str(codebook_kind_from_str("dynamic_unsigned")) == "dynamic_unsigned");
    REQUIRE(codebook_kind_from_int(4) == ECodebookKind::FP4);

    REQUIRE_THROWS_AS(codebook_kind_from_str("int3"), ConfigurationError);
    REQUIRE_THROWS_AS(codebook_kind_from_int(5), ConfigurationError);
    REQUIRE_THROWS_AS(codebook_kind_from_int(-1), ConfigurationError);
}

TEST_CASE("Codebook rejects malformed tables", "[quantization][codebook]") {
    const Codebook base = make_eighths();
    std::vector<float> values(base.values().begin(), base.values().end());
    SECTION("wrong size") {
        values.pop_back();
        REQUIRE_THROWS_AS(Codebook(ECodebookKind::NF4, values), ConfigurationError);
    }
    SECTION("unsorted") {
        std::swap(values[2], values[3]);
        REQUIRE_THROWS_AS(Codebook(ECodebookKind::NF4, values), ConfigurationError);
    }
    SECTION("no zero") {
        values[8] = 0.01f;
        REQUIRE_THROWS_AS(Codebook(ECodebookKind::NF4, values), ConfigurationError);
    }
}

TEST_CASE("Nearest code lookup", "[quantization][codebook]") {
    const Codebook code = make_eighths();

    SECTION("exact entries map to themselves") {
        for (int i = 0; i < code.size(); ++i) {
            REQUIRE(code.nearest(code[i]) == i);
        }
    }
    SECTION("ties go to the lower index") {
        REQUIRE(code.nearest(0.0625f) == 8);
        REQUIRE(code.nearest(-0.0625f) == 7);
    }
    SECTION("closest neighbour wins") {
        REQUIRE(code.nearest(0.07f) == 9);
        REQUIRE(code.nearest(0.05f) == 8);
    }
    SECTION("out of range values clamp") {
        REQUIRE(code.nearest(2.0f) == 15);
        REQUIRE(code.nearest(-3.0f) == 0);
        REQUIRE(nearest_code(0.9f, code) == 15);
    }
}

TEST_CASE("Codebook gap", "[quantization][codebook]") {
    const Codebook code = make_eighths();
    REQUIRE(code.gap_at(0.0625f) == 0.125f);
    REQUIRE(code.gap_at(5.0f) == 0.125f);
    REQUIRE(code.gap_at(-5.0f) == 0.125f);

    const Codebook& dynamic = get_codebook(ECodebookKind::DYNAMIC);
    REQUIRE(dynamic.gap_at(1.0f) == dynamic[255] - dynamic[254]);
    REQUIRE(dynamic.gap_at(-1.0f) == dynamic[1] - dynamic[0]);
}
