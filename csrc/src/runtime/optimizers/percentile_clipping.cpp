// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "percentile_clipping.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include <fmt/format.h>

namespace lowbit {

namespace {

template<typename T>
double accumulate_squares(const T* data, std::size_t n) {
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double v = to_float(data[i]);
        sum += v * v;
    }
    return sum;
}

} // namespace

double squared_norm(const Tensor& grad) {
    switch (grad.DType) {
        case ETensorDType::FP32: return accumulate_squares(grad.get<float>(), grad.nelem());
        case ETensorDType::BF16: return accumulate_squares(grad.get<bfloat16>(), grad.nelem());
        case ETensorDType::FP16: return accumulate_squares(grad.get<float16>(), grad.nelem());
        default:
            throw ShapeMismatchError(fmt::format("squared_norm: unsupported dtype {}", dtype_to_str(grad.DType)));
    }
}

PercentileClipping::PercentileClipping(int percentile) : mPercentile(percentile) {
    if (percentile < 1 || percentile > 100) {
        throw ConfigurationError(fmt::format("Clipping percentile must be in [1, 100], got {}", percentile));
    }
}

ClipResult PercentileClipping::update(const Tensor& grad, int step) {
    return update_squared_norm(squared_norm(grad), step);
}

ClipResult PercentileClipping::update_squared_norm(double squared_norm, int step) {
    if (!std::isfinite(squared_norm)) {
        throw NumericOverflowError(fmt::format("Gradient norm is not finite at step {}", step));
    }
    if (step < 0) {
        throw ConfigurationError(fmt::format("Invalid step for percentile clipping: {}", step));
    }

    const int slot = step % HISTORY_SIZE;
    mHistory[slot] = squared_norm;
    if (!mFilled[slot]) {
        mFilled[slot] = true;
        ++mRecorded;
    }

    // only slots written so far take part, so early steps are not dragged down by empty entries
    std::vector<double> sorted;
    sorted.reserve(mRecorded);
    for (int i = 0; i < HISTORY_SIZE; ++i) {
        if (mFilled[i]) sorted.push_back(mHistory[i]);
    }
    std::sort(sorted.begin(), sorted.end());

    const int count = static_cast<int>(sorted.size());
    const int rank = std::clamp((mPercentile * count + 99) / 100 - 1, 0, count - 1);

    ClipResult result;
    result.gnorm = static_cast<float>(std::sqrt(squared_norm));
    result.clip_value = static_cast<float>(std::sqrt(sorted[rank]));
    if (result.gnorm > result.clip_value) {
        result.gnorm_scale = result.clip_value / result.gnorm;
    }
    return result;
}

} // namespace lowbit
