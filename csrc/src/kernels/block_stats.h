// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_KERNELS_BLOCK_STATS_H
#define LOWBIT_SRC_KERNELS_BLOCK_STATS_H

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "utilities/dtype.h"

namespace lowbit {

/**
 * @brief Maximum absolute value of a block, computed in float.
 *
 * Elements are widened to float before the scan. Returns 0 for an empty block and NaN
 * as soon as a NaN element is seen, so callers can report corrupted input instead of
 * silently quantizing it. Denormals take part like any other value.
 */
template<typename T>
inline float compute_block_absmax(const T* block, std::size_t count) {
    float absmax = 0.0f;
    for (std::size_t i = 0; i < count; ++i) {
        const float a = std::fabs(to_float(block[i]));
        if (std::isnan(a)) {
            return a;
        }
        absmax = std::max(absmax, a);
    }
    return absmax;
}

} // namespace lowbit

#endif // LOWBIT_SRC_KERNELS_BLOCK_STATS_H
