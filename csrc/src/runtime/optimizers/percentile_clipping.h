// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_PERCENTILE_CLIPPING_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_PERCENTILE_CLIPPING_H

#include <array>

#include "utilities/tensor.h"

namespace lowbit {

/**
 * @brief Outcome of one percentile clipping update.
 */
struct ClipResult {
    float gnorm = 0.0f;         // L2 norm of the current gradient
    float clip_value = 0.0f;    // percentile of the recorded norm history
    float gnorm_scale = 1.0f;   // multiplier to apply to the gradient (<= 1)
};

/**
 * @brief Adaptive gradient clipping based on the history of gradient norms.
 *
 * The squared gradient norms of the last HISTORY_SIZE steps are kept in a ring buffer indexed by
 * `step % HISTORY_SIZE`. The clip value is the requested percentile (nearest rank) of the recorded
 * norms; a gradient whose norm exceeds it is scaled down to it. Percentile 100 never clips.
 */
class PercentileClipping {
public:
    static constexpr int HISTORY_SIZE = 100;

    /// @throws ConfigurationError unless @p percentile is in [1, 100].
    explicit PercentileClipping(int percentile = 5);

    //! Records the norm of @p grad (FP32, BF16 or FP16) for @p step.
    ClipResult update(const Tensor& grad, int step);

    //! Records an already accumulated squared norm, e.g. summed over several tensors.
    ClipResult update_squared_norm(double squared_norm, int step);

    [[nodiscard]] int percentile() const { return mPercentile; }
    [[nodiscard]] int num_recorded() const { return mRecorded; }

private:
    int mPercentile;
    int mRecorded = 0;
    std::array<double, HISTORY_SIZE> mHistory{};
    std::array<bool, HISTORY_SIZE> mFilled{};
};

//! Squared L2 norm of @p grad, accumulated in double in element order.
double squared_norm(const Tensor& grad);

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_PERCENTILE_CLIPPING_H
