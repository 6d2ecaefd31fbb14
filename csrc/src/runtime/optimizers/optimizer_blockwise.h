// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Fused blockwise quantized optimizer update (dequantize -> update -> requantize per block).
// Based on bitsandbytes implementation: https://github.com/TimDettmers/bitsandbytes

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BLOCKWISE_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BLOCKWISE_H

#include <cstddef>

#include "optimizer_base.h"
#include "quantized_state.h"
#include "utilities/parallel.h"
#include "utilities/tensor.h"

namespace lowbit {

/**
 * @brief Scalar inputs of one optimizer step.
 */
struct OptimizerHyperParams {
    float learning_rate = 1e-3f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;
    float weight_decay = 0.0f;
    int step = 1;                   // 1-based step counter, used for bias correction
    float gnorm_scale = 1.0f;       // gradient multiplier, e.g. from percentile clipping
};

/**
 * @brief Throws ConfigurationError unless every hyperparameter is finite and in its domain:
 * `lr >= 0`, `beta1, beta2 in [0, 1)`, `eps > 0`, `weight_decay >= 0`, `step >= 1`, `gnorm_scale > 0`.
 */
void validate_hyper_params(const OptimizerHyperParams& hp);

/**
 * @brief One block of the fused update, widened to float.
 *
 * Param, State1 and State2 are updated in place. State2 is only used by AdamW.
 */
struct BlockSlice {
    float* Param = nullptr;
    const float* Grad = nullptr;
    float* State1 = nullptr;
    float* State2 = nullptr;
    int Count = 0;
};

/**
 * @brief Applies the update rule of @p type to one block.
 *
 * Pure function of its inputs: the gradient is multiplied by `hp.gnorm_scale` first,
 * then the rule updates the dequantized state and the parameter in float.
 */
void update_block(OptimizerType type, const BlockSlice& slice, const OptimizerHyperParams& hp);

/**
 * @brief Fused blockwise update for one parameter tensor.
 *
 * For every block: dequantize the state, apply update_block, write the parameter, then
 * requantize the state with a freshly computed absmax. Everything is validated before
 * any buffer is written.
 *
 * @param state2 Second moment, required for AdamW and ignored otherwise (may be null).
 * @throws ConfigurationError, ShapeMismatchError, NumericOverflowError
 */
template<typename TParam, typename TGrad>
void optimizer_update_blockwise(OptimizerType type, TParam* param, const TGrad* grad, std::size_t n,
                                QuantizedState& state1, QuantizedState* state2,
                                const OptimizerHyperParams& hp, const ExecContext& ctx);

/**
 * @brief Tensor-based fused update.
 *
 * Supported param/grad dtypes: FP32/FP32, BF16/BF16, FP16/FP16, FP32/BF16, FP32/FP16.
 */
void optimizer_update_blockwise(OptimizerType type, Tensor& param, const Tensor& grad,
                                QuantizedState& state1, QuantizedState* state2,
                                const OptimizerHyperParams& hp, const ExecContext& ctx);

/**
 * @brief Validation part of optimizer_update_blockwise: hyperparameters, shapes, dtypes and
 * finiteness of the (scaled) gradient and the parameter.
 *
 * Lets callers check several tensors before updating any of them.
 * @throws ConfigurationError, ShapeMismatchError, NumericOverflowError
 */
void validate_optimizer_update(OptimizerType type, const Tensor& param, const Tensor& grad,
                               const QuantizedState& state1, const QuantizedState* state2,
                               const OptimizerHyperParams& hp, const ExecContext& ctx);

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BLOCKWISE_H
