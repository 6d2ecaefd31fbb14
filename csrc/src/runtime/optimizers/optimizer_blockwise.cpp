// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizer_blockwise.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <fmt/format.h>

#include "kernels/block_stats.h"
#include "kernels/blockwise_quant.h"

namespace lowbit {

namespace {

//! Rules whose state accumulates the squared gradient.
bool squares_gradient(OptimizerType type) {
    return type == OptimizerType::ADAMW || type == OptimizerType::RMSPROP || type == OptimizerType::ADAGRAD;
}

//! Rules that fold weight decay into the gradient (L2) rather than decaying the parameter.
bool couples_weight_decay(OptimizerType type) {
    return type == OptimizerType::MOMENTUM || type == OptimizerType::RMSPROP || type == OptimizerType::ADAGRAD;
}

//! First state holds signed values (momentum-like).
bool signed_state1(OptimizerType type) {
    return type == OptimizerType::ADAMW || type == OptimizerType::MOMENTUM || type == OptimizerType::LION;
}

float effective_gradient(OptimizerType type, float p, float g, const OptimizerHyperParams& hp) {
    g *= hp.gnorm_scale;
    if (couples_weight_decay(type) && hp.weight_decay > 0.0f) {
        g += hp.weight_decay * p;
    }
    return g;
}

bool element_is_finite(OptimizerType type, float p, float g, const OptimizerHyperParams& hp) {
    if (!std::isfinite(p) || !std::isfinite(g)) return false;
    const float ge = effective_gradient(type, p, g, hp);
    if (!std::isfinite(ge)) return false;
    return !squares_gradient(type) || std::isfinite(ge * ge);
}

void check_state(const char* name, std::size_t n, const QuantizedState& state) {
    state.validate();
    if (state.NumElements != n) {
        throw ShapeMismatchError(fmt::format("optimizer update: {} holds {} elements, parameter has {}",
                                             name, state.NumElements, n));
    }
    state.check_absmax(fmt::format("optimizer update: {}", name));
}

float beta_power(float beta, int step) {
    return static_cast<float>(std::pow(static_cast<double>(beta), step));
}

/**
 * @brief Requantizes one block of updated state with its freshly computed absmax.
 *
 * Values that overflowed to infinity during the update saturate at the largest finite float.
 */
void requantize_block(std::uint8_t* codes, float& absmax, float* values, int count,
                      const Codebook& codebook, std::uint8_t* scratch) {
    constexpr float max_value = std::numeric_limits<float>::max();
    for (int i = 0; i < count; ++i) {
        if (std::isinf(values[i])) values[i] = std::copysign(max_value, values[i]);
    }
    absmax = compute_block_absmax(values, static_cast<std::size_t>(count));
    detail::encode_block(codes, values, count, absmax, codebook, scratch);
}

template<typename TParam, typename TGrad>
void validate_update(OptimizerType type, const TParam* param, const TGrad* grad, std::size_t n,
                     const QuantizedState& state1, const QuantizedState* state2,
                     const OptimizerHyperParams& hp, const ExecContext& ctx) {
    validate_hyper_params(hp);

    check_state("state1", n, state1);
    if (signed_state1(type) && state1.Kind == ECodebookKind::DYNAMIC_UNSIGNED) {
        throw ConfigurationError(fmt::format("{} needs a signed codebook for its first state, got {}",
                                             optimizer_type_to_str(type), codebook_kind_to_str(state1.Kind)));
    }
    if (num_states(type) == 2) {
        if (state2 == nullptr) {
            throw ConfigurationError(fmt::format("{} requires a second state", optimizer_type_to_str(type)));
        }
        check_state("state2", n, *state2);
        if (state2->BlockSize != state1.BlockSize) {
            throw ShapeMismatchError(fmt::format("optimizer update: state block sizes differ ({} vs {})",
                                                 state1.BlockSize, state2->BlockSize));
        }
    }

    const int block_size = state1.BlockSize;
    const long blocks = static_cast<long>(num_blocks(n, block_size));
    std::vector<long> first_bad(blocks, -1);
    parallel_for_blocks(blocks, ctx, [&](long begin, long end) {
        for (long b = begin; b < end; ++b) {
            const std::size_t first = static_cast<std::size_t>(b) * block_size;
            const std::size_t last = std::min(n, first + block_size);
            for (std::size_t i = first; i < last; ++i) {
                if (!element_is_finite(type, to_float(param[i]), to_float(grad[i]), hp)) {
                    first_bad[b] = static_cast<long>(i);
                    break;
                }
            }
        }
    });

    for (long b = 0; b < blocks; ++b) {
        if (first_bad[b] >= 0) {
            const long i = first_bad[b];
            throw NumericOverflowError(fmt::format("{} update: non-finite value at element {} (param {}, grad {})",
                                                   optimizer_type_to_str(type), i,
                                                   to_float(param[i]), to_float(grad[i])));
        }
    }
}

template<typename Fn>
void dispatch_param_grad(const char* what, const Tensor& param, const Tensor& grad, Fn&& fn) {
    if (param.nelem() != grad.nelem()) {
        throw ShapeMismatchError(fmt::format("{}: parameter has {} elements, gradient has {}",
                                             what, param.nelem(), grad.nelem()));
    }
    const ETensorDType p = param.DType;
    const ETensorDType g = grad.DType;
    if (p == ETensorDType::FP32 && g == ETensorDType::FP32) {
        fn(const_cast<float*>(param.get<float>()), grad.get<float>());
    } else if (p == ETensorDType::BF16 && g == ETensorDType::BF16) {
        fn(const_cast<bfloat16*>(param.get<bfloat16>()), grad.get<bfloat16>());
    } else if (p == ETensorDType::FP16 && g == ETensorDType::FP16) {
        fn(const_cast<float16*>(param.get<float16>()), grad.get<float16>());
    } else if (p == ETensorDType::FP32 && g == ETensorDType::BF16) {
        fn(const_cast<float*>(param.get<float>()), grad.get<bfloat16>());
    } else if (p == ETensorDType::FP32 && g == ETensorDType::FP16) {
        fn(const_cast<float*>(param.get<float>()), grad.get<float16>());
    } else {
        throw ShapeMismatchError(fmt::format("{}: unsupported parameter/gradient dtypes {}/{}",
                                             what, dtype_to_str(p), dtype_to_str(g)));
    }
}

} // namespace

void validate_hyper_params(const OptimizerHyperParams& hp) {
    auto require = [](bool ok, const char* name, float value, const char* domain) {
        if (!ok) {
            throw ConfigurationError(fmt::format("Invalid {}: {} (must be {})", name, value, domain));
        }
    };
    require(std::isfinite(hp.learning_rate) && hp.learning_rate >= 0.0f, "learning rate", hp.learning_rate, ">= 0");
    require(std::isfinite(hp.beta1) && hp.beta1 >= 0.0f && hp.beta1 < 1.0f, "beta1", hp.beta1, "in [0, 1)");
    require(std::isfinite(hp.beta2) && hp.beta2 >= 0.0f && hp.beta2 < 1.0f, "beta2", hp.beta2, "in [0, 1)");
    require(std::isfinite(hp.epsilon) && hp.epsilon > 0.0f, "epsilon", hp.epsilon, "> 0");
    require(std::isfinite(hp.weight_decay) && hp.weight_decay >= 0.0f, "weight decay", hp.weight_decay, ">= 0");
    require(std::isfinite(hp.gnorm_scale) && hp.gnorm_scale > 0.0f, "gradient norm scale", hp.gnorm_scale, "> 0");
    if (hp.step < 1) {
        throw ConfigurationError(fmt::format("Invalid step: {} (must be >= 1)", hp.step));
    }
}

void update_block(OptimizerType type, const BlockSlice& slice, const OptimizerHyperParams& hp) {
    const float lr = hp.learning_rate;
    const float beta1 = hp.beta1;
    const float beta2 = hp.beta2;
    const float eps = hp.epsilon;
    const float wd = hp.weight_decay;

    switch (type) {
        case OptimizerType::ADAMW: {
            const float correction1 = 1.0f - beta_power(beta1, hp.step);
            const float correction2 = std::sqrt(1.0f - beta_power(beta2, hp.step));
            const float step_size = -lr * correction2 / correction1;
            for (int i = 0; i < slice.Count; ++i) {
                const float g = effective_gradient(type, slice.Param[i], slice.Grad[i], hp);
                const float m = beta1 * slice.State1[i] + (1.0f - beta1) * g;
                const float v = beta2 * slice.State2[i] + (1.0f - beta2) * g * g;
                float p = slice.Param[i];
                if (wd > 0.0f) p *= 1.0f - lr * wd;
                p += step_size * (m / (std::sqrt(v) + eps * correction2));
                slice.State1[i] = m;
                slice.State2[i] = v;
                slice.Param[i] = p;
            }
            break;
        }
        case OptimizerType::MOMENTUM:
            for (int i = 0; i < slice.Count; ++i) {
                const float g = effective_gradient(type, slice.Param[i], slice.Grad[i], hp);
                const float m = hp.step == 1 ? g : beta1 * slice.State1[i] + g;
                slice.State1[i] = m;
                slice.Param[i] -= lr * m;
            }
            break;
        case OptimizerType::RMSPROP:
            for (int i = 0; i < slice.Count; ++i) {
                const float g = effective_gradient(type, slice.Param[i], slice.Grad[i], hp);
                const float m = beta1 * slice.State1[i] + (1.0f - beta1) * g * g;
                slice.State1[i] = m;
                slice.Param[i] -= lr * g / (std::sqrt(m) + eps);
            }
            break;
        case OptimizerType::LION:
            for (int i = 0; i < slice.Count; ++i) {
                const float g = effective_gradient(type, slice.Param[i], slice.Grad[i], hp);
                const float m = slice.State1[i];
                const float c = beta1 * m + (1.0f - beta1) * g;
                const float sign = static_cast<float>((c > 0.0f) - (c < 0.0f));
                float p = slice.Param[i];
                if (wd > 0.0f) p *= 1.0f - lr * wd;
                slice.Param[i] = p - lr * sign;
                slice.State1[i] = beta2 * m + (1.0f - beta2) * g;
            }
            break;
        case OptimizerType::ADAGRAD:
            for (int i = 0; i < slice.Count; ++i) {
                const float g = effective_gradient(type, slice.Param[i], slice.Grad[i], hp);
                const float m = slice.State1[i] + g * g;
                slice.State1[i] = m;
                slice.Param[i] -= lr * g / (std::sqrt(m) + eps);
            }
            break;
    }
}

template<typename TParam, typename TGrad>
void optimizer_update_blockwise(OptimizerType type, TParam* param, const TGrad* grad, std::size_t n,
                                QuantizedState& state1, QuantizedState* state2,
                                const OptimizerHyperParams& hp, const ExecContext& ctx) {
    validate_update(type, param, grad, n, state1, state2, hp, ctx);

    const int block_size = state1.BlockSize;
    const long blocks = static_cast<long>(num_blocks(n, block_size));
    const bool two_states = num_states(type) == 2;
    const Codebook& codebook1 = state1.codebook();
    const Codebook& codebook2 = two_states ? state2->codebook() : codebook1;
    const int bits1 = codebook1.bits();
    const int bits2 = codebook2.bits();

    parallel_for_blocks(blocks, ctx, [&](long begin, long end) {
        std::vector<float> p(block_size);
        std::vector<float> g(block_size);
        std::vector<float> s1(block_size);
        std::vector<float> s2(two_states ? block_size : 0);
        std::vector<std::uint8_t> scratch(block_size);

        for (long b = begin; b < end; ++b) {
            const std::size_t first = static_cast<std::size_t>(b) * block_size;
            const int count = static_cast<int>(std::min<std::size_t>(block_size, n - first));

            std::uint8_t* codes1 = state1.Codes.data() + detail::block_code_offset(b, block_size, bits1);
            detail::decode_block(s1.data(), codes1, count, state1.AbsMax[b], codebook1);
            std::uint8_t* codes2 = nullptr;
            if (two_states) {
                codes2 = state2->Codes.data() + detail::block_code_offset(b, block_size, bits2);
                detail::decode_block(s2.data(), codes2, count, state2->AbsMax[b], codebook2);
            }

            for (int i = 0; i < count; ++i) {
                p[i] = to_float(param[first + i]);
                g[i] = to_float(grad[first + i]);
            }

            update_block(type, BlockSlice{p.data(), g.data(), s1.data(), two_states ? s2.data() : nullptr, count}, hp);

            for (int i = 0; i < count; ++i) {
                param[first + i] = from_float<TParam>(p[i]);
            }
            requantize_block(codes1, state1.AbsMax[b], s1.data(), count, codebook1, scratch.data());
            if (two_states) {
                requantize_block(codes2, state2->AbsMax[b], s2.data(), count, codebook2, scratch.data());
            }
        }
    });
}

template void optimizer_update_blockwise<float, float>(OptimizerType, float*, const float*, std::size_t, QuantizedState&, QuantizedState*, const OptimizerHyperParams&, const ExecContext&);
template void optimizer_update_blockwise<bfloat16, bfloat16>(OptimizerType, bfloat16*, const bfloat16*, std::size_t, QuantizedState&, QuantizedState*, const OptimizerHyperParams&, const ExecContext&);
template void optimizer_update_blockwise<float16, float16>(OptimizerType, float16*, const float16*, std::size_t, QuantizedState&, QuantizedState*, const OptimizerHyperParams&, const ExecContext&);
template void optimizer_update_blockwise<float, bfloat16>(OptimizerType, float*, const bfloat16*, std::size_t, QuantizedState&, QuantizedState*, const OptimizerHyperParams&, const ExecContext&);
template void optimizer_update_blockwise<float, float16>(OptimizerType, float*, const float16*, std::size_t, QuantizedState&, QuantizedState*, const OptimizerHyperParams&, const ExecContext&);

void optimizer_update_blockwise(OptimizerType type, Tensor& param, const Tensor& grad,
                                QuantizedState& state1, QuantizedState* state2,
                                const OptimizerHyperParams& hp, const ExecContext& ctx) {
    dispatch_param_grad("optimizer_update_blockwise", param, grad, [&](auto* p, const auto* g) {
        optimizer_update_blockwise(type, p, g, param.nelem(), state1, state2, hp, ctx);
    });
}

void validate_optimizer_update(OptimizerType type, const Tensor& param, const Tensor& grad,
                               const QuantizedState& state1, const QuantizedState* state2,
                               const OptimizerHyperParams& hp, const ExecContext& ctx) {
    dispatch_param_grad("validate_optimizer_update", param, grad, [&](const auto* p, const auto* g) {
        validate_update(type, p, g, param.nelem(), state1, state2, hp, ctx);
    });
}

} // namespace lowbit
