// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "blockwise_optimizer.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "optimizer_blockwise.h"
#include "training/logging.h"

namespace lowbit {

BlockwiseOptimizer::BlockwiseOptimizer(const OptimizerConfig& config, RunLogger* logger) :
    mConfig(config), mLogger(logger)
{
    mConfig.validate();
    mContext.NumThreads = mConfig.num_threads;
    if (mConfig.percentile_clipping < 100) {
        mClipping.emplace(mConfig.percentile_clipping);
    }

    if (mLogger) {
        mLogger->log_options({
            {"optimizer", std::string(optimizer_type_to_str(mConfig.type))},
            {"learning_rate", mConfig.learning_rate},
            {"beta1", mConfig.beta1},
            {"beta2", mConfig.beta2},
            {"epsilon", mConfig.epsilon},
            {"weight_decay", mConfig.weight_decay},
            {"block_size", static_cast<std::int64_t>(mConfig.block_size)},
            {"state1_kind", std::string(codebook_kind_to_str(mConfig.state1_kind))},
            {"state2_kind", std::string(codebook_kind_to_str(mConfig.state2_kind))},
            {"percentile_clipping", static_cast<std::int64_t>(mConfig.percentile_clipping)},
            {"num_threads", static_cast<std::int64_t>(mConfig.num_threads)},
        });
    }
}

void BlockwiseOptimizer::add_param(const std::string& name, const Tensor& param) {
    if (mStates.contains(name)) {
        throw ConfigurationError(fmt::format("Parameter '{}' is already registered", name));
    }
    if (!is_float_dtype(param.DType)) {
        throw ShapeMismatchError(fmt::format("Parameter '{}' has non-float dtype {}", name, dtype_to_str(param.DType)));
    }

    ParamState state;
    state.NumElements = param.nelem();
    state.State1 = QuantizedState::zeros(state.NumElements, mConfig.block_size, mConfig.state1_kind);
    if (num_states(mConfig.type) == 2) {
        state.State2 = QuantizedState::zeros(state.NumElements, mConfig.block_size, mConfig.state2_kind);
    }
    mStates.emplace(name, std::move(state));
}

ClipResult BlockwiseOptimizer::step(const std::vector<ParamGrad>& params) {
    const auto start = std::chrono::steady_clock::now();
    const int step = mStep + 1;

    std::set<std::string> seen;
    for (const auto& pg : params) {
        if (!seen.insert(pg.Name).second) {
            throw ConfigurationError(fmt::format("Parameter '{}' appears twice in one step", pg.Name));
        }
        const ParamState& state = get_state(pg.Name);
        if (pg.Param.nelem() != state.NumElements) {
            throw ShapeMismatchError(fmt::format("Parameter '{}' has {} elements, registered with {}",
                                                 pg.Name, pg.Param.nelem(), state.NumElements));
        }
    }

    // the clipping history is only committed once all pairs passed validation
    ClipResult clip;
    std::optional<PercentileClipping> clipping = mClipping;
    if (clipping) {
        double total = 0.0;
        for (const auto& pg : params) {
            total += squared_norm(pg.Grad);
        }
        clip = clipping->update_squared_norm(total, step);
    }

    const OptimizerHyperParams hp = mConfig.to_hyper_params(step, clip.gnorm_scale);
    for (const auto& pg : params) {
        const ParamState& state = get_state(pg.Name);
        validate_optimizer_update(mConfig.type, pg.Param, pg.Grad, state.State1,
                                  state.State2 ? &*state.State2 : nullptr, hp, mContext);
    }

    for (const auto& pg : params) {
        ParamState& state = get_state(pg.Name);
        Tensor param = pg.Param;
        optimizer_update_blockwise(mConfig.type, param, pg.Grad, state.State1,
                                   state.State2 ? &*state.State2 : nullptr, hp, mContext);
    }

    mStep = step;
    mClipping = std::move(clipping);

    if (mLogger) {
        const auto duration = std::chrono::steady_clock::now() - start;
        const int duration_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
        mLogger->log_step(step, duration_ms, clip.gnorm, clip.clip_value, clip.gnorm_scale, mConfig.learning_rate);

        std::vector<std::pair<std::string, float>> abs_maxes;
        for (const auto& pg : params) {
            const ParamState& state = get_state(pg.Name);
            auto max_of = [](const QuantizedState& s) {
                return s.AbsMax.empty() ? 0.0f : *std::max_element(s.AbsMax.begin(), s.AbsMax.end());
            };
            abs_maxes.emplace_back(pg.Name + ".state1", max_of(state.State1));
            if (state.State2) {
                abs_maxes.emplace_back(pg.Name + ".state2", max_of(*state.State2));
            }
        }
        mLogger->log_abs_maxes(step, abs_maxes);
    }
    return clip;
}

void BlockwiseOptimizer::set_step_count(int step) {
    if (step < 0) {
        throw ConfigurationError(fmt::format("Invalid step count: {}", step));
    }
    mStep = step;
}

std::vector<std::string> BlockwiseOptimizer::param_names() const {
    std::vector<std::string> names;
    names.reserve(mStates.size());
    for (const auto& [name, state] : mStates) {
        names.push_back(name);
    }
    return names;
}

std::size_t BlockwiseOptimizer::num_elements(const std::string& name) const {
    return get_state(name).NumElements;
}

QuantizedState& BlockwiseOptimizer::state1(const std::string& name) {
    return get_state(name).State1;
}

const QuantizedState& BlockwiseOptimizer::state1(const std::string& name) const {
    return get_state(name).State1;
}

QuantizedState* BlockwiseOptimizer::state2(const std::string& name) {
    auto& state = get_state(name);
    return state.State2 ? &*state.State2 : nullptr;
}

const QuantizedState* BlockwiseOptimizer::state2(const std::string& name) const {
    const auto& state = get_state(name);
    return state.State2 ? &*state.State2 : nullptr;
}

BlockwiseOptimizer::ParamState& BlockwiseOptimizer::get_state(const std::string& name) {
    auto it = mStates.find(name);
    if (it == mStates.end()) {
        throw ConfigurationError(fmt::format("Unknown parameter '{}'", name));
    }
    return it->second;
}

const BlockwiseOptimizer::ParamState& BlockwiseOptimizer::get_state(const std::string& name) const {
    auto it = mStates.find(name);
    if (it == mStates.end()) {
        throw ConfigurationError(fmt::format("Unknown parameter '{}'", name));
    }
    return it->second;
}

} // namespace lowbit
