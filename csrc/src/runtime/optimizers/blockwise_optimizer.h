// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_BLOCKWISE_OPTIMIZER_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_BLOCKWISE_OPTIMIZER_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "optimizer_config.h"
#include "percentile_clipping.h"
#include "quantized_state.h"
#include "utilities/parallel.h"
#include "utilities/tensor.h"

namespace lowbit {

class RunLogger;

/**
 * @brief A parameter tensor and its gradient for one step.
 */
struct ParamGrad {
    std::string Name;
    Tensor Param;
    Tensor Grad;
};

/**
 * @brief Optimizer keeping blockwise quantized state for a set of named parameters.
 *
 * States are created zero-filled by add_param() and live as long as the optimizer.
 * A step validates every parameter/gradient pair before any of them is updated, so a
 * failed step leaves parameters, states and the step counter untouched.
 */
class BlockwiseOptimizer {
public:
    struct ParamState {
        std::size_t NumElements = 0;
        QuantizedState State1;
        std::optional<QuantizedState> State2;
    };

    /// @throws ConfigurationError if @p config is invalid.
    explicit BlockwiseOptimizer(const OptimizerConfig& config, RunLogger* logger = nullptr);

    /// @throws ConfigurationError if @p name is already registered.
    void add_param(const std::string& name, const Tensor& param);

    /**
     * @brief Runs one optimizer step over @p params.
     *
     * Every entry must name a registered parameter. Returns the clipping outcome
     * (gnorm_scale 1 when percentile clipping is disabled).
     */
    ClipResult step(const std::vector<ParamGrad>& params);

    [[nodiscard]] const OptimizerConfig& config() const { return mConfig; }
    [[nodiscard]] int step_count() const { return mStep; }
    void set_step_count(int step);

    [[nodiscard]] bool has_param(const std::string& name) const { return mStates.contains(name); }
    [[nodiscard]] std::vector<std::string> param_names() const;
    [[nodiscard]] std::size_t num_elements(const std::string& name) const;

    QuantizedState& state1(const std::string& name);
    [[nodiscard]] const QuantizedState& state1(const std::string& name) const;
    //! Null for single-state rules.
    QuantizedState* state2(const std::string& name);
    [[nodiscard]] const QuantizedState* state2(const std::string& name) const;

private:
    ParamState& get_state(const std::string& name);
    [[nodiscard]] const ParamState& get_state(const std::string& name) const;

    OptimizerConfig mConfig;
    RunLogger* mLogger;
    ExecContext mContext;
    std::optional<PercentileClipping> mClipping;
    int mStep = 0;
    std::map<std::string, ParamState> mStates;
};

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_BLOCKWISE_OPTIMIZER_H
