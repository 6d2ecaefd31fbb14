// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "kernels/blockwise_quant.h"
#include "kernels/codebook.h"
#include "optimizer_base.h"
#include "optimizer_blockwise.h"

namespace lowbit {

/**
 * @brief Configuration for blockwise quantized optimizers
 *
 * Contains the hyperparameters of every supported rule. beta2 is only used by AdamW and Lion.
 */
struct OptimizerConfig {
    OptimizerType type = OptimizerType::ADAMW;

    float learning_rate = 1e-3f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;
    float weight_decay = 0.0f;

    // Quantization of the optimizer state
    int block_size = DEFAULT_BLOCK_SIZE;
    ECodebookKind state1_kind = ECodebookKind::DYNAMIC;
    ECodebookKind state2_kind = ECodebookKind::DYNAMIC_UNSIGNED;

    // Percentile clipping; 100 disables it
    int percentile_clipping = 100;

    int num_threads = 1;

    /**
     * @brief Create default AdamW 8-bit config
     */
    static OptimizerConfig adamw_8bit(float lr = 1e-3f, float beta1 = 0.9f, float beta2 = 0.999f,
                                      float epsilon = 1e-8f, float weight_decay = 1e-2f) {
        OptimizerConfig config;
        config.type = OptimizerType::ADAMW;
        config.learning_rate = lr;
        config.beta1 = beta1;
        config.beta2 = beta2;
        config.epsilon = epsilon;
        config.weight_decay = weight_decay;
        return config;
    }

    static OptimizerConfig momentum_8bit(float lr = 1e-2f, float momentum = 0.9f, float weight_decay = 0.0f) {
        OptimizerConfig config;
        config.type = OptimizerType::MOMENTUM;
        config.learning_rate = lr;
        config.beta1 = momentum;
        config.weight_decay = weight_decay;
        return config;
    }

    static OptimizerConfig rmsprop_8bit(float lr = 1e-2f, float alpha = 0.99f, float epsilon = 1e-8f,
                                        float weight_decay = 0.0f) {
        OptimizerConfig config;
        config.type = OptimizerType::RMSPROP;
        config.learning_rate = lr;
        config.beta1 = alpha;
        config.epsilon = epsilon;
        config.weight_decay = weight_decay;
        config.state1_kind = ECodebookKind::DYNAMIC_UNSIGNED;
        return config;
    }

    /**
     * @brief Create default Lion 8-bit config
     *
     * Lion takes the sign of an interpolated momentum, so it wants a smaller learning rate
     * and larger weight decay than AdamW.
     */
    static OptimizerConfig lion_8bit(float lr = 1e-4f, float beta1 = 0.9f, float beta2 = 0.99f,
                                     float weight_decay = 0.0f) {
        OptimizerConfig config;
        config.type = OptimizerType::LION;
        config.learning_rate = lr;
        config.beta1 = beta1;
        config.beta2 = beta2;
        config.weight_decay = weight_decay;
        return config;
    }

    static OptimizerConfig adagrad_8bit(float lr = 1e-2f, float epsilon = 1e-10f, float weight_decay = 0.0f) {
        OptimizerConfig config;
        config.type = OptimizerType::ADAGRAD;
        config.learning_rate = lr;
        config.epsilon = epsilon;
        config.weight_decay = weight_decay;
        config.state1_kind = ECodebookKind::DYNAMIC_UNSIGNED;
        return config;
    }

    /// @throws ConfigurationError if any value is out of its domain.
    void validate() const;

    //! Hyperparameters of step @p step.
    [[nodiscard]] OptimizerHyperParams to_hyper_params(int step, float gnorm_scale = 1.0f) const;
};

void to_json(nlohmann::json& j, const OptimizerConfig& config);

/// Missing keys keep their defaults; numeric values may be given as strings.
/// @throws ConfigurationError for unknown optimizer or codebook names.
void from_json(const nlohmann::json& j, OptimizerConfig& config);

OptimizerConfig load_optimizer_config(const std::string& file_name);
void save_optimizer_config(const std::string& file_name, const OptimizerConfig& config);

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
