// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H
#define LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H

#include <string>
#include <string_view>

#include "utilities/utils.h"

namespace lowbit {

/**
 * @brief Update rules supported by the blockwise quantized optimizer
 */
enum class OptimizerType {
    ADAMW,          // AdamW, two states (m signed, v unsigned)
    MOMENTUM,       // SGD with momentum, one signed state
    RMSPROP,        // RMSprop, one unsigned state
    LION,           // Lion, one signed state
    ADAGRAD         // Adagrad, one unsigned state
};

/**
 * @brief Convert string to OptimizerType
 */
inline OptimizerType optimizer_type_from_str(std::string_view str) {
    if (iequals(str, "adamw") || iequals(str, "adam")) {
        return OptimizerType::ADAMW;
    } else if (iequals(str, "momentum") || iequals(str, "sgd")) {
        return OptimizerType::MOMENTUM;
    } else if (iequals(str, "rmsprop")) {
        return OptimizerType::RMSPROP;
    } else if (iequals(str, "lion")) {
        return OptimizerType::LION;
    } else if (iequals(str, "adagrad")) {
        return OptimizerType::ADAGRAD;
    }
    throw ConfigurationError("Unknown optimizer type: " + std::string(str));
}

/**
 * @brief Convert OptimizerType to string
 */
inline std::string_view optimizer_type_to_str(OptimizerType type) {
    switch (type) {
        case OptimizerType::ADAMW: return "adamw";
        case OptimizerType::MOMENTUM: return "momentum";
        case OptimizerType::RMSPROP: return "rmsprop";
        case OptimizerType::LION: return "lion";
        case OptimizerType::ADAGRAD: return "adagrad";
    }
    return "unknown";
}

//! Number of quantized state buffers the rule keeps per parameter.
inline int num_states(OptimizerType type) {
    return type == OptimizerType::ADAMW ? 2 : 1;
}

} // namespace lowbit

#endif // LOWBIT_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_BASE_H
