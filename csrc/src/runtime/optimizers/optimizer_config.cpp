// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizer_config.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace lowbit {

namespace {

std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_number_unsigned()) return static_cast<int>(value.get<std::uint64_t>());
    if (value.is_number_float()) return static_cast<int>(value.get<double>());
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<float> as_float(const nlohmann::json& value) {
    if (value.is_number_float() || value.is_number_integer() || value.is_number_unsigned()) {
        return static_cast<float>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return std::stof(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if constexpr (std::is_same_v<T, int>) {
        return as_int(*it);
    } else if constexpr (std::is_same_v<T, float>) {
        return as_float(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) return it->get<std::string>();
    }
    return std::nullopt;
}

//! Present but unparseable values are errors, absent ones keep the default.
template<typename T>
void read_field(const nlohmann::json& obj, const char* key, T& field) {
    if (!obj.contains(key)) return;
    auto value = get_opt<T>(obj, key);
    if (!value) {
        throw ConfigurationError(fmt::format("Invalid value for optimizer config key '{}': {}", key, obj[key].dump()));
    }
    field = *value;
}

ECodebookKind read_kind(const nlohmann::json& obj, const char* key, ECodebookKind fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& value = obj[key];
    if (value.is_string()) return codebook_kind_from_str(value.get<std::string>());
    if (auto raw = as_int(value)) return codebook_kind_from_int(*raw);
    throw ConfigurationError(fmt::format("Invalid codebook kind for '{}': {}", key, value.dump()));
}

} // namespace

void OptimizerConfig::validate() const {
    validate_hyper_params(to_hyper_params(1));
    check_block_size(block_size);
    if (percentile_clipping < 1 || percentile_clipping > 100) {
        throw ConfigurationError(fmt::format("percentile_clipping must be in [1, 100], got {}", percentile_clipping));
    }
    if (num_threads < 1) {
        throw ConfigurationError(fmt::format("num_threads must be >= 1, got {}", num_threads));
    }
    if (type != OptimizerType::RMSPROP && type != OptimizerType::ADAGRAD &&
        state1_kind == ECodebookKind::DYNAMIC_UNSIGNED) {
        throw ConfigurationError(fmt::format("{} needs a signed codebook for state1", optimizer_type_to_str(type)));
    }
}

OptimizerHyperParams OptimizerConfig::to_hyper_params(int step, float gnorm_scale) const {
    OptimizerHyperParams hp;
    hp.learning_rate = learning_rate;
    hp.beta1 = beta1;
    hp.beta2 = beta2;
    hp.epsilon = epsilon;
    hp.weight_decay = weight_decay;
    hp.step = step;
    hp.gnorm_scale = gnorm_scale;
    return hp;
}

void to_json(nlohmann::json& j, const OptimizerConfig& config) {
    j = nlohmann::json{
        {"type", std::string(optimizer_type_to_str(config.type))},
        {"learning_rate", config.learning_rate},
        {"beta1", config.beta1},
        {"beta2", config.beta2},
        {"epsilon", config.epsilon},
        {"weight_decay", config.weight_decay},
        {"block_size", config.block_size},
        {"state1_kind", std::string(codebook_kind_to_str(config.state1_kind))},
        {"state2_kind", std::string(codebook_kind_to_str(config.state2_kind))},
        {"percentile_clipping", config.percentile_clipping},
        {"num_threads", config.num_threads},
    };
}

void from_json(const nlohmann::json& j, OptimizerConfig& config) {
    if (!j.is_object()) {
        throw ConfigurationError("Optimizer config must be a JSON object");
    }
    std::string type_name(optimizer_type_to_str(config.type));
    read_field(j, "type", type_name);
    config.type = optimizer_type_from_str(type_name);
    read_field(j, "learning_rate", config.learning_rate);
    read_field(j, "beta1", config.beta1);
    read_field(j, "beta2", config.beta2);
    read_field(j, "epsilon", config.epsilon);
    read_field(j, "weight_decay", config.weight_decay);
    read_field(j, "block_size", config.block_size);
    read_field(j, "percentile_clipping", config.percentile_clipping);
    read_field(j, "num_threads", config.num_threads);
    config.state1_kind = read_kind(j, "state1_kind", config.state1_kind);
    config.state2_kind = read_kind(j, "state2_kind", config.state2_kind);
}

OptimizerConfig load_optimizer_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_name));
    }

    OptimizerConfig config;
    from_json(nlohmann::json::parse(file), config);
    config.validate();
    return config;
}

void save_optimizer_config(const std::string& file_name, const OptimizerConfig& config) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not create config file {}", file_name));
    }
    nlohmann::json j = config;
    file << j.dump(4);
}

} // namespace lowbit
