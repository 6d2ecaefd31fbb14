// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include "runtime/optimizers/blockwise_optimizer.h"
#include "runtime/optimizers/optimizer_config.h"
#include "runtime/optimizers/quantized_state.h"
#include "utilities/utils.h"

namespace lowbit {

namespace {

std::string state_file(const std::string& directory, const std::string& name, int index) {
    return fmt::format("{}/{}.state{}.bin", directory, name, index);
}

void check_param_name(const std::string& name) {
    if (name.empty() || name.find_first_of("/\\") != std::string::npos) {
        throw ConfigurationError(fmt::format("Parameter name '{}' cannot be used as a checkpoint file name", name));
    }
}

void write_state_file(const std::string& file_name, const QuantizedState& state) {
    std::ofstream file(file_name, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not create state file {}", file_name));
    }
    save_state(file, state);
}

void check_restored_state(const std::string& name, int index, const QuantizedState& state,
                          ECodebookKind kind, int block_size) {
    if (state.Kind != kind) {
        throw ConfigurationError(fmt::format("State {} of '{}' uses codebook {}, optimizer expects {}",
                                             index, name, codebook_kind_to_str(state.Kind),
                                             codebook_kind_to_str(kind)));
    }
    if (state.BlockSize != block_size) {
        throw ShapeMismatchError(fmt::format("State {} of '{}' has block size {}, optimizer expects {}",
                                             index, name, state.BlockSize, block_size));
    }
}

QuantizedState read_state_file(const std::string& file_name) {
    std::ifstream file(file_name, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open state file {}", file_name));
    }
    return load_state(file);
}

} // namespace

/**
 * @brief Build the full checkpoint path for a given step.
 *
 * This appends a `step_XXXXXXXX` directory name (zero-padded to 8 digits) to the
 * provided checkpoint directory.
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @param step Step number used to form the subdirectory name.
 * @return Full path to the checkpoint directory for @p step.
 */
std::string get_checkpoint_path(std::string checkpoint_directory, int step) {
    checkpoint_directory += fmt::format("/step_{:08}", step);
    return checkpoint_directory;
}

/**
 * @brief Save the optimizer state into a `step_XXXXXXXX` directory.
 *
 * Every parameter gets `<name>.state1.bin` (and `<name>.state2.bin` for two-state rules)
 * in the persisted quantized-state layout. `checkpoint.json` is written last and records
 * the step, the optimizer config and the parameter element counts.
 *
 * @return The full path to the created checkpoint directory.
 * @throws std::filesystem::filesystem_error If directory creation fails.
 * @throws std::runtime_error If a file cannot be written.
 */
std::string save_checkpoint(std::string target, const BlockwiseOptimizer& optimizer) {
    target = get_checkpoint_path(std::move(target), optimizer.step_count());
    std::filesystem::create_directories(target);

    nlohmann::json params = nlohmann::json::array();
    for (const std::string& name : optimizer.param_names()) {
        check_param_name(name);
        write_state_file(state_file(target, name, 1), optimizer.state1(name));
        if (const QuantizedState* state2 = optimizer.state2(name)) {
            write_state_file(state_file(target, name, 2), *state2);
        }
        params.push_back({{"name", name}, {"elements", optimizer.num_elements(name)}});
    }

    nlohmann::json meta_data;
    meta_data["step"] = optimizer.step_count();
    meta_data["optimizer"] = optimizer.config();
    meta_data["params"] = std::move(params);

    std::ofstream file(target + "/checkpoint.json");
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not create {}", target + "/checkpoint.json"));
    }
    file << meta_data.dump(4);
    return target;
}

/**
 * @brief Restore optimizer state from a checkpoint directory.
 *
 * The checkpoint must hold exactly the parameters registered with @p optimizer, with the
 * same element counts, codebooks and block size. All state files are read and checked before the optimizer is modified.
 *
 * @throws std::runtime_error If the checkpoint or one of its files is missing or truncated.
 * @throws ConfigurationError If the optimizer type or a state codebook differs from the optimizer config.
 * @throws ShapeMismatchError If parameters, element counts or state block sizes differ.
 */
void load_checkpoint(std::string source, int step, BlockwiseOptimizer& optimizer) {
    source = get_checkpoint_path(std::move(source), step);
    if(!std::filesystem::exists(source)) {
        throw std::runtime_error("Checkpoint not found: " + source);
    }

    std::ifstream file(source + "/checkpoint.json");
    if(!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", source + "/checkpoint.json"));
    }
    nlohmann::json meta_data = nlohmann::json::parse(file);

    OptimizerConfig saved_config;
    from_json(meta_data.at("optimizer"), saved_config);
    if (saved_config.type != optimizer.config().type) {
        throw ConfigurationError(fmt::format("Checkpoint was written by {}, optimizer is {}",
                                             optimizer_type_to_str(saved_config.type),
                                             optimizer_type_to_str(optimizer.config().type)));
    }

    const auto& params = meta_data.at("params");
    if (params.size() != optimizer.param_names().size()) {
        throw ShapeMismatchError(fmt::format("Checkpoint holds {} parameters, optimizer has {}",
                                             params.size(), optimizer.param_names().size()));
    }

    struct Restored {
        QuantizedState State1;
        std::optional<QuantizedState> State2;
    };
    std::map<std::string, Restored> restored;
    for (const auto& entry : params) {
        const auto name = entry.at("name").get<std::string>();
        const auto elements = entry.at("elements").get<std::size_t>();
        check_param_name(name);
        if (restored.contains(name)) {
            throw ShapeMismatchError(fmt::format("Checkpoint lists parameter '{}' twice", name));
        }
        if (!optimizer.has_param(name)) {
            throw ShapeMismatchError(fmt::format("Checkpoint parameter '{}' is not registered", name));
        }
        if (elements != optimizer.num_elements(name)) {
            throw ShapeMismatchError(fmt::format("Checkpoint parameter '{}' has {} elements, expected {}",
                                                 name, elements, optimizer.num_elements(name)));
        }

        Restored r{read_state_file(state_file(source, name, 1)), std::nullopt};
        if (optimizer.state2(name)) {
            r.State2 = read_state_file(state_file(source, name, 2));
        }
        for (const QuantizedState* s : {&r.State1, r.State2 ? &*r.State2 : nullptr}) {
            if (s && s->NumElements != elements) {
                throw ShapeMismatchError(fmt::format("State file of '{}' holds {} elements, expected {}",
                                                     name, s->NumElements, elements));
            }
        }
        const OptimizerConfig& config = optimizer.config();
        check_restored_state(name, 1, r.State1, config.state1_kind, config.block_size);
        if (r.State2) {
            check_restored_state(name, 2, *r.State2, config.state2_kind, config.block_size);
        }
        restored.emplace(name, std::move(r));
    }

    for (auto& [name, r] : restored) {
        optimizer.state1(name) = std::move(r.State1);
        if (r.State2) {
            *optimizer.state2(name) = std::move(*r.State2);
        }
    }
    optimizer.set_step_count(meta_data.at("step").get<int>());
}

/**
 * @brief List all available checkpoint step numbers in a directory.
 *
 * Scans immediate subdirectories of @p checkpoint_directory for names matching
 * `step_<digits>` and returns the parsed integer step values (only steps > 0).
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @return Vector of discovered checkpoint steps (unsorted).
 */
std::vector<int> get_all_checkpoints(const std::string& checkpoint_directory) {
    std::filesystem::path path(checkpoint_directory);
    if (!exists(path)) {
        return {};
    }
    std::filesystem::directory_iterator end_iter;
    std::vector<int> checkpoints;
    for(auto it = std::filesystem::directory_iterator(path); it != end_iter; ++it) {
        if(std::filesystem::is_directory(*it)) {
            std::string name = it->path().filename().string();
            if(!name.starts_with("step_") || name.size() == 5) {
                continue;
            }
            const std::string digits = name.substr(5);
            if(!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
                continue;
            }
            int step = 0;
            const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), step);
            if(ec != std::errc() || end != digits.data() + digits.size()) {
                continue;
            }
            if(step > 0) {
                checkpoints.push_back(step);
            }
        }
    }
    return checkpoints;
}

/**
 * @brief Find the latest (maximum step) checkpoint in a directory.
 *
 * @return Maximum checkpoint step found, or -1 if no checkpoints exist.
 */
int find_latest_checkpoint(const std::string& checkpoint_directory) {
    auto checkpoints = get_all_checkpoints(checkpoint_directory);
    return checkpoints.empty() ? -1 : *std::max_element(checkpoints.begin(), checkpoints.end());
}

/**
 * @brief Remove older checkpoints while keeping the newest N and optionally preserving "major" ones.
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @param n_to_keep Number of (non-major) checkpoints to keep (newest retained).
 * @param major_every If > 0, checkpoints where `step % major_every == 0` are preserved.
 * @return List of filesystem paths that were removed.
 *
 * @throws std::filesystem::filesystem_error If removal fails.
 */
std::vector<std::string> clean_old_checkpoints(const std::string& checkpoint_directory, int n_to_keep, int major_every) {
    auto checkpoints = get_all_checkpoints(checkpoint_directory);

    // leave major checkpoints untouched
    if(major_every > 0) {
        std::erase_if(checkpoints, [&](int step) { return step % major_every == 0; });
    }
    const std::size_t keep = static_cast<std::size_t>(std::max(n_to_keep, 0));
    if(checkpoints.size() <= keep) {
        return {};
    }

    std::vector<std::string> removed;
    std::sort(checkpoints.begin(), checkpoints.end());
    for(std::size_t i = 0; i < checkpoints.size() - keep; ++i) {
        std::string path = get_checkpoint_path(checkpoint_directory, checkpoints[i]);
        removed.push_back(path);
        std::filesystem::remove_all(path);
    }

    return removed;
}

} // namespace lowbit
