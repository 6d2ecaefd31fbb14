// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for checkpoint save/resume of the quantized optimizer state.

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "runtime/optimizers/blockwise_optimizer.h"
#include "runtime/training/checkpoint.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using namespace lowbit;
namespace fs = std::filesystem;

namespace {

struct Model {
    std::vector<float> Embedding = testing_utils::uniform_host(3000, -1.0f, 1.0f, 11);
    std::vector<float> Norm = testing_utils::uniform_host(17, 0.5f, 1.5f, 12);

    void register_with(BlockwiseOptimizer& opt) {
        opt.add_param("embedding", Tensor::from_vector(Embedding));
        opt.add_param("norm", Tensor::from_vector(Norm));
    }

    void step(BlockwiseOptimizer& opt, std::uint64_t seed) {
        const auto g1 = testing_utils::uniform_host(3000, -0.1f, 0.1f, seed);
        const auto g2 = testing_utils::uniform_host(17, -0.1f, 0.1f, seed + 1);
        opt.step({
            {"embedding", Tensor::from_vector(Embedding), Tensor::from_vector(g1)},
            {"norm", Tensor::from_vector(Norm), Tensor::from_vector(g2)},
        });
    }
};

OptimizerConfig checkpoint_config() {
    OptimizerConfig config = OptimizerConfig::adamw_8bit(1e-2f);
    config.block_size = 128;
    return config;
}

void require_same_states(const BlockwiseOptimizer& a, const BlockwiseOptimizer& b) {
    REQUIRE(a.param_names() == b.param_names());
    for (const auto& name : a.param_names()) {
        INFO(name);
        REQUIRE(a.state1(name).Kind == b.state1(name).Kind);
        REQUIRE(a.state1(name).Codes == b.state1(name).Codes);
        REQUIRE(a.state1(name).AbsMax == b.state1(name).AbsMax);
        REQUIRE((a.state2(name) == nullptr) == (b.state2(name) == nullptr));
        if (a.state2(name)) {
            REQUIRE(a.state2(name)->Codes == b.state2(name)->Codes);
            REQUIRE(a.state2(name)->AbsMax == b.state2(name)->AbsMax);
        }
    }
}

} // anonymous namespace

TEST_CASE("Checkpoint paths", "[checkpoint]") {
    REQUIRE(get_checkpoint_path("ckpt", 42) == "ckpt/step_00000042");
}

TEST_CASE("Checkpoint save and resume", "[checkpoint]") {
    testing_utils::TempDir dir("checkpoint-resume");

    Model model;
    BlockwiseOptimizer opt(checkpoint_config());
    model.register_with(opt);
    model.step(opt, 100);
    model.step(opt, 200);

    const std::string path = save_checkpoint(dir.str(), opt);
    REQUIRE(path == get_checkpoint_path(dir.str(), 2));
    REQUIRE(fs::exists(path + "/checkpoint.json"));
    REQUIRE(fs::exists(path + "/embedding.state1.bin"));
    REQUIRE(fs::exists(path + "/norm.state2.bin"));

    std::ifstream meta_file(path + "/checkpoint.json");
    const auto meta = nlohmann::json::parse(meta_file);
    REQUIRE(meta["step"] == 2);
    REQUIRE(meta["optimizer"]["type"] == "adamw");
    REQUIRE(meta["params"].size() == 2);

    // a fresh optimizer over a copy of the parameters continues exactly like the original
    Model resumed_model = model;
    BlockwiseOptimizer resumed(checkpoint_config());
    resumed_model.register_with(resumed);
    load_checkpoint(dir.str(), 2, resumed);

    REQUIRE(resumed.step_count() == 2);
    require_same_states(opt, resumed);

    model.step(opt, 300);
    resumed_model.step(resumed, 300);
    REQUIRE(resumed.step_count() == 3);
    REQUIRE(model.Embedding == resumed_model.Embedding);
    REQUIRE(model.Norm == resumed_model.Norm);
    require_same_states(opt, resumed);
}

TEST_CASE("Checkpoint mismatches are rejected", "[checkpoint]") {
    testing_utils::TempDir dir("checkpoint-mismatch");

    Model model;
    BlockwiseOptimizer opt(checkpoint_config());
    model.register_with(opt);
    model.step(opt, 1);
    save_checkpoint(dir.str(), opt);

    SECTION("missing checkpoint") {
        BlockwiseOptimizer other(checkpoint_config());
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 7, other), std::runtime_error);
    }
    SECTION("different optimizer") {
        BlockwiseOptimizer other(OptimizerConfig::lion_8bit());
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), ConfigurationError);
        REQUIRE(other.step_count() == 0);
    }
    SECTION("different element count") {
        std::vector<float> small(5, 0.0f);
        BlockwiseOptimizer other(checkpoint_config());
        other.add_param("embedding", Tensor::from_vector(model.Embedding));
        other.add_param("norm", Tensor::from_vector(small));
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), ShapeMismatchError);
        // nothing was restored, not even the parameter that matched
        REQUIRE(other.step_count() == 0);
        REQUIRE(other.state1("embedding").AbsMax == std::vector<float>(24, 0.0f));
    }
    SECTION("different parameter set") {
        BlockwiseOptimizer other(checkpoint_config());
        other.add_param("embedding", Tensor::from_vector(model.Embedding));
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), ShapeMismatchError);
    }
    SECTION("different block size") {
        OptimizerConfig config = checkpoint_config();
        config.block_size = 64;
        BlockwiseOptimizer other(config);
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), ShapeMismatchError);
        REQUIRE(other.step_count() == 0);
        REQUIRE(other.state1("norm").BlockSize == 64);
    }
    SECTION("different codebook") {
        OptimizerConfig config = checkpoint_config();
        config.state1_kind = ECodebookKind::NF4;
        BlockwiseOptimizer other(config);
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), ConfigurationError);
        REQUIRE(other.step_count() == 0);
        REQUIRE(other.state1("embedding").Kind == ECodebookKind::NF4);
    }
    SECTION("corrupted absmax") {
        const std::string file = get_checkpoint_path(dir.str(), 1) + "/norm.state2.bin";
        {
            std::fstream f(file, std::ios::in | std::ios::out | std::ios::binary);
            f.seekp(-4, std::ios::end);
            const char nan_bits[4] = {'\x00', '\x00', '\xC0', '\x7F'};
            f.write(nan_bits, 4);
        }
        BlockwiseOptimizer other(checkpoint_config());
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), NumericOverflowError);
        REQUIRE(other.step_count() == 0);
    }
    SECTION("truncated state file") {
        const std::string file = get_checkpoint_path(dir.str(), 1) + "/norm.state1.bin";
        fs::resize_file(file, fs::file_size(file) - 1);
        BlockwiseOptimizer other(checkpoint_config());
        model.register_with(other);
        REQUIRE_THROWS_AS(load_checkpoint(dir.str(), 1, other), std::runtime_error);
        REQUIRE(other.step_count() == 0);
    }
}

TEST_CASE("Parameter names must be usable as file names", "[checkpoint]") {
    testing_utils::TempDir dir("checkpoint-names");
    std::vector<float> param(4, 1.0f);
    BlockwiseOptimizer opt(checkpoint_config());
    opt.add_param("layers/0/weight", Tensor::from_vector(param));
    REQUIRE_THROWS_AS(save_checkpoint(dir.str(), opt), ConfigurationError);
}

TEST_CASE("Checkpoint discovery and cleanup", "[checkpoint]") {
    testing_utils::TempDir dir("checkpoint-cleanup");
    REQUIRE(find_latest_checkpoint(dir.str()) == -1);
    REQUIRE(find_latest_checkpoint(dir.str() + "/does-not-exist") == -1);

    for (int step : {100, 200, 300, 400, 500}) {
        fs::create_directories(get_checkpoint_path(dir.str(), step));
    }
    fs::create_directories(dir.path() / "step_latest");
    fs::create_directories(dir.path() / "step_00000000");
    // does not fit an int
    fs::create_directories(dir.path() / "step_99999999999");
    std::ofstream(dir.path() / "step_00000600") << "not a directory";

    auto steps = get_all_checkpoints(dir.str());
    std::sort(steps.begin(), steps.end());
    REQUIRE(steps == std::vector<int>{100, 200, 300, 400, 500});
    REQUIRE(find_latest_checkpoint(dir.str()) == 500);

    SECTION("keep the newest") {
        const auto removed = clean_old_checkpoints(dir.str(), 2);
        REQUIRE(removed.size() == 3);
        auto left = get_all_checkpoints(dir.str());
        std::sort(left.begin(), left.end());
        REQUIRE(left == std::vector<int>{400, 500});
    }
    SECTION("major checkpoints survive") {
        clean_old_checkpoints(dir.str(), 1, 200);
        auto left = get_all_checkpoints(dir.str());
        std::sort(left.begin(), left.end());
        REQUIRE(left == std::vector<int>{200, 400, 500});
    }
    SECTION("nothing to remove") {
        REQUIRE(clean_old_checkpoints(dir.str(), 10).empty());
        REQUIRE(clean_old_checkpoints(dir.str(), -1).size() == 5);
    }
}
