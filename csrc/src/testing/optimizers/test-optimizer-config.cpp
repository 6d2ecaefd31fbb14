// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_all.hpp>

#include <fstream>

#include <nlohmann/json.hpp>

#include "runtime/optimizers/optimizer_config.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using namespace lowbit;

TEST_CASE("Optimizer type names", "[optimizer][config]") {
    REQUIRE(optimizer_type_from_str("AdamW") == OptimizerType::ADAMW);
    REQUIRE(optimizer_type_from_str("adam") == OptimizerType::ADAMW);
    REQUIRE(optimizer_type_from_str("SGD") == OptimizerType::MOMENTUM);
    REQUIRE(optimizer_type_from_str("rmsprop") == OptimizerType::RMSPROP);
    REQUIRE(optimizer_type_from_str("LION") == OptimizerType::LION);
    REQUIRE(optimizer_type_from_str("adagrad") == OptimizerType::ADAGRAD);
    REQUIRE_THROWS_AS(optimizer_type_from_str("adafactor"), ConfigurationError);

    for (OptimizerType type : {OptimizerType::ADAMW, OptimizerType::MOMENTUM, OptimizerType::RMSPROP,
                               OptimizerType::LION, OptimizerType::ADAGRAD}) {
        REQUIRE(optimizer_type_from_str(optimizer_type_to_str(type)) == type);
    }
    REQUIRE(num_states(OptimizerType::ADAMW) == 2);
    REQUIRE(num_states(OptimizerType::LION) == 1);
}

TEST_CASE("Presets are valid", "[optimizer][config]") {
    REQUIRE_NOTHROW(OptimizerConfig::adamw_8bit().validate());
    REQUIRE_NOTHROW(OptimizerConfig::momentum_8bit().validate());
    REQUIRE_NOTHROW(OptimizerConfig::rmsprop_8bit().validate());
    REQUIRE_NOTHROW(OptimizerConfig::lion_8bit().validate());
    REQUIRE_NOTHROW(OptimizerConfig::adagrad_8bit().validate());

    const OptimizerConfig lion = OptimizerConfig::lion_8bit();
    REQUIRE(lion.learning_rate == 1e-4f);
    REQUIRE(lion.beta2 == 0.99f);
    REQUIRE(OptimizerConfig::rmsprop_8bit().state1_kind == ECodebookKind::DYNAMIC_UNSIGNED);
}

TEST_CASE("Invalid configurations", "[optimizer][config]") {
    OptimizerConfig config = OptimizerConfig::adamw_8bit();
    SECTION("block size") { config.block_size = 100; }
    SECTION("beta1") { config.beta1 = 1.0f; }
    SECTION("epsilon") { config.epsilon = 0.0f; }
    SECTION("learning rate") { config.learning_rate = -1e-3f; }
    SECTION("percentile") { config.percentile_clipping = 0; }
    SECTION("threads") { config.num_threads = 0; }
    SECTION("unsigned momentum") { config.state1_kind = ECodebookKind::DYNAMIC_UNSIGNED; }
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
}

TEST_CASE("Optimizer config JSON", "[optimizer][config]") {
    SECTION("round trip") {
        OptimizerConfig config = OptimizerConfig::lion_8bit(3e-4f, 0.95f, 0.98f, 0.1f);
        config.block_size = 2048;
        config.state1_kind = ECodebookKind::NF4;
        config.percentile_clipping = 5;
        config.num_threads = 8;

        const nlohmann::json j = config;
        REQUIRE(j["type"] == "lion");
        REQUIRE(j["state1_kind"] == "nf4");

        const OptimizerConfig parsed = j.get<OptimizerConfig>();
        REQUIRE(parsed.type == config.type);
        REQUIRE(parsed.learning_rate == config.learning_rate);
        REQUIRE(parsed.beta1 == config.beta1);
        REQUIRE(parsed.beta2 == config.beta2);
        REQUIRE(parsed.weight_decay == config.weight_decay);
        REQUIRE(parsed.block_size == 2048);
        REQUIRE(parsed.state1_kind == ECodebookKind::NF4);
        REQUIRE(parsed.state2_kind == config.state2_kind);
        REQUIRE(parsed.percentile_clipping == 5);
        REQUIRE(parsed.num_threads == 8);
    }
    SECTION("lenient values") {
        const auto j = nlohmann::json::parse(R"({
            "type": "RMSprop",
            "learning_rate": "0.01",
            "block_size": "128",
            "beta1": 0.5,
            "num_threads": 2.0,
            "state1_kind": 1
        })");
        const OptimizerConfig parsed = j.get<OptimizerConfig>();
        REQUIRE(parsed.type == OptimizerType::RMSPROP);
        REQUIRE(parsed.learning_rate == 0.01f);
        REQUIRE(parsed.block_size == 128);
        REQUIRE(parsed.beta1 == 0.5f);
        REQUIRE(parsed.num_threads == 2);
        REQUIRE(parsed.state1_kind == ECodebookKind::DYNAMIC_UNSIGNED);
        // untouched keys keep their defaults
        REQUIRE(parsed.epsilon == OptimizerConfig{}.epsilon);
        REQUIRE_NOTHROW(parsed.validate());
    }
    SECTION("bad values") {
        OptimizerConfig config;
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"type", "adafactor"}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"type", 3}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"learning_rate", "fast"}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"block_size", nullptr}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"state2_kind", "int3"}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json{{"state1_kind", 42}}, config), ConfigurationError);
        REQUIRE_THROWS_AS(from_json(nlohmann::json::array(), config), ConfigurationError);
    }
}

TEST_CASE("Optimizer config files", "[optimizer][config]") {
    testing_utils::TempDir dir("optimizer-config");
    const std::string file = (dir.path() / "optimizer.json").string();

    OptimizerConfig config = OptimizerConfig::adagrad_8bit();
    config.percentile_clipping = 10;
    save_optimizer_config(file, config);

    const OptimizerConfig loaded = load_optimizer_config(file);
    REQUIRE(loaded.type == OptimizerType::ADAGRAD);
    REQUIRE(loaded.epsilon == config.epsilon);
    REQUIRE(loaded.percentile_clipping == 10);

    SECTION("invalid values are rejected on load") {
        std::ofstream(file) << R"({"type": "adamw", "block_size": 3})";
        REQUIRE_THROWS_AS(load_optimizer_config(file), ConfigurationError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(load_optimizer_config((dir.path() / "missing.json").string()), std::runtime_error);
    }
}
