#include <catch2/catch_test_macros.hpp>
#include "ctxpack/core/config.hpp"
#include "test_helpers.hpp"

#include <cstdlib>

using namespace ctxpack::core;
using ctxpack::testing::TempDir;

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.budget.safety_margin_percent == 2);
    REQUIRE(config.budget.per_message_overhead == 4);
    REQUIRE(config.budget.batch_boundary_overhead == 3);
    REQUIRE(config.budget.tool_use_overhead == 10);
    REQUIRE(config.budget.tool_result_overhead == 10);
    REQUIRE(config.budget.image_tokens == 1000);
    REQUIRE(config.budget.per_tool_overhead == 20);
    REQUIRE(config.store.backend == "disk");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config loads YAML sections", "[config]") {
    TempDir dir;
    auto path = dir.write("config.yaml",
        "budget:\n"
        "  safety_margin_percent: 5\n"
        "  image_tokens: 1500\n"
        "store:\n"
        "  backend: memory\n"
        "  lock_timeout_ms: 250\n"
        "models:\n"
        "  - name: local-llama\n"
        "    max_context_tokens: 8192\n"
        "    default_max_output_tokens: 1024\n"
        "    provider: local\n"
        "observability:\n"
        "  log_level: debug\n");

    auto result = Config::load(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.budget.safety_margin_percent == 5);
    REQUIRE(config.budget.image_tokens == 1500);
    REQUIRE(config.budget.per_message_overhead == 4);
    REQUIRE(config.store.backend == "memory");
    REQUIRE(config.store.lock_timeout_ms == 250);
    REQUIRE(config.models.size() == 1);
    REQUIRE(config.models[0].name == "local-llama");
    REQUIRE(config.models[0].tokenizer == "heuristic");
    REQUIRE(config.observability.log_level == "debug");
}

TEST_CASE("Config validation rejects bad values", "[config]") {
    Config config;

    config.budget.safety_margin_percent = 100;
    REQUIRE(config.validate().error().code == ErrorCode::ConfigValidationFailed);

    config = Config{};
    config.store.backend = "sqlite";
    REQUIRE(config.validate().is_err());

    config = Config{};
    config.models.push_back(ModelEntryConfig{.name = "", .max_context_tokens = 100});
    REQUIRE(config.validate().is_err());
}

TEST_CASE("Config load reports missing and malformed files", "[config]") {
    TempDir dir;

    auto missing = Config::load(dir.path() / "absent.yaml");
    REQUIRE(missing.error().code == ErrorCode::ConfigNotFound);

    auto path = dir.write("bad.yaml", "budget: [unclosed\n");
    auto bad = Config::load(path);
    REQUIRE(bad.error().code == ErrorCode::ConfigParseFailed);
}

TEST_CASE("Config save round trips", "[config]") {
    TempDir dir;
    Config config;
    config.budget.per_tool_overhead = 32;
    config.store.threads_path = dir.path() / "threads";
    config.tokenizer.encoding_path = dir.path() / "enc.tiktoken";

    REQUIRE(config.save(dir.path() / "out.yaml").is_ok());

    auto loaded = Config::load(dir.path() / "out.yaml");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().budget.per_tool_overhead == 32);
    REQUIRE(loaded.value().store.threads_path == dir.path() / "threads");
}

TEST_CASE("expand_path substitutes environment variables", "[config]") {
    setenv("CTXPACK_TEST_DIR", "/opt/ctx", 1);

    REQUIRE(expand_path("${CTXPACK_TEST_DIR}/threads") == "/opt/ctx/threads");
    REQUIRE(expand_path("$CTXPACK_TEST_DIR/x") == "/opt/ctx/x");

    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_path("~/a") == std::string(home) + "/a");
    }
}
