#include <catch2/catch_test_macros.hpp>
#include "ctxpack/llm/model_catalog.hpp"

#include <algorithm>

using namespace ctxpack::llm;

TEST_CASE("Catalog exact lookup", "[catalog]") {
    ModelCatalog catalog;

    const auto* info = catalog.get("gpt-4o");
    REQUIRE(info != nullptr);
    REQUIRE(info->max_context_tokens == 128000);
    REQUIRE(info->default_max_output_tokens == 16384);
    REQUIRE(info->tokenizer == TokenizerKind::GptLike);
    REQUIRE(info->provider == "openai");
}

TEST_CASE("Catalog prefix lookup", "[catalog]") {
    ModelCatalog catalog;

    SECTION("registered name extends the query") {
        const auto* info = catalog.get("claude-opus-4-5");
        REQUIRE(info != nullptr);
        REQUIRE(info->name == "claude-opus-4-5-20251101");
    }

    SECTION("query carries a newer date suffix") {
        const auto* info = catalog.get("claude-sonnet-4-20990101");
        REQUIRE(info != nullptr);
        REQUIRE(info->provider == "anthropic");
        REQUIRE(info->max_context_tokens == 200000);
    }

    SECTION("lookup is deterministic") {
        const auto* first = catalog.get("gpt-4");
        const auto* second = catalog.get("gpt-4");
        REQUIRE(first != nullptr);
        REQUIRE(first == second);
    }
}

TEST_CASE("Catalog falls back for unknown models", "[catalog]") {
    ModelCatalog catalog;

    REQUIRE(catalog.get("totally-unknown-model") == nullptr);
    REQUIRE(catalog.get("") == nullptr);

    auto info = catalog.info_for("totally-unknown-model");
    REQUIRE(info.name == "totally-unknown-model");
    REQUIRE(info.max_context_tokens == ModelCatalog::kFallbackContextTokens);
    REQUIRE(info.default_max_output_tokens == ModelCatalog::kFallbackOutputTokens);
    REQUIRE(info.tokenizer == TokenizerKind::Heuristic);
    REQUIRE(info.provider == "unknown");
}

TEST_CASE("Catalog providers and registration", "[catalog]") {
    ModelCatalog catalog;

    auto providers = catalog.providers();
    REQUIRE(std::is_sorted(providers.begin(), providers.end()));
    REQUIRE(std::find(providers.begin(), providers.end(), "anthropic") != providers.end());
    REQUIRE(std::find(providers.begin(), providers.end(), "groq") != providers.end());

    auto gemini = catalog.models_for_provider("gemini");
    REQUIRE(std::find(gemini.begin(), gemini.end(), "gemini-2.5-pro") != gemini.end());

    catalog.register_models({ctxpack::core::ModelEntryConfig{
        .name = "local-llama",
        .max_context_tokens = 8192,
        .default_max_output_tokens = 1024,
        .tokenizer = "gpt",
        .provider = "local"
    }});

    auto info = catalog.info_for("local-llama");
    REQUIRE(info.max_context_tokens == 8192);
    REQUIRE(info.tokenizer == TokenizerKind::GptLike);
    REQUIRE(catalog.models_for_provider("local") == std::vector<std::string>{"local-llama"});
}

TEST_CASE("Tokenizer kind names", "[catalog]") {
    REQUIRE(tokenizer_kind_from_string("claude") == TokenizerKind::Claude);
    REQUIRE(tokenizer_kind_from_string("gpt_like") == TokenizerKind::GptLike);
    REQUIRE(tokenizer_kind_from_string("nonsense") == TokenizerKind::Heuristic);
    REQUIRE(tokenizer_kind_to_string(TokenizerKind::Gemini) == "gemini");
}
