#pragma once

#include "ctxpack/core/config.hpp"
#include "ctxpack/core/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ctxpack::llm {

using namespace ctxpack::core;

// Counting strategy for a model family
enum class TokenizerKind {
    Claude,
    GptLike,
    Gemini,
    Heuristic  // ceil(chars / 4)
};

std::string_view tokenizer_kind_to_string(TokenizerKind kind);
TokenizerKind tokenizer_kind_from_string(std::string_view str);

struct ModelInfo {
    std::string name;
    int max_context_tokens = 0;
    int default_max_output_tokens = 0;
    TokenizerKind tokenizer = TokenizerKind::Heuristic;
    bool supports_tools = true;
    bool supports_thinking = false;
    std::string provider;
};

// Read-only lookup of context limits and counting strategy per model
class ModelCatalog {
public:
    // Seeded with the known provider models
    ModelCatalog();

    // Exact match, then the longest versioned-prefix match; nullptr if none
    const ModelInfo* get(std::string_view model) const;

    // Never fails: unknown models get a conservative heuristic entry
    ModelInfo info_for(std::string_view model) const;

    void register_model(ModelInfo info);
    void register_models(const std::vector<ModelEntryConfig>& entries);

    std::vector<std::string> list() const;
    std::vector<std::string> providers() const;
    std::vector<std::string> models_for_provider(std::string_view provider) const;

    static constexpr int kFallbackContextTokens = 128000;
    static constexpr int kFallbackOutputTokens = 4096;

private:
    std::map<std::string, ModelInfo, std::less<>> models_;

    void seed_defaults();
};

}  // namespace ctxpack::llm
