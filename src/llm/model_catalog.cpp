#include "ctxpack/llm/model_catalog.hpp"

#include <algorithm>
#include <set>

namespace ctxpack::llm {

std::string_view tokenizer_kind_to_string(TokenizerKind kind) {
    switch (kind) {
        case TokenizerKind::Claude: return "claude";
        case TokenizerKind::GptLike: return "gpt";
        case TokenizerKind::Gemini: return "gemini";
        case TokenizerKind::Heuristic: return "heuristic";
    }
    return "heuristic";
}

TokenizerKind tokenizer_kind_from_string(std::string_view str) {
    if (str == "claude") return TokenizerKind::Claude;
    if (str == "gpt" || str == "gpt_like") return TokenizerKind::GptLike;
    if (str == "gemini") return TokenizerKind::Gemini;
    return TokenizerKind::Heuristic;
}

namespace {

// First three dash-separated parts: "claude-sonnet-4-20250514" -> "claude-sonnet-4"
std::string family_key(const std::string& name) {
    size_t pos = 0;
    for (int parts = 0; parts < 3; ++parts) {
        pos = name.find('-', pos);
        if (pos == std::string::npos) {
            return name;
        }
        if (parts < 2) {
            ++pos;
        }
    }
    return name.substr(0, pos);
}

ModelInfo make(std::string name, int context, int output, TokenizerKind tokenizer,
               std::string provider, bool thinking = false) {
    return ModelInfo{
        .name = std::move(name),
        .max_context_tokens = context,
        .default_max_output_tokens = output,
        .tokenizer = tokenizer,
        .supports_tools = true,
        .supports_thinking = thinking,
        .provider = std::move(provider)
    };
}

}  // namespace

ModelCatalog::ModelCatalog() {
    seed_defaults();
}

const ModelInfo* ModelCatalog::get(std::string_view model) const {
    if (model.empty()) {
        return nullptr;
    }

    if (auto it = models_.find(model); it != models_.end()) {
        return &it->second;
    }

    const ModelInfo* best = nullptr;
    size_t best_len = 0;
    for (const auto& [name, info] : models_) {
        size_t match_len = 0;
        if (name.starts_with(model)) {
            match_len = model.size();
        } else if (const std::string key = family_key(name); model.starts_with(key)) {
            match_len = key.size();
        }
        if (match_len > best_len) {
            best = &info;
            best_len = match_len;
        }
    }
    return best;
}

ModelInfo ModelCatalog::info_for(std::string_view model) const {
    if (const ModelInfo* info = get(model)) {
        return *info;
    }
    return make(std::string(model), kFallbackContextTokens, kFallbackOutputTokens,
                TokenizerKind::Heuristic, "unknown");
}

void ModelCatalog::register_model(ModelInfo info) {
    std::string name = info.name;
    models_.insert_or_assign(std::move(name), std::move(info));
}

void ModelCatalog::register_models(const std::vector<ModelEntryConfig>& entries) {
    for (const auto& entry : entries) {
        ModelInfo info = make(entry.name, entry.max_context_tokens, entry.default_max_output_tokens,
                              tokenizer_kind_from_string(entry.tokenizer), entry.provider,
                              entry.supports_thinking);
        info.supports_tools = entry.supports_tools;
        register_model(std::move(info));
    }
}

std::vector<std::string> ModelCatalog::list() const {
    std::vector<std::string> names;
    names.reserve(models_.size());
    for (const auto& [name, info] : models_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ModelCatalog::providers() const {
    std::set<std::string> unique;
    for (const auto& [name, info] : models_) {
        unique.insert(info.provider);
    }
    return {unique.begin(), unique.end()};
}

std::vector<std::string> ModelCatalog::models_for_provider(std::string_view provider) const {
    std::vector<std::string> names;
    for (const auto& [name, info] : models_) {
        if (info.provider == provider) {
            names.push_back(name);
        }
    }
    return names;
}

void ModelCatalog::seed_defaults() {
    using TK = TokenizerKind;

    // Anthropic
    register_model(make("claude-opus-4-5-20251101", 200000, 16384, TK::Claude, "anthropic", true));
    register_model(make("claude-sonnet-4-5-20250929", 200000, 16384, TK::Claude, "anthropic", true));
    register_model(make("claude-haiku-4-5-20251001", 200000, 8192, TK::Claude, "anthropic", true));
    register_model(make("claude-sonnet-4-20250514", 200000, 8192, TK::Claude, "anthropic", true));
    register_model(make("claude-opus-4-20250514", 200000, 8192, TK::Claude, "anthropic", true));
    register_model(make("claude-3-5-sonnet-20241022", 200000, 8192, TK::Claude, "anthropic"));
    register_model(make("claude-3-5-haiku-20241022", 200000, 8192, TK::Claude, "anthropic"));
    register_model(make("claude-3-opus-20240229", 200000, 4096, TK::Claude, "anthropic"));
    register_model(make("claude-3-haiku-20240307", 200000, 4096, TK::Claude, "anthropic"));

    // OpenAI
    register_model(make("gpt-5.2-2025-12-11", 256000, 32768, TK::GptLike, "openai"));
    register_model(make("gpt-5.2-pro-2025-12-11", 256000, 32768, TK::GptLike, "openai", true));
    register_model(make("gpt-5-mini-2025-08-07", 128000, 16384, TK::GptLike, "openai"));
    register_model(make("gpt-4o", 128000, 16384, TK::GptLike, "openai"));
    register_model(make("gpt-4o-mini", 128000, 16384, TK::GptLike, "openai"));
    register_model(make("gpt-4-turbo", 128000, 4096, TK::GptLike, "openai"));
    register_model(make("o1", 200000, 100000, TK::GptLike, "openai", true));
    register_model(make("o1-mini", 128000, 65536, TK::GptLike, "openai", true));
    register_model(make("o3-mini", 200000, 100000, TK::GptLike, "openai", true));

    // Google
    register_model(make("gemini-2.5-flash", 1000000, 8192, TK::Gemini, "gemini"));
    register_model(make("gemini-2.5-pro", 1000000, 8192, TK::Gemini, "gemini", true));
    register_model(make("gemini-2.0-flash", 1000000, 8192, TK::Gemini, "gemini"));
    register_model(make("gemini-1.5-pro", 2000000, 8192, TK::Gemini, "gemini"));
    register_model(make("gemini-1.5-flash", 1000000, 8192, TK::Gemini, "gemini"));

    // xAI
    register_model(make("grok-4", 256000, 32768, TK::GptLike, "grok", true));
    register_model(make("grok-4-fast-reasoning", 2000000, 32768, TK::GptLike, "grok", true));
    register_model(make("grok-4-fast-non-reasoning", 2000000, 32768, TK::GptLike, "grok"));
    register_model(make("grok-4-1-fast-reasoning", 2000000, 32768, TK::GptLike, "grok", true));
    register_model(make("grok-4-1-fast-non-reasoning", 2000000, 32768, TK::GptLike, "grok"));
    register_model(make("grok-code-fast-1", 256000, 32768, TK::GptLike, "grok", true));
    register_model(make("grok-3", 131072, 16384, TK::GptLike, "grok"));
    register_model(make("grok-3-mini", 131072, 16384, TK::GptLike, "grok"));
    register_model(make("grok-2-1212", 131072, 8192, TK::GptLike, "grok"));
    register_model(make("grok-2-vision-1212", 32768, 8192, TK::GptLike, "grok"));

    // Groq
    register_model(make("llama-3.3-70b-versatile", 128000, 8192, TK::GptLike, "groq"));
    register_model(make("llama-3.1-70b-versatile", 128000, 8192, TK::GptLike, "groq"));
    register_model(make("llama-3.1-8b-instant", 128000, 8192, TK::GptLike, "groq"));
    register_model(make("mixtral-8x7b-32768", 32768, 4096, TK::GptLike, "groq"));
    register_model(make("gemma2-9b-it", 8192, 4096, TK::GptLike, "groq"));
}

}  // namespace ctxpack::llm
