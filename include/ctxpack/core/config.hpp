#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ctxpack::core {

namespace fs = std::filesystem;

// Budget arithmetic and token-accounting overheads
struct BudgetConfig {
    int safety_margin_percent = 2;

    int per_message_overhead = 4;      // Role and formatting per message
    int batch_boundary_overhead = 3;   // Once per count_messages call
    int tool_use_overhead = 10;
    int tool_result_overhead = 10;
    int image_tokens = 1000;
    int per_tool_overhead = 20;        // Per declared tool
};

// BPE encoding shared by the Claude, GPT-like and Gemini families
struct TokenizerConfig {
    fs::path encoding_path = "~/.ctxpack/encodings/cl100k_base.tiktoken";
};

// Thread persistence
struct StoreConfig {
    std::string backend = "disk";  // disk | memory
    fs::path threads_path = "~/.ctxpack/threads";
    int lock_timeout_ms = 5000;
};

// Additional catalog entry
struct ModelEntryConfig {
    std::string name;
    int max_context_tokens = 128000;
    int default_max_output_tokens = 4096;
    std::string tokenizer = "heuristic";  // claude | gpt | gemini | heuristic
    std::string provider = "custom";
    bool supports_tools = true;
    bool supports_thinking = false;
};

struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path;               // Empty: console only
};

// Main configuration
struct Config {
    BudgetConfig budget;
    TokenizerConfig tokenizer;
    StoreConfig store;
    std::vector<ModelEntryConfig> models;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    Result<void, Error> save(const fs::path& path) const;

    static fs::path default_path();

    // Expand ~ and environment variables in paths
    void expand_paths();

    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace ctxpack::core
