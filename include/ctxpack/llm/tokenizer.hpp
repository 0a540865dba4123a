#pragma once

#include "ctxpack/core/config.hpp"
#include "ctxpack/core/result.hpp"
#include "ctxpack/core/types.hpp"
#include "ctxpack/llm/model_catalog.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctxpack::llm {

using namespace ctxpack::core;
namespace fs = std::filesystem;

// Heterogeneous lookup so string_view slices need no copy
struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view s) const { return std::hash<std::string_view>{}(s); }
};

using RankMap = std::unordered_map<std::string, int, StringHash, std::equal_to<>>;

// Byte-level BPE in the tiktoken rank-file format. Lower rank merges first.
class BpeEncoding {
public:
    static constexpr int kUnknownToken = -1;

    explicit BpeEncoding(RankMap ranks);

    // One "<base64 token> <rank>" pair per line
    static Result<std::shared_ptr<const BpeEncoding>, Error> load(const fs::path& path);

    std::vector<int> encode(std::string_view text) const;
    int count(std::string_view text) const;

    size_t vocab_size() const { return ranks_.size(); }

    // cl100k-style pre-tokenization; pieces are views into text
    static std::vector<std::string_view> split(std::string_view text);

private:
    RankMap ranks_;

    void encode_piece(std::string_view piece, std::vector<int>& out) const;
    int rank_of(std::string_view bytes) const;
};

// ceil(code points / 4)
int heuristic_token_count(std::string_view text);

// Token estimate for text and structured content. Total: never fails.
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    virtual int count_text(std::string_view model, std::string_view text) const = 0;

    // Per-message overhead for each message plus one batch boundary overhead
    virtual int count_messages(std::string_view model, const std::vector<Message>& messages) const = 0;

    virtual int count_tools(std::string_view model, const std::vector<ToolDefinition>& tools) const = 0;
};

// Claude, GPT-like and Gemini share one BPE encoding as an approximation.
// Without an encoding every model uses the heuristic.
class DefaultTokenCounter : public TokenCounter {
public:
    DefaultTokenCounter(std::shared_ptr<const ModelCatalog> catalog,
                        BudgetConfig overheads = {},
                        std::shared_ptr<const BpeEncoding> encoding = nullptr);

    int count_text(std::string_view model, std::string_view text) const override;
    int count_messages(std::string_view model, const std::vector<Message>& messages) const override;
    int count_tools(std::string_view model, const std::vector<ToolDefinition>& tools) const override;

    bool has_encoding() const { return encoding_ != nullptr; }
    const BudgetConfig& overheads() const { return overheads_; }

private:
    std::shared_ptr<const ModelCatalog> catalog_;
    BudgetConfig overheads_;
    std::shared_ptr<const BpeEncoding> encoding_;

    int count_with(TokenizerKind kind, std::string_view text) const;
    int count_block(TokenizerKind kind, const ContentBlock& block) const;
};

}  // namespace ctxpack::llm
