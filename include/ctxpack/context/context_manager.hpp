#pragma once

#include "ctxpack/context/segment.hpp"
#include "ctxpack/core/config.hpp"
#include "ctxpack/core/types.hpp"
#include "ctxpack/llm/model_catalog.hpp"
#include "ctxpack/llm/tokenizer.hpp"
#include "ctxpack/llm/transport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxpack::context {

using namespace ctxpack::core;

// Inputs for one build call
struct BuildContextParams {
    ModelId model;
    std::optional<std::string> system_prompt;
    std::optional<std::string> short_system_prompt;  // Used when the full prompt does not fit
    std::vector<ToolDefinition> tools;
    std::vector<ContextSegment> segments;
    std::optional<int> max_output_tokens;  // Overrides the model default
};

// Bounded request plus diagnostics
struct BuiltContext {
    llm::LLMRequest request;
    int total_tokens = 0;
    int budget = 0;
    bool truncated = false;
    bool used_short_system_prompt = false;
    size_t segments_included = 0;
    size_t segments_dropped = 0;
};

// Segments split at the last-turn boundary, both in original order
struct LastTurnSplit {
    std::vector<ContextSegment> older;
    std::vector<ContextSegment> last_turn;
};

// Packs an unbounded segment log into a request that fits the model window.
// Pure computation: never fails, performs no I/O.
class ContextManager {
public:
    ContextManager(std::shared_ptr<const llm::ModelCatalog> catalog,
                   std::shared_ptr<const llm::TokenCounter> counter,
                   int safety_margin_percent = 2);

    BuiltContext build_request(const BuildContextParams& params) const;

    // context - reserved output - margin, clamped at zero
    int compute_budget(const llm::ModelInfo& info, std::optional<int> max_output_tokens) const;

    // Memoized count when present
    int count_segment(std::string_view model, const ContextSegment& segment) const;

    // Trailing span kept regardless of budget: the latest chat turn and
    // every tool exchange that follows or interleaves with it.
    static LastTurnSplit split_last_turn(const std::vector<ContextSegment>& segments);

    int safety_margin_percent() const { return safety_margin_percent_; }

private:
    std::shared_ptr<const llm::ModelCatalog> catalog_;
    std::shared_ptr<const llm::TokenCounter> counter_;
    int safety_margin_percent_;
};

}  // namespace ctxpack::context
