#include "ctxpack/context/context_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <variant>

namespace ctxpack::context {

namespace {

int saturating_sub(int a, int b) {
    return a > b ? a - b : 0;
}

// Segments packed or dropped as a whole so a tool result never travels
// without its invocation
struct PackUnit {
    std::vector<const ContextSegment*> segments;
    int tokens = 0;
};

void collect_tool_ids(const ContextSegment& seg,
                      std::vector<std::string>& uses,
                      std::vector<std::string>& results) {
    for (const auto& msg : seg.messages) {
        for (const auto& block : msg.content) {
            if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
                uses.push_back(use->id);
            } else if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
                results.push_back(result->tool_use_id);
            }
        }
    }
}

// A unit opens at every segment except a tool exchange, which joins the unit
// before it. Tool results that answer a tool use in an earlier unit merge
// everything back to that unit, so a summary or repo context sitting inside
// a tool run cannot split it.
template<typename CountFn>
std::vector<PackUnit> make_pack_units(const std::vector<ContextSegment>& older, CountFn count) {
    std::vector<PackUnit> units;
    std::unordered_map<std::string, size_t> use_unit;

    for (const auto& seg : older) {
        if (seg.kind != SegmentKind::ToolExchange || units.empty()) {
            units.emplace_back();
        }

        std::vector<std::string> uses;
        std::vector<std::string> results;
        collect_tool_ids(seg, uses, results);

        size_t target = units.size() - 1;
        for (const auto& id : results) {
            if (auto it = use_unit.find(id); it != use_unit.end()) {
                target = std::min(target, it->second);
            }
        }

        while (units.size() - 1 > target) {
            PackUnit tail = std::move(units.back());
            units.pop_back();
            auto& into = units.back();
            into.segments.insert(into.segments.end(), tail.segments.begin(), tail.segments.end());
            into.tokens += tail.tokens;
        }
        for (auto& entry : use_unit) {
            entry.second = std::min(entry.second, target);
        }

        units.back().segments.push_back(&seg);
        units.back().tokens += count(seg);
        for (const auto& id : uses) {
            use_unit.insert_or_assign(id, target);
        }
    }
    return units;
}

}  // namespace

ContextManager::ContextManager(std::shared_ptr<const llm::ModelCatalog> catalog,
                               std::shared_ptr<const llm::TokenCounter> counter,
                               int safety_margin_percent)
    : catalog_(std::move(catalog))
    , counter_(std::move(counter))
    , safety_margin_percent_(std::clamp(safety_margin_percent, 0, 99))
{
}

int ContextManager::compute_budget(const llm::ModelInfo& info, std::optional<int> max_output_tokens) const {
    const int max_output = std::max(0, max_output_tokens.value_or(info.default_max_output_tokens));
    const int context = std::max(0, info.max_context_tokens);
    const int safety_buffer = static_cast<int>(static_cast<int64_t>(context) * safety_margin_percent_ / 100);
    return saturating_sub(saturating_sub(context, max_output), safety_buffer);
}

int ContextManager::count_segment(std::string_view model, const ContextSegment& segment) const {
    if (segment.token_count) {
        return *segment.token_count;
    }
    return counter_->count_messages(model, segment.messages);
}

LastTurnSplit ContextManager::split_last_turn(const std::vector<ContextSegment>& segments) {
    LastTurnSplit split;
    if (segments.empty()) {
        return split;
    }

    size_t boundary = segments.size();
    bool in_tool_sequence = false;

    for (size_t i = segments.size(); i-- > 0;) {
        const auto kind = segments[i].kind;

        if (kind == SegmentKind::ToolExchange) {
            in_tool_sequence = true;
            boundary = i;
            continue;
        }

        if (kind == SegmentKind::ChatHistory) {
            boundary = i;
            if (!in_tool_sequence) {
                break;
            }
            in_tool_sequence = false;
            continue;
        }

        // System, instructions, repo context and summaries end the turn
        // unless a tool run is still open
        if (!in_tool_sequence) {
            break;
        }
    }

    split.older.assign(segments.begin(), segments.begin() + static_cast<std::ptrdiff_t>(boundary));
    split.last_turn.assign(segments.begin() + static_cast<std::ptrdiff_t>(boundary), segments.end());
    return split;
}

BuiltContext ContextManager::build_request(const BuildContextParams& params) const {
    const llm::ModelInfo info = catalog_->info_for(params.model);
    const int max_output = std::max(0, params.max_output_tokens.value_or(info.default_max_output_tokens));
    const int budget = compute_budget(info, max_output);

    // Segment order is authoritative by sequence
    std::vector<ContextSegment> ordered = params.segments;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ContextSegment& a, const ContextSegment& b) { return a.sequence < b.sequence; });

    auto split = split_last_turn(ordered);

    auto count_system = [&](const std::optional<std::string>& prompt) {
        return prompt ? counter_->count_text(params.model, *prompt) : 0;
    };

    const int tools_tokens = counter_->count_tools(params.model, params.tools);

    int last_turn_tokens = 0;
    for (const auto& seg : split.last_turn) {
        last_turn_tokens += count_segment(params.model, seg);
    }

    std::optional<std::string> system = params.system_prompt;
    int system_tokens = count_system(system);
    bool used_short = false;

    if (system_tokens + tools_tokens + last_turn_tokens > budget) {
        system = params.short_system_prompt;
        system_tokens = count_system(system);
        used_short = true;
        spdlog::warn("Mandatory context exceeds budget of {} tokens for {}; using short system prompt",
                     budget, params.model);
    }

    int remaining = saturating_sub(budget, system_tokens + tools_tokens + last_turn_tokens);

    auto units = make_pack_units(split.older, [&](const ContextSegment& seg) {
        return count_segment(params.model, seg);
    });

    // Greedy, newest first. A unit that does not fit is skipped and older
    // ones are still considered.
    std::vector<const PackUnit*> included;
    size_t segments_included = 0;
    size_t segments_dropped = 0;

    for (auto it = units.rbegin(); it != units.rend(); ++it) {
        if (it->tokens <= remaining) {
            included.push_back(&*it);
            segments_included += it->segments.size();
            remaining -= it->tokens;
        } else {
            segments_dropped += it->segments.size();
        }
    }

    std::reverse(included.begin(), included.end());

    llm::LLMRequest request;
    request.model = params.model;
    request.system = std::move(system);
    request.tools = params.tools;
    request.max_tokens = max_output;
    request.stream = true;

    for (const auto* unit : included) {
        for (const auto* seg : unit->segments) {
            request.messages.insert(request.messages.end(), seg->messages.begin(), seg->messages.end());
        }
    }
    for (const auto& seg : split.last_turn) {
        request.messages.insert(request.messages.end(), seg.messages.begin(), seg.messages.end());
    }

    BuiltContext built;
    built.request = std::move(request);
    built.budget = budget;
    built.total_tokens = saturating_sub(budget, remaining);
    built.truncated = segments_dropped > 0;
    built.used_short_system_prompt = used_short;
    built.segments_included = segments_included + split.last_turn.size();
    built.segments_dropped = segments_dropped;

    if (built.truncated) {
        spdlog::info("Context for {} truncated: {} segments kept, {} dropped, {}/{} tokens",
                     params.model, built.segments_included, built.segments_dropped,
                     built.total_tokens, built.budget);
    } else {
        spdlog::debug("Context for {}: {} segments, {}/{} tokens",
                      params.model, built.segments_included, built.total_tokens, built.budget);
    }

    return built;
}

}  // namespace ctxpack::context
