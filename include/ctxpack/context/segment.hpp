#pragma once

#include "ctxpack/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxpack::context {

using namespace ctxpack::core;

// Retention priority, highest first
enum class SegmentKind {
    System,
    Instructions,
    RepoContext,
    ChatHistory,
    ToolExchange,  // User messages carrying tool results
    Summary
};

std::string_view segment_kind_to_string(SegmentKind kind);
std::optional<SegmentKind> segment_kind_from_string(std::string_view str);

// Ordered group of messages. Immutable once appended to a thread, apart
// from the memoized token count.
struct ContextSegment {
    SegmentKind kind = SegmentKind::ChatHistory;
    std::vector<Message> messages;
    std::optional<int> token_count;
    uint64_t sequence = 0;  // Stamped by the owning thread

    static ContextSegment make(SegmentKind kind, std::vector<Message> messages) {
        ContextSegment seg;
        seg.kind = kind;
        seg.messages = std::move(messages);
        return seg;
    }

    static ContextSegment chat(std::vector<Message> messages) {
        return make(SegmentKind::ChatHistory, std::move(messages));
    }

    static ContextSegment tool_exchange(std::vector<Message> messages) {
        return make(SegmentKind::ToolExchange, std::move(messages));
    }

    static ContextSegment summary(std::string text) {
        return make(SegmentKind::Summary, {Message::user(std::move(text))});
    }

    bool is_empty() const;

    Json to_json() const;

    // nullopt when kind or messages are malformed
    static std::optional<ContextSegment> from_json(const Json& j);
};

}  // namespace ctxpack::context
