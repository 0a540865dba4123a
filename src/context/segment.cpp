#include "ctxpack/context/segment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ctxpack::context {

std::string_view segment_kind_to_string(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::System: return "system";
        case SegmentKind::Instructions: return "instructions";
        case SegmentKind::RepoContext: return "repo_context";
        case SegmentKind::ChatHistory: return "chat_history";
        case SegmentKind::ToolExchange: return "tool_exchange";
        case SegmentKind::Summary: return "summary";
    }
    return "unknown";
}

std::optional<SegmentKind> segment_kind_from_string(std::string_view str) {
    if (str == "system") return SegmentKind::System;
    if (str == "instructions") return SegmentKind::Instructions;
    if (str == "repo_context") return SegmentKind::RepoContext;
    if (str == "chat_history") return SegmentKind::ChatHistory;
    if (str == "tool_exchange") return SegmentKind::ToolExchange;
    if (str == "summary") return SegmentKind::Summary;
    return std::nullopt;
}

bool ContextSegment::is_empty() const {
    return std::all_of(messages.begin(), messages.end(),
                       [](const Message& m) { return m.empty(); });
}

Json ContextSegment::to_json() const {
    Json msgs = Json::array();
    for (const auto& msg : messages) {
        msgs.push_back(msg.to_json());
    }

    return Json{
        {"kind", std::string(segment_kind_to_string(kind))},
        {"messages", std::move(msgs)},
        {"token_count", token_count ? Json(*token_count) : Json(nullptr)},
        {"sequence", sequence}
    };
}

std::optional<ContextSegment> ContextSegment::from_json(const Json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    if (!j.contains("kind") || !j["kind"].is_string()) {
        spdlog::warn("Segment has no string kind");
        return std::nullopt;
    }

    const std::string kind_name = j["kind"].get<std::string>();
    auto kind = segment_kind_from_string(kind_name);
    if (!kind) {
        spdlog::warn("Unknown segment kind '{}'", kind_name);
        return std::nullopt;
    }

    if (!j.contains("messages") || !j["messages"].is_array()) {
        return std::nullopt;
    }

    ContextSegment seg;
    seg.kind = *kind;

    if (j.contains("sequence")) {
        const Json& sequence = j["sequence"];
        const bool valid = sequence.is_number_unsigned() ||
                           (sequence.is_number_integer() && sequence.get<int64_t>() >= 0);
        if (!valid) {
            spdlog::warn("Segment sequence is not an unsigned integer");
            return std::nullopt;
        }
        seg.sequence = sequence.get<uint64_t>();
    }

    if (j.contains("token_count") && j["token_count"].is_number_integer()) {
        seg.token_count = j["token_count"].get<int>();
    }

    try {
        for (const auto& m : j["messages"]) {
            if (!m.is_object()) {
                return std::nullopt;
            }
            seg.messages.push_back(Message::from_json(m));
        }
    } catch (const Json::exception& e) {
        spdlog::warn("Malformed message in segment {}: {}", seg.sequence, e.what());
        return std::nullopt;
    }

    return seg;
}

}  // namespace ctxpack::context
