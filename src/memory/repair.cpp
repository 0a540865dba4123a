#include "ctxpack/memory/repair.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace ctxpack::memory {

size_t repair_orphaned_tool_results(AgentThread& thread) {
    std::unordered_set<std::string> tool_use_ids;
    for (const auto& seg : thread.segments_) {
        for (const auto& msg : seg.messages) {
            if (msg.role != Role::Assistant) continue;
            for (const auto& block : msg.content) {
                if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
                    tool_use_ids.insert(use->id);
                }
            }
        }
    }

    size_t removed = 0;
    for (auto& seg : thread.segments_) {
        size_t removed_here = 0;
        std::vector<bool> emptied(seg.messages.size(), false);
        for (size_t i = 0; i < seg.messages.size(); ++i) {
            auto& msg = seg.messages[i];
            if (msg.role != Role::User) continue;
            auto orphaned = [&](const ContentBlock& block) {
                const auto* result = std::get_if<ToolResultBlock>(&block);
                return result && !tool_use_ids.contains(result->tool_use_id);
            };
            const auto before = msg.content.size();
            msg.content.erase(std::remove_if(msg.content.begin(), msg.content.end(), orphaned),
                              msg.content.end());
            removed_here += before - msg.content.size();
            emptied[i] = before > 0 && msg.content.empty();
        }
        if (removed_here > 0) {
            // Messages left with no content are rejected by providers
            std::vector<Message> kept;
            kept.reserve(seg.messages.size());
            for (size_t i = 0; i < seg.messages.size(); ++i) {
                if (!emptied[i]) {
                    kept.push_back(std::move(seg.messages[i]));
                }
            }
            seg.messages = std::move(kept);
            seg.token_count.reset();
            removed += removed_here;
        }
    }

    const auto segments_before = thread.segments_.size();
    thread.segments_.erase(
        std::remove_if(thread.segments_.begin(), thread.segments_.end(),
                       [](const ContextSegment& seg) { return seg.is_empty(); }),
        thread.segments_.end());
    const auto segments_removed = segments_before - thread.segments_.size();

    if (removed > 0 || segments_removed > 0) {
        thread.touch();
        spdlog::warn("Thread {}: removed {} orphaned tool results and {} empty segments",
                     thread.id(), removed, segments_removed);
    }

    return removed;
}

}  // namespace ctxpack::memory
