#pragma once

#include "ctxpack/context/segment.hpp"
#include "ctxpack/core/result.hpp"
#include "ctxpack/core/types.hpp"
#include "ctxpack/llm/tokenizer.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ctxpack::memory {

using namespace ctxpack::core;
using context::ContextSegment;

// A conversation: an append-only log of segments ordered by sequence.
// The thread is the only writer of its segments.
class AgentThread {
public:
    explicit AgentThread(ModelId model = {});
    AgentThread(ThreadId id, ModelId model);

    // Accessors
    const ThreadId& id() const { return id_; }
    const std::string& title() const { return title_; }
    const ModelId& model() const { return model_; }
    const std::vector<ContextSegment>& segments() const { return segments_; }
    TimePoint created_at() const { return created_at_; }
    TimePoint updated_at() const { return updated_at_; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }

    // Stamps the segment with the next sequence and returns it. Any
    // sequence set by the caller is overwritten.
    uint64_t add_segment(ContextSegment segment);

    uint64_t peek_sequence() const { return next_sequence_; }

    // Drops every segment and restarts the sequence at zero
    void clear();

    // Cached counts are per model, so they are invalidated here
    void set_model(ModelId model);
    void set_title(std::string title);
    void set_metadata(const std::string& key, std::string value);
    std::optional<std::string> metadata_value(const std::string& key) const;

    // Fills missing segment token counts; returns how many were computed
    size_t memoize_token_counts(const llm::TokenCounter& counter);

    void touch();

    Json to_json() const;

    // Malformed segments are skipped with a warning
    static Result<AgentThread, Error> from_json(const Json& j);

private:
    ThreadId id_;
    std::string title_ = "New conversation";
    ModelId model_;
    std::vector<ContextSegment> segments_;
    TimePoint created_at_;
    TimePoint updated_at_;
    uint64_t next_sequence_ = 0;
    std::map<std::string, std::string> metadata_;

    friend size_t repair_orphaned_tool_results(AgentThread& thread);
};

// Listing row
struct ThreadSummary {
    ThreadId id;
    std::string title;
    ModelId model;
    TimePoint updated_at;
    size_t segment_count = 0;

    static ThreadSummary from_thread(const AgentThread& thread) {
        return ThreadSummary{
            .id = thread.id(),
            .title = thread.title(),
            .model = thread.model(),
            .updated_at = thread.updated_at(),
            .segment_count = thread.segments().size()
        };
    }

    Json to_json() const;
};

}  // namespace ctxpack::memory
