#include "ctxpack/memory/thread.hpp"
#include "ctxpack/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ctxpack::memory {

AgentThread::AgentThread(ModelId model)
    : AgentThread(generate_thread_id(), std::move(model))
{
}

AgentThread::AgentThread(ThreadId id, ModelId model)
    : id_(std::move(id))
    , model_(std::move(model))
    , created_at_(Clock::now())
    , updated_at_(created_at_)
{
}

uint64_t AgentThread::add_segment(ContextSegment segment) {
    const uint64_t seq = next_sequence_++;
    segment.sequence = seq;
    segments_.push_back(std::move(segment));
    touch();
    return seq;
}

void AgentThread::clear() {
    segments_.clear();
    next_sequence_ = 0;
    touch();
}

void AgentThread::set_model(ModelId model) {
    if (model != model_) {
        for (auto& seg : segments_) {
            seg.token_count.reset();
        }
    }
    model_ = std::move(model);
    touch();
}

void AgentThread::set_title(std::string title) {
    title_ = std::move(title);
    touch();
}

void AgentThread::set_metadata(const std::string& key, std::string value) {
    metadata_[key] = std::move(value);
    touch();
}

std::optional<std::string> AgentThread::metadata_value(const std::string& key) const {
    auto it = metadata_.find(key);
    if (it == metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t AgentThread::memoize_token_counts(const llm::TokenCounter& counter) {
    size_t computed = 0;
    for (auto& seg : segments_) {
        if (!seg.token_count) {
            seg.token_count = counter.count_messages(model_, seg.messages);
            ++computed;
        }
    }
    return computed;
}

void AgentThread::touch() {
    updated_at_ = Clock::now();
}

Json AgentThread::to_json() const {
    Json segs = Json::array();
    for (const auto& seg : segments_) {
        segs.push_back(seg.to_json());
    }

    return Json{
        {"id", id_},
        {"title", title_},
        {"model", model_},
        {"segments", std::move(segs)},
        {"created_at", to_unix_millis(created_at_)},
        {"updated_at", to_unix_millis(updated_at_)},
        {"next_sequence", next_sequence_},
        {"metadata", metadata_}
    };
}

Result<AgentThread, Error> AgentThread::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return Result<AgentThread, Error>::err(ErrorCode::ThreadCorrupted, "Thread has no id");
    }

    try {
        AgentThread thread(j["id"].get<std::string>(), j.value("model", ""));
        thread.title_ = j.value("title", "New conversation");
        thread.created_at_ = from_unix_millis(j.value("created_at", int64_t{0}));
        thread.updated_at_ = from_unix_millis(j.value("updated_at", int64_t{0}));
        thread.next_sequence_ = j.value("next_sequence", uint64_t{0});

        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (const auto& [key, value] : j["metadata"].items()) {
                if (value.is_string()) {
                    thread.metadata_[key] = value.get<std::string>();
                }
            }
        }

        const Json segs = j.value("segments", Json::array());
        size_t index = 0;
        for (const auto& item : segs) {
            auto seg = ContextSegment::from_json(item);
            if (!seg) {
                spdlog::warn("Thread {}: skipping malformed segment at index {}", thread.id_, index);
            } else {
                thread.segments_.push_back(std::move(*seg));
            }
            ++index;
        }

        std::stable_sort(thread.segments_.begin(), thread.segments_.end(),
                         [](const ContextSegment& a, const ContextSegment& b) { return a.sequence < b.sequence; });

        // Keep the counter ahead of every stored sequence
        if (!thread.segments_.empty()) {
            thread.next_sequence_ = std::max(thread.next_sequence_, thread.segments_.back().sequence + 1);
        }

        return Result<AgentThread, Error>::ok(std::move(thread));

    } catch (const Json::exception& e) {
        return Result<AgentThread, Error>::err(ErrorCode::ThreadCorrupted, e.what(), j["id"].get<std::string>());
    }
}

Json ThreadSummary::to_json() const {
    return Json{
        {"id", id},
        {"title", title},
        {"model", model},
        {"updated_at", to_unix_millis(updated_at)},
        {"segment_count", segment_count}
    };
}

}  // namespace ctxpack::memory
