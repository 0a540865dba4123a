#include "ctxpack/agent/session.hpp"
#include "ctxpack/memory/repair.hpp"

#include <spdlog/spdlog.h>

namespace ctxpack::agent {

AgentSession::AgentSession(std::shared_ptr<memory::ThreadStore> store,
                           std::shared_ptr<const context::ContextManager> context,
                           std::shared_ptr<const llm::TokenCounter> counter,
                           std::shared_ptr<llm::Transport> transport)
    : store_(std::move(store))
    , context_(std::move(context))
    , counter_(std::move(counter))
    , transport_(std::move(transport))
{
}

Error AgentSession::no_thread_error() const {
    return Error{ErrorCode::NoActiveThread, "No active thread; create or load one first"};
}

const memory::AgentThread& AgentSession::new_thread(ModelId model) {
    thread_.emplace(std::move(model));
    spdlog::info("Started thread {} ({})", thread_->id(), thread_->model());
    return *thread_;
}

Result<size_t, Error> AgentSession::load_thread(const ThreadId& id) {
    auto loaded = store_->get(id);
    if (loaded.is_err()) {
        return std::move(loaded).error();
    }

    memory::AgentThread thread = std::move(loaded).value();
    const size_t removed = memory::repair_orphaned_tool_results(thread);

    if (removed > 0) {
        auto saved = store_->save(thread);
        if (saved.is_err()) {
            spdlog::warn("Repaired thread {} could not be saved: {}", id, saved.error().full_message());
        }
    }

    thread_ = std::move(thread);
    spdlog::info("Loaded thread {} with {} segments", id, thread_->segments().size());
    return Result<size_t, Error>::ok(removed);
}

Result<void, Error> AgentSession::save_thread() {
    if (!thread_) {
        return no_thread_error();
    }
    return store_->save(*thread_);
}

Result<uint64_t, Error> AgentSession::append_segment(context::ContextSegment segment) {
    if (!thread_) {
        return no_thread_error();
    }
    return Result<uint64_t, Error>::ok(thread_->add_segment(std::move(segment)));
}

Result<uint64_t, Error> AgentSession::add_user_message(std::string text) {
    return append_segment(context::ContextSegment::chat({Message::user(std::move(text))}));
}

Result<uint64_t, Error> AgentSession::add_assistant_message(Message message) {
    message.role = Role::Assistant;
    return append_segment(context::ContextSegment::chat({std::move(message)}));
}

Result<uint64_t, Error> AgentSession::add_tool_results(std::vector<ToolResultBlock> results) {
    std::vector<ContentBlock> blocks;
    blocks.reserve(results.size());
    for (auto& result : results) {
        blocks.emplace_back(std::move(result));
    }
    return append_segment(context::ContextSegment::tool_exchange({Message{Role::User, std::move(blocks)}}));
}

Result<context::BuiltContext, Error> AgentSession::build_request() {
    if (!thread_) {
        return no_thread_error();
    }

    thread_->memoize_token_counts(*counter_);

    context::BuildContextParams params{
        .model = thread_->model(),
        .system_prompt = prompts_.system_prompt,
        .short_system_prompt = prompts_.short_system_prompt,
        .tools = prompts_.tools,
        .segments = thread_->segments(),
        .max_output_tokens = prompts_.max_output_tokens
    };

    return Result<context::BuiltContext, Error>::ok(context_->build_request(params));
}

Result<context::BuiltContext, Error> AgentSession::send(llm::StreamCallback on_event) {
    if (!transport_) {
        return Error{ErrorCode::TransportUnavailable, "No transport configured"};
    }

    auto built = build_request();
    if (built.is_err()) {
        return built;
    }

    if (built.value().truncated) {
        spdlog::warn("Sending truncated context for thread {}: {} segments dropped",
                     thread_->id(), built.value().segments_dropped);
    }

    auto sent = transport_->send(built.value().request, std::move(on_event));
    if (sent.is_err()) {
        spdlog::error("Transport {} failed: {}", transport_->name(), sent.error().full_message());
        return std::move(sent).error();
    }

    return built;
}

}  // namespace ctxpack::agent
