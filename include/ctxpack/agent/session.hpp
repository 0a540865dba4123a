#pragma once

#include "ctxpack/context/context_manager.hpp"
#include "ctxpack/core/result.hpp"
#include "ctxpack/core/types.hpp"
#include "ctxpack/llm/transport.hpp"
#include "ctxpack/memory/thread.hpp"
#include "ctxpack/memory/thread_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxpack::agent {

using namespace ctxpack::core;

// Prompt material shared by every request of a session
struct SessionPrompts {
    std::optional<std::string> system_prompt;
    std::optional<std::string> short_system_prompt;
    std::vector<ToolDefinition> tools;
    std::optional<int> max_output_tokens;
};

// Drives one active thread: appends turns, builds bounded requests and
// persists through the store.
class AgentSession {
public:
    AgentSession(std::shared_ptr<memory::ThreadStore> store,
                 std::shared_ptr<const context::ContextManager> context,
                 std::shared_ptr<const llm::TokenCounter> counter,
                 std::shared_ptr<llm::Transport> transport = nullptr);

    // Thread lifecycle
    const memory::AgentThread& new_thread(ModelId model);

    // Repairs the loaded thread and saves it back when anything was removed.
    // Returns the number of tool results removed.
    Result<size_t, Error> load_thread(const ThreadId& id);

    Result<void, Error> save_thread();

    bool has_thread() const { return thread_.has_value(); }
    const memory::AgentThread* thread() const { return thread_ ? &*thread_ : nullptr; }

    // Appending. Each returns the assigned sequence.
    Result<uint64_t, Error> append_segment(context::ContextSegment segment);
    Result<uint64_t, Error> add_user_message(std::string text);
    Result<uint64_t, Error> add_assistant_message(Message message);
    Result<uint64_t, Error> add_tool_results(std::vector<ToolResultBlock> results);

    void set_prompts(SessionPrompts prompts) { prompts_ = std::move(prompts); }
    const SessionPrompts& prompts() const { return prompts_; }

    // Memoizes segment counts on the thread, then packs
    Result<context::BuiltContext, Error> build_request();

    // Builds and hands the request to the transport
    Result<context::BuiltContext, Error> send(llm::StreamCallback on_event);

private:
    std::shared_ptr<memory::ThreadStore> store_;
    std::shared_ptr<const context::ContextManager> context_;
    std::shared_ptr<const llm::TokenCounter> counter_;
    std::shared_ptr<llm::Transport> transport_;

    std::optional<memory::AgentThread> thread_;
    SessionPrompts prompts_;

    Error no_thread_error() const;
};

}  // namespace ctxpack::agent
