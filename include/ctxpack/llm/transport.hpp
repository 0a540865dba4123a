#pragma once

#include "ctxpack/core/result.hpp"
#include "ctxpack/core/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctxpack::llm {

using namespace ctxpack::core;

// Bounded request handed to a provider transport
struct LLMRequest {
    ModelId model;
    std::optional<std::string> system;
    std::vector<Message> messages;
    std::vector<ToolDefinition> tools;
    std::optional<int> max_tokens;
    std::optional<float> temperature;
    bool stream = true;

    // Provider-specific options
    Json extra = Json::object();

    Json to_json() const;
};

// Incremental output from a transport
struct StreamEvent {
    enum class Type {
        TextDelta,
        ThinkingDelta,
        ToolUse,
        Usage,
        Done
    };

    Type type = Type::TextDelta;
    std::string text;
    Json data;  // ToolUse block or usage counters
};

using StreamCallback = std::function<void(const StreamEvent& event)>;

// Provider client boundary. Implementations own connection handling and
// report failures through the result, never by throwing.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::string name() const = 0;

    virtual Result<void, Error> send(const LLMRequest& request, StreamCallback on_event) = 0;
};

}  // namespace ctxpack::llm
