#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ctxpack::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using ThreadId = std::string;
using ModelId = std::string;

// Visitor helper for std::visit over content variants
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

// Message roles. System text travels separately in the request.
enum class Role {
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

inline Role role_from_string(std::string_view str) {
    if (str == "assistant") return Role::Assistant;
    return Role::User;
}

// Image payload, either inline base64 or a URL
struct ImageContent {
    enum class SourceKind {
        Base64,
        Url
    };

    SourceKind source_kind = SourceKind::Base64;
    std::string data;        // Base64 data or URL
    std::string media_type;  // e.g. "image/png"

    Json to_json() const;
    static ImageContent from_json(const Json& j);
};

struct TextBlock {
    std::string text;
};

struct ThinkingBlock {
    std::string text;
};

struct ImageBlock {
    ImageContent image;
};

// Assistant request to invoke a tool
struct ToolUseBlock {
    std::string id;
    std::string name;
    Json input = Json::object();
};

// Tool output: plain text, a structured payload, or an image
using ToolResultContent = std::variant<std::string, Json, ImageContent>;

// Result sent back for a ToolUseBlock with the matching id
struct ToolResultBlock {
    std::string tool_use_id;
    ToolResultContent content{std::in_place_type<std::string>};
    bool is_error = false;

    static ToolResultBlock text(std::string tool_use_id, std::string text, bool is_error = false);
    static ToolResultBlock json(std::string tool_use_id, Json payload);
    static ToolResultBlock image(std::string tool_use_id, ImageContent image);
};

using ContentBlock = std::variant<TextBlock, ThinkingBlock, ImageBlock, ToolUseBlock, ToolResultBlock>;

Json content_block_to_json(const ContentBlock& block);

// Returns nullopt for block types this build does not know
std::optional<ContentBlock> content_block_from_json(const Json& j);

// Message structure
struct Message {
    Role role = Role::User;
    std::vector<ContentBlock> content;

    Message() = default;
    Message(Role r, std::vector<ContentBlock> blocks)
        : role(r), content(std::move(blocks)) {}

    static Message user(std::string text) {
        return Message{Role::User, {TextBlock{std::move(text)}}};
    }

    static Message assistant(std::string text) {
        return Message{Role::Assistant, {TextBlock{std::move(text)}}};
    }

    bool empty() const { return content.empty(); }

    Json to_json() const;
    static Message from_json(const Json& j);
};

// Tool declaration offered to the model
struct ToolDefinition {
    std::string name;
    std::string description;
    Json input_schema = Json::object();

    Json to_json() const {
        return Json{
            {"name", name},
            {"description", description},
            {"input_schema", input_schema}
        };
    }

    static ToolDefinition from_json(const Json& j) {
        return ToolDefinition{
            .name = j.value("name", ""),
            .description = j.value("description", ""),
            .input_schema = j.value("input_schema", Json::object())
        };
    }
};

// Milliseconds since epoch, the on-disk time format
inline int64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_millis(int64_t ms) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace ctxpack::core
