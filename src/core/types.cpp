#include "ctxpack/core/types.hpp"

#include <spdlog/spdlog.h>

namespace ctxpack::core {

Json ImageContent::to_json() const {
    Json source{{"media_type", media_type}};
    if (source_kind == SourceKind::Url) {
        source["type"] = "url";
        source["url"] = data;
    } else {
        source["type"] = "base64";
        source["data"] = data;
    }
    return Json{
        {"type", "image"},
        {"source", source}
    };
}

ImageContent ImageContent::from_json(const Json& j) {
    ImageContent image;
    const Json source = j.value("source", Json::object());
    image.media_type = source.value("media_type", "");
    if (source.value("type", "base64") == "url") {
        image.source_kind = SourceKind::Url;
        image.data = source.value("url", "");
    } else {
        image.source_kind = SourceKind::Base64;
        image.data = source.value("data", "");
    }
    return image;
}

ToolResultBlock ToolResultBlock::text(std::string tool_use_id, std::string text, bool is_error) {
    ToolResultBlock block;
    block.tool_use_id = std::move(tool_use_id);
    block.content.emplace<std::string>(std::move(text));
    block.is_error = is_error;
    return block;
}

ToolResultBlock ToolResultBlock::json(std::string tool_use_id, Json payload) {
    ToolResultBlock block;
    block.tool_use_id = std::move(tool_use_id);
    block.content.emplace<Json>(std::move(payload));
    return block;
}

ToolResultBlock ToolResultBlock::image(std::string tool_use_id, ImageContent image) {
    ToolResultBlock block;
    block.tool_use_id = std::move(tool_use_id);
    block.content.emplace<ImageContent>(std::move(image));
    return block;
}

namespace {

Json tool_result_content_to_json(const ToolResultContent& content) {
    return std::visit(overloaded{
        [](const std::string& text) { return Json(text); },
        [](const Json& payload) { return Json{{"type", "json"}, {"value", payload}}; },
        [](const ImageContent& image) { return image.to_json(); }
    }, content);
}

ToolResultContent tool_result_content_from_json(const Json& j) {
    if (j.is_string()) {
        return ToolResultContent{std::in_place_type<std::string>, j.get<std::string>()};
    }
    if (j.is_object() && j.value("type", "") == "image") {
        return ToolResultContent{std::in_place_type<ImageContent>, ImageContent::from_json(j)};
    }
    if (j.is_object() && j.value("type", "") == "json") {
        return ToolResultContent{std::in_place_type<Json>, j.value("value", Json())};
    }
    return ToolResultContent{std::in_place_type<Json>, j};
}

}  // namespace

Json content_block_to_json(const ContentBlock& block) {
    return std::visit(overloaded{
        [](const TextBlock& b) {
            return Json{{"type", "text"}, {"text", b.text}};
        },
        [](const ThinkingBlock& b) {
            return Json{{"type", "thinking"}, {"thinking", b.text}};
        },
        [](const ImageBlock& b) {
            return b.image.to_json();
        },
        [](const ToolUseBlock& b) {
            return Json{
                {"type", "tool_use"},
                {"id", b.id},
                {"name", b.name},
                {"input", b.input}
            };
        },
        [](const ToolResultBlock& b) {
            return Json{
                {"type", "tool_result"},
                {"tool_use_id", b.tool_use_id},
                {"content", tool_result_content_to_json(b.content)},
                {"is_error", b.is_error}
            };
        }
    }, block);
}

std::optional<ContentBlock> content_block_from_json(const Json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    const std::string type = j.value("type", "");
    if (type == "text") {
        return TextBlock{j.value("text", "")};
    }
    if (type == "thinking") {
        return ThinkingBlock{j.value("thinking", "")};
    }
    if (type == "image") {
        return ImageBlock{ImageContent::from_json(j)};
    }
    if (type == "tool_use") {
        return ToolUseBlock{
            .id = j.value("id", ""),
            .name = j.value("name", ""),
            .input = j.value("input", Json::object())
        };
    }
    if (type == "tool_result") {
        ToolResultBlock block;
        block.tool_use_id = j.value("tool_use_id", "");
        block.content = tool_result_content_from_json(j.value("content", Json("")));
        block.is_error = j.value("is_error", false);
        return block;
    }
    return std::nullopt;
}

Json Message::to_json() const {
    Json blocks = Json::array();
    for (const auto& block : content) {
        blocks.push_back(content_block_to_json(block));
    }
    return Json{
        {"role", std::string(role_to_string(role))},
        {"content", blocks}
    };
}

Message Message::from_json(const Json& j) {
    Message m;
    m.role = role_from_string(j.value("role", "user"));

    const Json blocks = j.value("content", Json::array());
    if (blocks.is_string()) {
        m.content.push_back(TextBlock{blocks.get<std::string>()});
        return m;
    }

    for (const auto& item : blocks) {
        auto block = content_block_from_json(item);
        if (!block) {
            spdlog::warn("Skipping unknown content block type '{}'",
                item.is_object() ? item.value("type", "") : std::string("<non-object>"));
            continue;
        }
        m.content.push_back(std::move(*block));
    }
    return m;
}

}  // namespace ctxpack::core
