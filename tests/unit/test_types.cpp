#include <catch2/catch_test_macros.hpp>
#include "ctxpack/core/types.hpp"

using namespace ctxpack::core;

TEST_CASE("Message factories set role and text", "[types]") {
    auto user = Message::user("hello");
    auto assistant = Message::assistant("hi");

    REQUIRE(user.role == Role::User);
    REQUIRE(assistant.role == Role::Assistant);
    REQUIRE(std::get<TextBlock>(user.content[0]).text == "hello");
    REQUIRE_FALSE(user.empty());
    REQUIRE(Message{Role::User, {}}.empty());
}

TEST_CASE("Tool blocks serialize in the wire layout", "[types]") {
    Message msg{Role::Assistant, {
        TextBlock{"Looking"},
        ToolUseBlock{.id = "tu_1", .name = "read_file", .input = Json{{"path", "a.txt"}}}
    }};

    Json j = msg.to_json();
    REQUIRE(j["role"] == "assistant");
    REQUIRE(j["content"][1]["type"] == "tool_use");
    REQUIRE(j["content"][1]["input"]["path"] == "a.txt");

    auto back = Message::from_json(j);
    REQUIRE(back.role == Role::Assistant);
    REQUIRE(back.content.size() == 2);
    REQUIRE(std::get<ToolUseBlock>(back.content[1]).name == "read_file");
}

TEST_CASE("Tool result content variants survive JSON", "[types]") {
    Message msg{Role::User, {
        ToolResultBlock::text("a", "done", true),
        ToolResultBlock::json("b", Json{{"lines", 3}}),
        ToolResultBlock::image("c", ImageContent{.source_kind = ImageContent::SourceKind::Url,
                                                  .data = "https://example.com/x.png",
                                                  .media_type = "image/png"})
    }};

    auto back = Message::from_json(msg.to_json());
    REQUIRE(back.content.size() == 3);

    const auto& text = std::get<ToolResultBlock>(back.content[0]);
    REQUIRE(text.is_error);
    REQUIRE(std::get<std::string>(text.content) == "done");

    const auto& payload = std::get<ToolResultBlock>(back.content[1]);
    REQUIRE(std::get<Json>(payload.content)["lines"] == 3);

    const auto& image = std::get<ToolResultBlock>(back.content[2]);
    REQUIRE(std::get<ImageContent>(image.content).source_kind == ImageContent::SourceKind::Url);
}

TEST_CASE("Message parsing tolerates string content and unknown blocks", "[types]") {
    auto plain = Message::from_json(Json{{"role", "user"}, {"content", "just text"}});
    REQUIRE(std::get<TextBlock>(plain.content[0]).text == "just text");

    Json j = {
        {"role", "assistant"},
        {"content", Json::array({
            Json{{"type", "hologram"}},
            Json{{"type", "thinking"}, {"thinking", "hmm"}}
        })}
    };
    auto parsed = Message::from_json(j);
    REQUIRE(parsed.content.size() == 1);
    REQUIRE(std::get<ThinkingBlock>(parsed.content[0]).text == "hmm");
}
