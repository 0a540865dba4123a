#include <catch2/catch_test_macros.hpp>
#include "ctxpack/context/segment.hpp"

using namespace ctxpack::context;
using namespace ctxpack::core;

TEST_CASE("Segment kinds map to stable names", "[segment]") {
    for (auto kind : {SegmentKind::System, SegmentKind::Instructions, SegmentKind::RepoContext,
                      SegmentKind::ChatHistory, SegmentKind::ToolExchange, SegmentKind::Summary}) {
        REQUIRE(segment_kind_from_string(segment_kind_to_string(kind)) == kind);
    }
    REQUIRE_FALSE(segment_kind_from_string("history").has_value());
}

TEST_CASE("Segment factories", "[segment]") {
    auto chat = ContextSegment::chat({Message::user("hi")});
    REQUIRE(chat.kind == SegmentKind::ChatHistory);
    REQUIRE_FALSE(chat.token_count.has_value());

    auto tools = ContextSegment::tool_exchange({Message{Role::User, {ToolResultBlock::text("t", "ok")}}});
    REQUIRE(tools.kind == SegmentKind::ToolExchange);

    auto summary = ContextSegment::summary("earlier we talked");
    REQUIRE(summary.kind == SegmentKind::Summary);
    REQUIRE(summary.messages.size() == 1);
}

TEST_CASE("Segment emptiness", "[segment]") {
    REQUIRE(ContextSegment::chat({}).is_empty());
    REQUIRE(ContextSegment::chat({Message{Role::User, {}}}).is_empty());
    REQUIRE_FALSE(ContextSegment::chat({Message::user("x")}).is_empty());
}

TEST_CASE("Segment JSON keeps kind, sequence and cached count", "[segment]") {
    auto seg = ContextSegment::tool_exchange({Message{Role::User, {ToolResultBlock::text("t1", "ok")}}});
    seg.sequence = 7;
    seg.token_count = 21;

    auto back = ContextSegment::from_json(seg.to_json());
    REQUIRE(back.has_value());
    REQUIRE(back->kind == SegmentKind::ToolExchange);
    REQUIRE(back->sequence == 7);
    REQUIRE(back->token_count == 21);
    REQUIRE(std::get<ToolResultBlock>(back->messages[0].content[0]).tool_use_id == "t1");
}

TEST_CASE("Malformed segments are rejected", "[segment]") {
    REQUIRE_FALSE(ContextSegment::from_json(Json::array()).has_value());
    REQUIRE_FALSE(ContextSegment::from_json(Json{{"kind", "bogus"}, {"messages", Json::array()}}).has_value());
    REQUIRE_FALSE(ContextSegment::from_json(Json{{"kind", "chat_history"}}).has_value());
    REQUIRE_FALSE(ContextSegment::from_json(
        Json{{"kind", "chat_history"}, {"messages", Json::array({Json{{"role", 5}}})}}).has_value());
}

TEST_CASE("Wrongly typed kind or sequence is rejected without throwing", "[segment]") {
    REQUIRE_FALSE(ContextSegment::from_json(Json{{"kind", 7}, {"messages", Json::array()}}).has_value());
    REQUIRE_FALSE(ContextSegment::from_json(
        Json{{"kind", "chat_history"}, {"messages", Json::array()}, {"sequence", "5"}}).has_value());
    REQUIRE_FALSE(ContextSegment::from_json(
        Json{{"kind", "chat_history"}, {"messages", Json::array()}, {"sequence", -1}}).has_value());

    auto parsed = ContextSegment::from_json(
        Json{{"kind", "chat_history"}, {"messages", Json::array()}, {"sequence", 5}});
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->sequence == 5);
}
