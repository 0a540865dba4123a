#include <catch2/catch_test_macros.hpp>
#include "ctxpack/llm/tokenizer.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace ctxpack::llm;
using namespace ctxpack::core;
using ctxpack::testing::TempDir;

namespace {

// a-z are ranks 0-25, then ' ', "he", "ll", "hell", " the", "!", "\n"
constexpr const char* kRankFile =
    "YQ== 0\nYg== 1\nYw== 2\nZA== 3\nZQ== 4\nZg== 5\nZw== 6\naA== 7\naQ== 8\nag== 9\n"
    "aw== 10\nbA== 11\nbQ== 12\nbg== 13\nbw== 14\ncA== 15\ncQ== 16\ncg== 17\ncw== 18\n"
    "dA== 19\ndQ== 20\ndg== 21\ndw== 22\neA== 23\neQ== 24\neg== 25\nIA== 26\naGU= 27\n"
    "bGw= 28\naGVsbA== 29\nIHRoZQ== 30\nIQ== 31\nCg== 32\n";

std::shared_ptr<const BpeEncoding> load_test_encoding(const TempDir& dir) {
    auto path = dir.write("test.tiktoken", kRankFile);
    auto result = BpeEncoding::load(path);
    REQUIRE(result.is_ok());
    return std::move(result).value();
}

std::vector<std::string> split_strings(std::string_view text) {
    std::vector<std::string> out;
    for (auto piece : BpeEncoding::split(text)) {
        out.emplace_back(piece);
    }
    return out;
}

}  // namespace

TEST_CASE("Heuristic count is ceil of code points over four", "[tokenizer]") {
    REQUIRE(heuristic_token_count("") == 0);
    REQUIRE(heuristic_token_count("abcd") == 1);
    REQUIRE(heuristic_token_count("abcde") == 2);
    REQUIRE(heuristic_token_count("h\xC3\xA9llo") == 2);  // 5 code points, 6 bytes
}

TEST_CASE("Pre-tokenizer splits like cl100k", "[tokenizer]") {
    using V = std::vector<std::string>;

    REQUIRE(split_strings("Hello world") == V{"Hello", " world"});
    REQUIRE(split_strings("I'm 12345") == V{"I", "'m", " ", "123", "45"});
    REQUIRE(split_strings("a  b") == V{"a", " ", " b"});
    REQUIRE(split_strings("x\n\ny") == V{"x", "\n\n", "y"});
    REQUIRE(split_strings("hi!!\n") == V{"hi", "!!\n"});
    REQUIRE(split_strings("end   ") == V{"end", "   "});
    REQUIRE(split_strings("we'LL go") == V{"we", "'LL", " go"});
    REQUIRE(split_strings("").empty());
}

TEST_CASE("Split pieces reassemble the input", "[tokenizer]") {
    const std::string text = "fn main() {\n    let x = 42; // caf\xC3\xA9\r\n}\n\n  ";
    std::string joined;
    for (auto piece : BpeEncoding::split(text)) {
        REQUIRE_FALSE(piece.empty());
        joined += piece;
    }
    REQUIRE(joined == text);
}

TEST_CASE("BPE merges by rank", "[tokenizer]") {
    TempDir dir;
    auto encoding = load_test_encoding(dir);

    REQUIRE(encoding->vocab_size() == 33);
    REQUIRE(encoding->encode("hello") == std::vector<int>{29, 14});
    REQUIRE(encoding->encode(" the") == std::vector<int>{30});
    REQUIRE(encoding->count("hellohello") == 4);
    REQUIRE(encoding->count("") == 0);
}

TEST_CASE("Bytes outside the vocabulary cost one token each", "[tokenizer]") {
    TempDir dir;
    auto encoding = load_test_encoding(dir);

    auto tokens = encoding->encode("\xC3\xA9");
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0] == BpeEncoding::kUnknownToken);
}

TEST_CASE("Encoding load errors", "[tokenizer]") {
    TempDir dir;

    auto missing = BpeEncoding::load(dir.path() / "nope.tiktoken");
    REQUIRE(missing.error().code == ErrorCode::EncodingNotFound);

    auto bad_rank = BpeEncoding::load(dir.write("bad.tiktoken", "YQ== zero\n"));
    REQUIRE(bad_rank.error().code == ErrorCode::EncodingParseFailed);

    auto bad_b64 = BpeEncoding::load(dir.write("bad64.tiktoken", "@@@ 1\n"));
    REQUIRE(bad_b64.error().code == ErrorCode::EncodingParseFailed);

    auto empty = BpeEncoding::load(dir.write("empty.tiktoken", "\n"));
    REQUIRE(empty.error().code == ErrorCode::EncodingParseFailed);
}

TEST_CASE("Message counting adds fixed overheads", "[tokenizer]") {
    auto catalog = std::make_shared<const ModelCatalog>();
    DefaultTokenCounter counter(catalog);

    REQUIRE_FALSE(counter.has_encoding());
    REQUIRE(counter.count_text("gpt-4o", "abcdefgh") == 2);

    // 4 per message, 3 once per call
    REQUIRE(counter.count_messages("gpt-4o", {Message::user("abcd")}) == 8);
    REQUIRE(counter.count_messages("gpt-4o", {Message::user("abcd"), Message::assistant("abcd")}) == 13);
    REQUIRE(counter.count_messages("gpt-4o", {}) == 3);

    SECTION("tool use counts name, arguments and structure") {
        Message msg{Role::Assistant, {ToolUseBlock{.id = "t1", .name = "read", .input = Json{{"p", 1}}}}};
        // "read" = 1, {"p":1} = 2, + 10
        REQUIRE(counter.count_messages("gpt-4o", {msg}) == 4 + 13 + 3);
    }

    SECTION("tool result content variants") {
        Message text{Role::User, {ToolResultBlock::text("t1", "abcd")}};
        REQUIRE(counter.count_messages("gpt-4o", {text}) == 4 + 11 + 3);

        Message payload{Role::User, {ToolResultBlock::json("t1", Json{{"a", 1}})}};
        REQUIRE(counter.count_messages("gpt-4o", {payload}) == 4 + 12 + 3);

        Message image{Role::User, {ToolResultBlock::image("t1", ImageContent{})}};
        REQUIRE(counter.count_messages("gpt-4o", {image}) == 4 + 1010 + 3);
    }

    SECTION("image and thinking blocks") {
        Message msg{Role::User, {ImageBlock{}, ThinkingBlock{"abcd"}}};
        REQUIRE(counter.count_messages("gpt-4o", {msg}) == 4 + 1000 + 1 + 3);
    }
}

TEST_CASE("Tool declaration counting", "[tokenizer]") {
    DefaultTokenCounter counter(std::make_shared<const ModelCatalog>());

    std::vector<ToolDefinition> tools{
        ToolDefinition{.name = "read", .description = "Read a file", .input_schema = Json::object()}
    };
    // 1 + 3 + "{}" 1 + 20
    REQUIRE(counter.count_tools("gpt-4o", tools) == 25);
    REQUIRE(counter.count_tools("gpt-4o", {}) == 0);
}

TEST_CASE("Overheads come from configuration", "[tokenizer]") {
    BudgetConfig overheads{.per_message_overhead = 0, .batch_boundary_overhead = 0, .image_tokens = 50};
    DefaultTokenCounter counter(std::make_shared<const ModelCatalog>(), overheads);

    REQUIRE(counter.count_messages("gpt-4o", {Message::user("abcd")}) == 1);
    REQUIRE(counter.count_messages("gpt-4o", {Message{Role::User, {ImageBlock{}}}}) == 50);
}

TEST_CASE("Tokenizer families share the encoding, unknown models use the heuristic", "[tokenizer]") {
    TempDir dir;
    DefaultTokenCounter counter(std::make_shared<const ModelCatalog>(), BudgetConfig{}, load_test_encoding(dir));

    REQUIRE(counter.has_encoding());
    REQUIRE(counter.count_text("gpt-4o", "hellohello") == 4);
    REQUIRE(counter.count_text("claude-sonnet-4-20250514", "hellohello") == 4);
    REQUIRE(counter.count_text("gemini-2.5-pro", "hellohello") == 4);
    REQUIRE(counter.count_text("mystery-model", "hellohello") == 3);
}
