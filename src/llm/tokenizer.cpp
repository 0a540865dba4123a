#include "ctxpack/llm/tokenizer.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace ctxpack::llm {

namespace {

struct CodePoint {
    uint32_t value;
    size_t len;
};

// Invalid sequences decode as a single byte
CodePoint decode_at(std::string_view s, size_t i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
        return {c, 1};
    }

    size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;

    if (len == 1 || i + len > s.size()) {
        return {c, 1};
    }

    uint32_t value = c & (0x7F >> len);
    for (size_t k = 1; k < len; ++k) {
        const auto cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) {
            return {c, 1};
        }
        value = (value << 6) | (cc & 0x3F);
    }
    return {value, len};
}

enum class CharClass {
    Letter,
    Number,
    Newline,
    Space,
    Other
};

// Coarse Unicode classes: ASCII is exact, most non-ASCII counts as letters
CharClass classify(uint32_t cp) {
    if (cp == '\n' || cp == '\r') return CharClass::Newline;
    if (cp == ' ' || cp == '\t' || cp == '\v' || cp == '\f') return CharClass::Space;
    if (cp < 0x80) {
        if (std::isalpha(static_cast<int>(cp))) return CharClass::Letter;
        if (std::isdigit(static_cast<int>(cp))) return CharClass::Number;
        return CharClass::Other;
    }
    if (cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
        cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000) {
        return CharClass::Space;
    }
    if (cp < 0xC0) return CharClass::Other;                      // Latin-1 punctuation
    if (cp >= 0x2000 && cp <= 0x2BFF) return CharClass::Other;   // Punctuation, arrows, symbols
    if (cp >= 0x3000 && cp <= 0x303F) return CharClass::Other;   // CJK punctuation
    if (cp >= 0xFF00 && cp <= 0xFF0F) return CharClass::Other;   // Fullwidth punctuation
    if (cp >= 0x1F000) return CharClass::Other;                  // Emoji
    return CharClass::Letter;
}

bool is_whitespace(CharClass c) {
    return c == CharClass::Space || c == CharClass::Newline;
}

// Length of 's 'd 'm 't 'll 've 're after the apostrophe, 0 if none
size_t contraction_length(std::string_view text, size_t pos) {
    if (pos >= text.size()) return 0;
    const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
    if (a == 's' || a == 'd' || a == 'm' || a == 't') return 1;
    if (pos + 1 >= text.size()) return 0;
    const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos + 1])));
    if ((a == 'l' && b == 'l') || (a == 'v' && b == 'e') || (a == 'r' && b == 'e')) return 2;
    return 0;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<std::string> base64_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : in) {
        if (c == '=') break;
        const int v = base64_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

}  // namespace

int heuristic_token_count(std::string_view text) {
    size_t code_points = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++code_points;
        }
    }
    return static_cast<int>((code_points + 3) / 4);
}

// BpeEncoding
BpeEncoding::BpeEncoding(RankMap ranks)
    : ranks_(std::move(ranks))
{
}

Result<std::shared_ptr<const BpeEncoding>, Error> BpeEncoding::load(const fs::path& path) {
    using R = Result<std::shared_ptr<const BpeEncoding>, Error>;

    if (!fs::exists(path)) {
        return R::err(ErrorCode::EncodingNotFound, "Tokenizer encoding file not found", path.string());
    }

    std::ifstream file(path);
    if (!file) {
        return R::err(ErrorCode::FileReadFailed, "Failed to open encoding file", path.string());
    }

    RankMap ranks;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;

        std::istringstream fields(line);
        std::string token_b64;
        int rank = -1;
        if (!(fields >> token_b64 >> rank) || rank < 0) {
            return R::err(ErrorCode::EncodingParseFailed,
                          "Malformed rank entry at line " + std::to_string(line_no),
                          path.string());
        }

        auto token = base64_decode(token_b64);
        if (!token || token->empty()) {
            return R::err(ErrorCode::EncodingParseFailed,
                          "Invalid base64 token at line " + std::to_string(line_no),
                          path.string());
        }
        ranks.insert_or_assign(std::move(*token), rank);
    }

    if (ranks.empty()) {
        return R::err(ErrorCode::EncodingParseFailed, "Encoding file has no ranks", path.string());
    }

    spdlog::info("Loaded BPE encoding with {} ranks from {}", ranks.size(), path.string());
    return R::ok(std::make_shared<const BpeEncoding>(std::move(ranks)));
}

int BpeEncoding::rank_of(std::string_view bytes) const {
    auto it = ranks_.find(bytes);
    return it == ranks_.end() ? kUnknownToken : it->second;
}

std::vector<std::string_view> BpeEncoding::split(std::string_view text) {
    std::vector<std::string_view> pieces;
    const size_t n = text.size();
    size_t i = 0;

    auto class_at = [&](size_t pos) { return classify(decode_at(text, pos).value); };
    auto len_at = [&](size_t pos) { return decode_at(text, pos).len; };
    auto emit = [&](size_t end) {
        pieces.push_back(text.substr(i, end - i));
        i = end;
    };

    while (i < n) {
        const CodePoint cp = decode_at(text, i);
        const CharClass cls = classify(cp.value);

        // 's 'd 'm 't 'll 've 're
        if (cp.value == '\'') {
            if (size_t len = contraction_length(text, i + 1)) {
                emit(i + 1 + len);
                continue;
            }
        }

        // Letter run with one optional non-letter, non-digit, non-newline prefix
        if (cls == CharClass::Letter ||
            (cls != CharClass::Number && cls != CharClass::Newline &&
             i + cp.len < n && class_at(i + cp.len) == CharClass::Letter)) {
            size_t j = (cls == CharClass::Letter) ? i : i + cp.len;
            while (j < n && class_at(j) == CharClass::Letter) {
                j += len_at(j);
            }
            emit(j);
            continue;
        }

        // Up to three digits
        if (cls == CharClass::Number) {
            size_t j = i;
            for (int k = 0; k < 3 && j < n && class_at(j) == CharClass::Number; ++k) {
                j += len_at(j);
            }
            emit(j);
            continue;
        }

        // Optional space, punctuation run, trailing newlines
        {
            size_t j = i;
            if (cp.value == ' ' && i + 1 < n && class_at(i + 1) == CharClass::Other) {
                j = i + 1;
            }
            if (class_at(j) == CharClass::Other) {
                while (j < n && class_at(j) == CharClass::Other) {
                    j += len_at(j);
                }
                while (j < n && class_at(j) == CharClass::Newline) {
                    j += len_at(j);
                }
                emit(j);
                continue;
            }
        }

        // Whitespace run
        size_t run_end = i;
        size_t last_start = i;
        size_t newline_end = std::string_view::npos;
        while (run_end < n && is_whitespace(class_at(run_end))) {
            const bool newline = class_at(run_end) == CharClass::Newline;
            last_start = run_end;
            run_end += len_at(run_end);
            if (newline) {
                newline_end = run_end;
            }
        }

        if (newline_end != std::string_view::npos) {
            emit(newline_end);           // up to the last newline
        } else if (run_end == n || last_start == i) {
            emit(run_end);
        } else {
            emit(last_start);            // last space joins the next piece
        }
    }

    return pieces;
}

void BpeEncoding::encode_piece(std::string_view piece, std::vector<int>& out) const {
    if (piece.empty()) {
        return;
    }
    if (int rank = rank_of(piece); rank != kUnknownToken) {
        out.push_back(rank);
        return;
    }

    constexpr int kNoMerge = std::numeric_limits<int>::max();

    // (start offset, rank of merging this part with the next)
    std::vector<std::pair<size_t, int>> parts;
    parts.reserve(piece.size() + 1);
    for (size_t i = 0; i + 1 < piece.size(); ++i) {
        const int rank = rank_of(piece.substr(i, 2));
        parts.emplace_back(i, rank == kUnknownToken ? kNoMerge : rank);
    }
    parts.emplace_back(piece.size() - 1, kNoMerge);
    parts.emplace_back(piece.size(), kNoMerge);

    // Rank of the token parts[i] would form after parts[i + 1] is merged away
    auto merged_rank = [&](size_t i) {
        if (i + 3 >= parts.size()) {
            return kNoMerge;
        }
        const size_t begin = parts[i].first;
        const int rank = rank_of(piece.substr(begin, parts[i + 3].first - begin));
        return rank == kUnknownToken ? kNoMerge : rank;
    };

    while (parts.size() > 1) {
        int min_rank = kNoMerge;
        size_t min_i = 0;
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            if (parts[i].second < min_rank) {
                min_rank = parts[i].second;
                min_i = i;
            }
        }
        if (min_rank == kNoMerge) {
            break;
        }

        parts[min_i].second = merged_rank(min_i);
        if (min_i > 0) {
            parts[min_i - 1].second = merged_rank(min_i - 1);
        }
        parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(min_i) + 1);
    }

    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const auto token = piece.substr(parts[i].first, parts[i + 1].first - parts[i].first);
        if (int rank = rank_of(token); rank != kUnknownToken) {
            out.push_back(rank);
            continue;
        }
        // Bytes outside the vocabulary cost one token each
        for (size_t b = 0; b < token.size(); ++b) {
            out.push_back(rank_of(token.substr(b, 1)));
        }
    }
}

std::vector<int> BpeEncoding::encode(std::string_view text) const {
    std::vector<int> tokens;
    tokens.reserve(text.size() / 3 + 1);
    for (auto piece : split(text)) {
        encode_piece(piece, tokens);
    }
    return tokens;
}

int BpeEncoding::count(std::string_view text) const {
    return static_cast<int>(encode(text).size());
}

// DefaultTokenCounter
DefaultTokenCounter::DefaultTokenCounter(std::shared_ptr<const ModelCatalog> catalog,
                                         BudgetConfig overheads,
                                         std::shared_ptr<const BpeEncoding> encoding)
    : catalog_(std::move(catalog))
    , overheads_(overheads)
    , encoding_(std::move(encoding))
{
    if (!catalog_) {
        catalog_ = std::make_shared<const ModelCatalog>();
    }
    if (!encoding_) {
        spdlog::debug("No BPE encoding loaded; all models use the character heuristic");
    }
}

int DefaultTokenCounter::count_with(TokenizerKind kind, std::string_view text) const {
    switch (kind) {
        case TokenizerKind::Claude:
        case TokenizerKind::GptLike:
        case TokenizerKind::Gemini:
            if (encoding_) {
                return encoding_->count(text);
            }
            return heuristic_token_count(text);
        case TokenizerKind::Heuristic:
            return heuristic_token_count(text);
    }
    return heuristic_token_count(text);
}

int DefaultTokenCounter::count_block(TokenizerKind kind, const ContentBlock& block) const {
    return std::visit(overloaded{
        [&](const TextBlock& b) {
            return count_with(kind, b.text);
        },
        [&](const ThinkingBlock& b) {
            return count_with(kind, b.text);
        },
        [&](const ImageBlock&) {
            return overheads_.image_tokens;
        },
        [&](const ToolUseBlock& b) {
            return count_with(kind, b.name)
                + count_with(kind, b.input.dump())
                + overheads_.tool_use_overhead;
        },
        [&](const ToolResultBlock& b) {
            const int content_tokens = std::visit(overloaded{
                [&](const std::string& text) { return count_with(kind, text); },
                [&](const Json& payload) { return count_with(kind, payload.dump()); },
                [&](const ImageContent&) { return overheads_.image_tokens; }
            }, b.content);
            return content_tokens + overheads_.tool_result_overhead;
        }
    }, block);
}

int DefaultTokenCounter::count_text(std::string_view model, std::string_view text) const {
    return count_with(catalog_->info_for(model).tokenizer, text);
}

int DefaultTokenCounter::count_messages(std::string_view model, const std::vector<Message>& messages) const {
    const TokenizerKind kind = catalog_->info_for(model).tokenizer;

    int total = 0;
    for (const auto& message : messages) {
        total += overheads_.per_message_overhead;
        for (const auto& block : message.content) {
            total += count_block(kind, block);
        }
    }

    // Charged once per call, not per message
    total += overheads_.batch_boundary_overhead;
    return total;
}

int DefaultTokenCounter::count_tools(std::string_view model, const std::vector<ToolDefinition>& tools) const {
    const TokenizerKind kind = catalog_->info_for(model).tokenizer;

    int total = 0;
    for (const auto& tool : tools) {
        total += count_with(kind, tool.name);
        total += count_with(kind, tool.description);
        total += count_with(kind, tool.input_schema.dump());
        total += overheads_.per_tool_overhead;
    }
    return total;
}

}  // namespace ctxpack::llm
