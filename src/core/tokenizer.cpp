#include "tokenizer.hpp"
#include "error.hpp"
#include "../text/utf8.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string_view>

namespace tkb {

namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

} // namespace

Tokenizer::Tokenizer(std::shared_ptr<const Vocabulary> vocab, const TokenizerOptions& options)
    : vocab_(std::move(vocab)), options_(options) {
    if (!vocab_) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT, "Tokenizer needs a vocabulary");
    }

    pretokenizer_ = Pretokenizer(vocab_->pretokenizer());

    if (options_.allow_special) {
        specials_.assign(vocab_->special_tokens().begin(), vocab_->special_tokens().end());
        std::sort(specials_.begin(), specials_.end(),
                  [](const std::pair<std::string, int32_t>& a, const std::pair<std::string, int32_t>& b) {
                      if (a.first.size() != b.first.size()) return a.first.size() > b.first.size();
                      return a.first < b.first;
                  });
    }
}

Tokenizer::~Tokenizer() = default;

std::vector<int32_t> Tokenizer::encode(const std::string& text) const {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::vector<int32_t> Tokenizer::encode(const uint8_t* data, size_t len) const {
    std::vector<int32_t> tokens;
    tokens.reserve(len / 4 + 1);
    scan(data, len, [&tokens](const Token& t) { tokens.push_back(t.id); });
    return tokens;
}

std::vector<Token> Tokenizer::encode_with_offsets(const uint8_t* data, size_t len) const {
    std::vector<Token> tokens;
    tokens.reserve(len / 4 + 1);
    scan(data, len, [&tokens](const Token& t) { tokens.push_back(t); });
    return tokens;
}

size_t Tokenizer::count(const uint8_t* data, size_t len) const {
    size_t n = 0;
    scan(data, len, [&n](const Token&) { n++; });
    return n;
}

void Tokenizer::scan(const uint8_t* data, size_t len, const TokenSink& sink) const {
    if (len == 0) {
        return;
    }

    if (options_.max_input_bytes > 0 && len > options_.max_input_bytes) {
        throw Error(TKB_ERROR_INPUT_TOO_LARGE,
                    "Input of " + std::to_string(len) + " bytes exceeds the limit of " +
                    std::to_string(options_.max_input_bytes));
    }

    utf8::validate(data, len);

    std::vector<BpePart> parts;

    if (specials_.empty()) {
        scan_ordinary(data, 0, len, parts, sink);
        return;
    }

    // Split around special tokens; on equal positions the longest wins
    std::string_view text(reinterpret_cast<const char*>(data), len);
    std::vector<size_t> next(specials_.size());
    for (size_t k = 0; k < specials_.size(); ++k) {
        next[k] = text.find(specials_[k].first);
    }

    size_t pos = 0;
    while (pos < len) {
        size_t best = std::string_view::npos;
        size_t best_k = 0;
        for (size_t k = 0; k < specials_.size(); ++k) {
            if (next[k] != std::string_view::npos && next[k] < pos) {
                next[k] = text.find(specials_[k].first, pos);
            }
            if (next[k] < best) {
                best = next[k];
                best_k = k;
            }
        }

        if (best == std::string_view::npos) {
            scan_ordinary(data, pos, len, parts, sink);
            break;
        }

        scan_ordinary(data, pos, best, parts, sink);
        size_t special_end = best + specials_[best_k].first.size();
        sink(Token{specials_[best_k].second, best, special_end});
        pos = special_end;
    }
}

void Tokenizer::scan_ordinary(const uint8_t* data, size_t begin, size_t end,
                              std::vector<BpePart>& parts, const TokenSink& sink) const {
    size_t pos = begin;
    while (pos < end) {
        size_t piece_end = pretokenizer_.next_piece_end(data, end, pos);

        parts.clear();
        bpe_merge(*vocab_, data + pos, piece_end - pos, parts);

        for (const BpePart& part : parts) {
            int32_t id = part.id;
            if (id < 0) {
                id = vocab_->unknown_id();
                if (id < 0) {
                    char buf[64];
                    std::snprintf(buf, sizeof(buf), "Byte 0x%02x at offset %zu has no token",
                                  data[pos + part.start], pos + part.start);
                    throw Error(TKB_ERROR_UNREPRESENTABLE_INPUT, buf);
                }
            }
            sink(Token{id, pos + part.start, pos + part.end});
        }

        pos = piece_end;
    }
}

std::string Tokenizer::decode(const std::vector<int32_t>& tokens) const {
    return decode(tokens.data(), tokens.size());
}

std::string Tokenizer::decode(const int32_t* tokens, size_t count) const {
    std::string result;
    result.reserve(decoded_size(tokens, count));
    for (size_t i = 0; i < count; ++i) {
        result += vocab_->token_bytes(tokens[i]);
    }
    return result;
}

size_t Tokenizer::decoded_size(const int32_t* tokens, size_t count) const {
    size_t total = 0;
    for (size_t i = 0; i < count; ++i) {
        total += vocab_->token_bytes(tokens[i]).size();
    }
    return total;
}

std::string Tokenizer::get_info_json() const {
    std::ostringstream ss;
    const Vocabulary& v = *vocab_;

    ss << "{\n";
    ss << "  \"name\": \"" << json_escape(v.name()) << "\",\n";
    ss << "  \"vocab_size\": " << v.size() << ",\n";
    ss << "  \"special_count\": " << v.special_count() << ",\n";
    ss << "  \"max_token_id\": " << v.max_id() << ",\n";
    ss << "  \"max_token_bytes\": " << v.max_token_bytes() << ",\n";
    ss << "  \"unknown_id\": " << v.unknown_id() << ",\n";
    ss << "  \"covers_all_bytes\": " << (v.covers_all_bytes() ? "true" : "false") << ",\n";
    ss << "  \"format_version\": " << v.format_version() << ",\n";
    ss << "  \"pretokenizer\": \"" << tkb_pretokenizer_name(v.pretokenizer()) << "\",\n";
    ss << "  \"allow_special\": " << (options_.allow_special ? "true" : "false") << ",\n";
    ss << "  \"max_input_bytes\": " << options_.max_input_bytes << "\n";
    ss << "}";

    return ss.str();
}

} // namespace tkb
