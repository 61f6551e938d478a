#pragma once

#include "bpe.hpp"
#include "vocabulary.hpp"
#include "../text/pretokenizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tkb {

// Token id with its byte span in the input
struct Token {
    int32_t id;
    size_t start;
    size_t end;
};

struct TokenizerOptions {
    bool allow_special = false;     // Match special token text in the input
    size_t max_input_bytes = 0;     // 0 = unlimited
};

/**
 * Tokenizer - byte-level BPE over a shared vocabulary
 *
 * Immutable after construction; every method is const and safe to call
 * from several threads at once.
 */
class Tokenizer {
public:
    Tokenizer(std::shared_ptr<const Vocabulary> vocab, const TokenizerOptions& options = TokenizerOptions{});
    ~Tokenizer();

    // Prevent copying
    Tokenizer(const Tokenizer&) = delete;
    Tokenizer& operator=(const Tokenizer&) = delete;

    // Encode UTF-8 text to tokens. Throws Error with TKB_ERROR_ENCODING,
    // TKB_ERROR_INPUT_TOO_LARGE or TKB_ERROR_UNREPRESENTABLE_INPUT.
    std::vector<int32_t> encode(const std::string& text) const;
    std::vector<int32_t> encode(const uint8_t* data, size_t len) const;

    // Encode with byte spans; the spans tile the input
    std::vector<Token> encode_with_offsets(const uint8_t* data, size_t len) const;

    // Number of tokens encode() would return
    size_t count(const uint8_t* data, size_t len) const;

    // Decode tokens to bytes. Throws Error(TKB_ERROR_UNKNOWN_IDENTIFIER).
    std::string decode(const std::vector<int32_t>& tokens) const;
    std::string decode(const int32_t* tokens, size_t count) const;

    // Byte length decode() would return
    size_t decoded_size(const int32_t* tokens, size_t count) const;

    // Accessors
    const Vocabulary& vocab() const { return *vocab_; }
    const std::shared_ptr<const Vocabulary>& shared_vocab() const { return vocab_; }
    const TokenizerOptions& options() const { return options_; }
    const Pretokenizer& pretokenizer() const { return pretokenizer_; }

    // JSON description
    std::string get_info_json() const;

private:
    using TokenSink = std::function<void(const Token&)>;

    std::shared_ptr<const Vocabulary> vocab_;
    TokenizerOptions options_;
    Pretokenizer pretokenizer_;

    // Special token texts, longest first
    std::vector<std::pair<std::string, int32_t>> specials_;

    // Validate, split and merge, reporting every token in order
    void scan(const uint8_t* data, size_t len, const TokenSink& sink) const;

    // Tokens of ordinary text in [begin, end)
    void scan_ordinary(const uint8_t* data, size_t begin, size_t end,
                       std::vector<BpePart>& parts, const TokenSink& sink) const;
};

} // namespace tkb
