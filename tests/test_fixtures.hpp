/**
 * TokBridge - shared test vocabulary
 *
 * Every byte is its own token (id == byte value). Merges follow from
 * id 256 in rank order, then one special token.
 */

#pragma once

#include "core/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tkb {
namespace test {

constexpr int32_t ENDOFTEXT_ID = 1000;
constexpr const char* ENDOFTEXT = "<|endoftext|>";

inline const std::vector<std::string>& merges() {
    static const std::vector<std::string> list = {
        "at",       // 256
        "th",       // 257
        "the",      // 258
        " t",       // 259
        " the",     // 260
        " c",       // 261
        " cat",     // 262
        " s",       // 263
        " sat",     // 264
        " o",       // 265
        " on",      // 266
        " m",       // 267
        " mat",     // 268
        "he",       // 269
    };
    return list;
}

inline std::shared_ptr<const Vocabulary> make_vocab(bool with_special = true,
                                                    tkb_pretokenizer_t pretokenizer = TKB_PRETOKENIZER_CL100K) {
    Vocabulary::Builder builder;
    builder.set_name("fixture").set_pretokenizer(pretokenizer).set_format_version(1);
    for (int b = 0; b < 256; ++b) {
        builder.add(b, std::string(1, static_cast<char>(b)));
    }
    int32_t id = 256;
    for (const auto& m : merges()) {
        builder.add(id++, m);
    }
    if (with_special) {
        builder.add(ENDOFTEXT_ID, ENDOFTEXT, true);
    }
    return builder.build();
}

inline std::string base64_encode(const std::string& in) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : in) {
        buffer = (buffer << 8) | c;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out.push_back(alphabet[(buffer >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (6 - bits)) & 0x3F]);
    }
    while (out.size() % 4 != 0) {
        out.push_back('=');
    }
    return out;
}

// The normal tokens of make_vocab() as a tiktoken rank file
inline std::string tiktoken_text() {
    std::string text;
    for (int b = 0; b < 256; ++b) {
        text += base64_encode(std::string(1, static_cast<char>(b))) + " " + std::to_string(b) + "\n";
    }
    int32_t id = 256;
    for (const auto& m : merges()) {
        text += base64_encode(m) + " " + std::to_string(id++) + "\n";
    }
    return text;
}

inline const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

} // namespace test
} // namespace tkb
