#include "tiktoken_import.hpp"
#include "../core/error.hpp"
#include "../util/logger.hpp"

#include <array>
#include <limits>

namespace tkb {

namespace {

const std::array<int8_t, 256>& base64_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 26; ++i) t[static_cast<uint8_t>('A' + i)] = static_cast<int8_t>(i);
        for (int i = 0; i < 26; ++i) t[static_cast<uint8_t>('a' + i)] = static_cast<int8_t>(26 + i);
        for (int i = 0; i < 10; ++i) t[static_cast<uint8_t>('0' + i)] = static_cast<int8_t>(52 + i);
        t[static_cast<uint8_t>('+')] = 62;
        t[static_cast<uint8_t>('/')] = 63;
        return t;
    }();
    return table;
}

// Decimal digits only, no sign, fits in int32_t
bool parse_id(const char* p, size_t len, int32_t& out) {
    if (len == 0 || len > 10) return false;
    int64_t value = 0;
    for (size_t i = 0; i < len; ++i) {
        if (p[i] < '0' || p[i] > '9') return false;
        value = value * 10 + (p[i] - '0');
    }
    if (value > std::numeric_limits<int32_t>::max()) return false;
    out = static_cast<int32_t>(value);
    return true;
}

} // namespace

std::string base64_decode(const char* data, size_t len) {
    const auto& table = base64_table();

    std::string output;
    output.reserve(len * 3 / 4);

    uint32_t buffer = 0;
    int bits_collected = 0;
    size_t i = 0;
    for (; i < len && data[i] != '='; ++i) {
        int8_t val = table[static_cast<uint8_t>(data[i])];
        if (val < 0) {
            throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "base64: invalid input character");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(val);
        bits_collected += 6;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            output.push_back(static_cast<char>((buffer >> bits_collected) & 0xFF));
        }
    }

    // A lone trailing sextet cannot hold a byte
    if (bits_collected == 6) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "base64: truncated input");
    }

    size_t padding = 0;
    for (; i < len; ++i, ++padding) {
        if (data[i] != '=' || padding == 2) {
            throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "base64: invalid padding");
        }
    }

    return output;
}

std::vector<SpecialToken> parse_special_tokens(const std::string& spec) {
    std::vector<SpecialToken> result;

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t end = spec.find(';', pos);
        if (end == std::string::npos) end = spec.size();

        std::string item = spec.substr(pos, end - pos);
        pos = end + 1;
        if (item.empty()) continue;

        size_t eq = item.rfind('=');
        int32_t id = 0;
        if (eq == std::string::npos || eq == 0 ||
            !parse_id(item.data() + eq + 1, item.size() - eq - 1, id)) {
            throw Error(TKB_ERROR_INVALID_ARGUMENT, "Malformed special token \"" + item + "\"");
        }
        result.emplace_back(item.substr(0, eq), id);
    }

    return result;
}

std::shared_ptr<const Vocabulary> import_tiktoken(const uint8_t* data, size_t size,
                                                  const std::vector<SpecialToken>& specials,
                                                  const std::string& name) {
    if (data == nullptr && size != 0) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT, "Vocabulary data is NULL");
    }

    Vocabulary::Builder builder;
    builder.set_name(name)
           .set_pretokenizer(TKB_PRETOKENIZER_CL100K)
           .set_format_version(0);

    const char* text = reinterpret_cast<const char*>(data);
    size_t line_no = 0;
    size_t pos = 0;
    while (pos < size) {
        size_t end = pos;
        while (end < size && text[end] != '\n') ++end;
        size_t next = end + 1;
        line_no++;

        if (end > pos && text[end - 1] == '\r') --end;
        if (end == pos) {
            pos = next;
            continue;
        }

        size_t space = pos;
        while (space < end && text[space] != ' ') ++space;

        int32_t rank = 0;
        if (space == pos || space == end ||
            !parse_id(text + space + 1, end - space - 1, rank)) {
            throw Error(TKB_ERROR_CORRUPT_VOCABULARY,
                        "Malformed tiktoken line " + std::to_string(line_no));
        }

        std::string bytes;
        try {
            bytes = base64_decode(text + pos, space - pos);
        } catch (const Error& e) {
            throw Error(TKB_ERROR_CORRUPT_VOCABULARY,
                        std::string(e.what()) + " on line " + std::to_string(line_no));
        }
        builder.add(rank, bytes);

        pos = next;
    }

    size_t ranked = builder.size();
    for (const auto& special : specials) {
        builder.add(special.second, special.first, true);
    }

    auto vocab = builder.build();
    TKB_LOG_DEBUG("Imported tiktoken vocabulary: %zu ranks, %zu specials",
                  ranked, specials.size());
    return vocab;
}

} // namespace tkb
