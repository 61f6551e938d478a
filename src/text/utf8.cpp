#include "utf8.hpp"
#include "../core/error.hpp"

#include <string>

namespace tkb {
namespace utf8 {

size_t find_invalid(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint8_t c = data[i];

        if (c < 0x80) {
            i++;
            continue;
        }

        size_t need;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            need = 1;
        } else if (c == 0xE0) {
            need = 2;
            lo = 0xA0;              // overlong
        } else if (c == 0xED) {
            need = 2;
            hi = 0x9F;              // surrogates
        } else if (c >= 0xE1 && c <= 0xEF) {
            need = 2;
        } else if (c == 0xF0) {
            need = 3;
            lo = 0x90;              // overlong
        } else if (c >= 0xF1 && c <= 0xF3) {
            need = 3;
        } else if (c == 0xF4) {
            need = 3;
            hi = 0x8F;              // > U+10FFFF
        } else {
            return i;
        }

        if (need > len - i - 1) {
            return i;
        }
        if (data[i + 1] < lo || data[i + 1] > hi) {
            return i;
        }
        for (size_t k = 2; k <= need; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return i;
            }
        }
        i += need + 1;
    }
    return npos;
}

void validate(const uint8_t* data, size_t len) {
    size_t bad = find_invalid(data, len);
    if (bad != npos) {
        throw Error(TKB_ERROR_ENCODING,
                    "Invalid UTF-8 at byte " + std::to_string(bad));
    }
}

uint32_t decode(const uint8_t* data, size_t len, size_t pos, size_t* seq_len) {
    uint8_t c = data[pos];
    size_t n = c < 0x80 ? 1 : c < 0xE0 ? 2 : c < 0xF0 ? 3 : 4;
    if (n == 1 || n > len - pos) {
        *seq_len = 1;
        return c;
    }
    if (n == 2) {
        *seq_len = 2;
        return (static_cast<uint32_t>(c & 0x1F) << 6) | (data[pos + 1] & 0x3F);
    }
    if (n == 3) {
        *seq_len = 3;
        return (static_cast<uint32_t>(c & 0x0F) << 12) |
               (static_cast<uint32_t>(data[pos + 1] & 0x3F) << 6) |
               (data[pos + 2] & 0x3F);
    }
    *seq_len = 4;
    return (static_cast<uint32_t>(c & 0x07) << 18) |
           (static_cast<uint32_t>(data[pos + 1] & 0x3F) << 12) |
           (static_cast<uint32_t>(data[pos + 2] & 0x3F) << 6) |
           (data[pos + 3] & 0x3F);
}

size_t count_code_points(const uint8_t* data, size_t len) {
    size_t count = 0;
    for (size_t i = 0; i < len; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

bool is_whitespace(uint32_t cp) {
    if (cp < 0x80) {
        return cp == ' ' || (cp >= 0x09 && cp <= 0x0D);
    }
    switch (cp) {
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

} // namespace utf8
} // namespace tkb
