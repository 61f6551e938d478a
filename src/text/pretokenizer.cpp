#include "pretokenizer.hpp"
#include "utf8.hpp"

namespace tkb {

namespace {

bool is_newline(uint32_t cp) {
    return cp == '\r' || cp == '\n';
}

bool in_range(uint32_t cp, uint32_t lo, uint32_t hi) {
    return cp >= lo && cp <= hi;
}

// Punctuation and symbol blocks outside ASCII
bool is_symbol(uint32_t cp) {
    if (in_range(cp, 0x00A1, 0x00BF)) {
        return cp != 0x00AA && cp != 0x00B5 && cp != 0x00BA;
    }
    return cp == 0x00D7 || cp == 0x00F7 ||
           in_range(cp, 0x2010, 0x2027) ||
           in_range(cp, 0x2030, 0x205E) ||
           in_range(cp, 0x20A0, 0x20C0) ||      // currency
           in_range(cp, 0x2190, 0x23FF) ||      // arrows, math, technical
           in_range(cp, 0x2500, 0x27BF) ||      // box drawing, shapes, dingbats
           in_range(cp, 0x3001, 0x3004) ||
           in_range(cp, 0x3008, 0x3020) ||
           in_range(cp, 0xFE30, 0xFE4F) ||
           in_range(cp, 0xFF01, 0xFF0F) ||
           in_range(cp, 0xFF1A, 0xFF20) ||
           in_range(cp, 0x1F000, 0x1FAFF);      // emoji and pictographs
}

// [^\s\p{L}\p{N}]
bool is_other(uint32_t cp) {
    return !utf8::is_whitespace(cp) && !Pretokenizer::is_letter(cp) && !Pretokenizer::is_number(cp);
}

uint32_t lower_ascii(uint8_t c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<uint32_t>(c - 'A' + 'a') : c;
}

} // namespace

bool Pretokenizer::is_number(uint32_t cp) {
    if (cp < 0x80) {
        return cp >= '0' && cp <= '9';
    }
    return cp == 0x00B2 || cp == 0x00B3 || cp == 0x00B9 ||
           in_range(cp, 0x00BC, 0x00BE) ||
           in_range(cp, 0x0660, 0x0669) ||
           in_range(cp, 0x06F0, 0x06F9) ||
           in_range(cp, 0x0966, 0x096F) ||
           in_range(cp, 0x2070, 0x2079) ||
           in_range(cp, 0x2080, 0x2089) ||
           in_range(cp, 0x2150, 0x2189) ||
           in_range(cp, 0x2460, 0x249B) ||
           in_range(cp, 0xFF10, 0xFF19);
}

bool Pretokenizer::is_letter(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
    }
    return !utf8::is_whitespace(cp) && !is_number(cp) && !is_symbol(cp);
}

size_t Pretokenizer::next_piece_end(const uint8_t* data, size_t len, size_t pos) const {
    if (mode_ == TKB_PRETOKENIZER_NONE) {
        return len;
    }
    return next_cl100k(data, len, pos);
}

std::vector<Span> Pretokenizer::split(const uint8_t* data, size_t begin, size_t end) const {
    std::vector<Span> pieces;
    size_t pos = begin;
    while (pos < end) {
        size_t next = next_piece_end(data, end, pos);
        pieces.push_back({pos, next});
        pos = next;
    }
    return pieces;
}

size_t Pretokenizer::next_cl100k(const uint8_t* data, size_t len, size_t pos) const {
    size_t n;
    uint32_t cp = utf8::decode(data, len, pos, &n);

    // Contractions
    if (cp == '\'' && pos + 1 < len) {
        uint32_t c1 = lower_ascii(data[pos + 1]);
        if (c1 == 's' || c1 == 't' || c1 == 'm' || c1 == 'd') {
            return pos + 2;
        }
        if (pos + 2 < len) {
            uint32_t c2 = lower_ascii(data[pos + 2]);
            if ((c1 == 'r' && c2 == 'e') || (c1 == 'v' && c2 == 'e') || (c1 == 'l' && c2 == 'l')) {
                return pos + 3;
            }
        }
    }

    // Optional non-letter, non-number prefix followed by letters
    size_t letters_start = utf8::npos;
    if (is_letter(cp)) {
        letters_start = pos;
    } else if (!is_newline(cp) && !is_number(cp) && pos + n < len) {
        size_t n2;
        if (is_letter(utf8::decode(data, len, pos + n, &n2))) {
            letters_start = pos + n;
        }
    }
    if (letters_start != utf8::npos) {
        size_t p = letters_start;
        while (p < len) {
            size_t k;
            if (!is_letter(utf8::decode(data, len, p, &k))) break;
            p += k;
        }
        return p;
    }

    // Up to three digits
    if (is_number(cp)) {
        size_t p = pos + n;
        for (int count = 1; count < 3 && p < len; ++count) {
            size_t k;
            if (!is_number(utf8::decode(data, len, p, &k))) break;
            p += k;
        }
        return p;
    }

    // Punctuation run with optional leading space and trailing newlines
    size_t punct_start = utf8::npos;
    if (is_other(cp)) {
        punct_start = pos;
    } else if (cp == ' ' && pos + 1 < len) {
        size_t n2;
        if (is_other(utf8::decode(data, len, pos + 1, &n2))) {
            punct_start = pos + 1;
        }
    }
    if (punct_start != utf8::npos) {
        size_t p = punct_start;
        while (p < len) {
            size_t k;
            if (!is_other(utf8::decode(data, len, p, &k))) break;
            p += k;
        }
        while (p < len && (data[p] == '\r' || data[p] == '\n')) {
            p++;
        }
        return p;
    }

    // Whitespace
    if (utf8::is_whitespace(cp)) {
        size_t j = pos;
        size_t last_start = pos;
        size_t newline_end = utf8::npos;
        while (j < len) {
            size_t k;
            uint32_t c = utf8::decode(data, len, j, &k);
            if (!utf8::is_whitespace(c)) break;
            if (is_newline(c)) newline_end = j + k;
            last_start = j;
            j += k;
        }

        // \s*[\r\n]+
        if (newline_end != utf8::npos) {
            return newline_end;
        }
        // \s+(?!\S) leaves the last space to prefix the next word
        if (j < len && last_start > pos) {
            return last_start;
        }
        // \s+
        return j;
    }

    return pos + n;
}

} // namespace tkb
