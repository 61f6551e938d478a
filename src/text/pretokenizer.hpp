#pragma once

#include <tkb/tkb_types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tkb {

// Byte range [start, end) of the input
struct Span {
    size_t start;
    size_t end;

    size_t size() const { return end - start; }
};

/**
 * Pretokenizer - splits validated UTF-8 text into pieces
 *
 * BPE never merges across piece boundaries. The CL100K mode follows the
 * cl100k_base split pattern:
 *
 *   (?i:'s|'t|'re|'ve|'m|'ll|'d) | [^\r\n\p{L}\p{N}]?\p{L}+ | \p{N}{1,3}
 *   |  ?[^\s\p{L}\p{N}]+[\r\n]* | \s*[\r\n]+ | \s+(?!\S) | \s+
 *
 * with letters approximated as ASCII letters plus every non-ASCII code
 * point that is not whitespace, a number or common punctuation.
 */
class Pretokenizer {
public:
    explicit Pretokenizer(tkb_pretokenizer_t mode = TKB_PRETOKENIZER_CL100K) : mode_(mode) {}

    tkb_pretokenizer_t mode() const { return mode_; }

    // End of the piece starting at `pos` (pos < len)
    size_t next_piece_end(const uint8_t* data, size_t len, size_t pos) const;

    // All pieces of [begin, end)
    std::vector<Span> split(const uint8_t* data, size_t begin, size_t end) const;

    // Character classes used by the CL100K rules
    static bool is_letter(uint32_t cp);
    static bool is_number(uint32_t cp);

private:
    tkb_pretokenizer_t mode_;

    size_t next_cl100k(const uint8_t* data, size_t len, size_t pos) const;
};

} // namespace tkb
