#pragma once

#include <cstddef>
#include <cstdint>

namespace tkb {
namespace utf8 {

constexpr size_t npos = static_cast<size_t>(-1);

// Offset of the first byte that does not start a well-formed sequence,
// or npos if the whole buffer is valid UTF-8. Rejects overlong forms,
// surrogates and code points above U+10FFFF.
size_t find_invalid(const uint8_t* data, size_t len);

// Throws Error(TKB_ERROR_ENCODING) naming the offending offset
void validate(const uint8_t* data, size_t len);

// Decode the code point at `pos` of a validated buffer.
// Writes the sequence length to *seq_len.
uint32_t decode(const uint8_t* data, size_t len, size_t pos, size_t* seq_len);

// Number of code points; continuation bytes are skipped, so invalid input
// still yields a sensible count.
size_t count_code_points(const uint8_t* data, size_t len);

// Unicode White_Space property
bool is_whitespace(uint32_t cp);

} // namespace utf8
} // namespace tkb
