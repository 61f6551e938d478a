#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tkb {

// Characters per token for a language name or file extension
// ("swift", "py", "c++", "md", ...). Unknown or empty hints use the
// generic code ratio.
double chars_per_token(const std::string& language_hint);

// Code points divided by the language ratio; 0 for empty text, at least 1
// otherwise. Needs no vocabulary.
size_t estimate_tokens(const uint8_t* text, size_t len, const std::string& language_hint);

} // namespace tkb
