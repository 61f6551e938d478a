#pragma once

#include "../core/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tkb {

using SpecialToken = std::pair<std::string, int32_t>;

// Standard alphabet, '=' padding optional.
// Throws Error(TKB_ERROR_CORRUPT_VOCABULARY) on any other character.
std::string base64_decode(const char* data, size_t len);

// Parse "<|endoftext|>=100257;<|fim_prefix|>=100258". Empty items are
// skipped. Throws Error(TKB_ERROR_INVALID_ARGUMENT) on a malformed item.
std::vector<SpecialToken> parse_special_tokens(const std::string& spec);

/**
 * Load a tiktoken rank file ("<base64 bytes> <rank>" per line)
 *
 * Ranks become identifiers. The vocabulary uses the cl100k pre-tokenizer
 * and reports format version 0. Malformed lines, invalid base64 and
 * duplicate ranks or fragments throw Error(TKB_ERROR_CORRUPT_VOCABULARY).
 */
std::shared_ptr<const Vocabulary> import_tiktoken(const uint8_t* data, size_t size,
                                                  const std::vector<SpecialToken>& specials,
                                                  const std::string& name = "");

} // namespace tkb
