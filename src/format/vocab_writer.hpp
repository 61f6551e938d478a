#pragma once

#include "vocab_types.hpp"
#include "../core/vocabulary.hpp"

#include <string>

namespace tkb {

// Serialize a vocabulary as a version 1 .tkbv image. Entries keep their
// insertion order; metadata carries the name, pre-tokenizer and the
// unknown token when one is set.
std::string serialize_vocabulary(const Vocabulary& vocab);

// Write serialize_vocabulary() to a file.
// Throws Error(TKB_ERROR_FILE_WRITE).
void save_vocabulary(const Vocabulary& vocab, const std::string& path);

} // namespace tkb
