#pragma once

#include "../core/vocabulary.hpp"

#include <memory>
#include <string>

namespace tkb {

// Where a vocabulary comes from. Exactly one of path or data is set.
struct VocabSource {
    std::string path;
    const uint8_t* data = nullptr;
    size_t size = 0;
    tkb_vocab_format_t format = TKB_VOCAB_FORMAT_AUTO;
    bool use_mmap = true;
    std::string special_tokens;     // tiktoken only
};

// NATIVE when the image starts with the .tkbv magic, TIKTOKEN otherwise
tkb_vocab_format_t detect_vocab_format(const uint8_t* data, size_t size);

// Load and validate a vocabulary in any supported format
std::shared_ptr<const Vocabulary> load_vocabulary(const VocabSource& source);

} // namespace tkb
