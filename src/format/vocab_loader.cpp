#include "vocab_loader.hpp"
#include "mapped_file.hpp"
#include "tiktoken_import.hpp"
#include "vocab_parser.hpp"
#include "../core/error.hpp"
#include "../util/logger.hpp"

#include <cstring>

namespace tkb {

namespace {

// "dir/cl100k_base.tiktoken" -> "cl100k_base"
std::string stem_of(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = base.rfind('.');
    if (dot != std::string::npos && dot != 0) base.erase(dot);
    return base;
}

std::shared_ptr<const Vocabulary> load_image(const uint8_t* data, size_t size,
                                             const VocabSource& source) {
    tkb_vocab_format_t format = source.format;
    if (format == TKB_VOCAB_FORMAT_AUTO) {
        format = detect_vocab_format(data, size);
    }

    switch (format) {
        case TKB_VOCAB_FORMAT_NATIVE:
            if (!source.special_tokens.empty()) {
                throw Error(TKB_ERROR_INVALID_ARGUMENT,
                            "special_tokens only apply to tiktoken vocabularies");
            }
            return VocabFile::parse(data, size)->vocabulary();

        case TKB_VOCAB_FORMAT_TIKTOKEN:
            return import_tiktoken(data, size, parse_special_tokens(source.special_tokens),
                                   source.path.empty() ? std::string() : stem_of(source.path));

        default:
            throw Error(TKB_ERROR_INVALID_ARGUMENT,
                        "Unknown vocabulary format " + std::to_string(static_cast<int>(format)));
    }
}

} // namespace

tkb_vocab_format_t detect_vocab_format(const uint8_t* data, size_t size) {
    if (data && size >= sizeof(uint32_t)) {
        uint32_t magic;
        std::memcpy(&magic, data, sizeof(magic));
        if (magic == TKBV_MAGIC) {
            return TKB_VOCAB_FORMAT_NATIVE;
        }
    }
    return TKB_VOCAB_FORMAT_TIKTOKEN;
}

std::shared_ptr<const Vocabulary> load_vocabulary(const VocabSource& source) {
    bool has_path = !source.path.empty();
    bool has_data = source.data != nullptr;
    if (has_path == has_data) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT,
                    "Exactly one of vocabulary_path and vocabulary_data must be set");
    }
    if (source.format < 0 || source.format >= TKB_VOCAB_FORMAT_COUNT) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT, "Invalid vocabulary format");
    }

    if (has_data) {
        TKB_LOG_DEBUG("Loading vocabulary from %zu bytes in memory (%s)",
                      source.size, tkb_vocab_format_name(source.format));
        return load_image(source.data, source.size, source);
    }

    TKB_LOG_DEBUG("Loading vocabulary from %s (%s, %s)", source.path.c_str(),
                  tkb_vocab_format_name(source.format), source.use_mmap ? "mmap" : "read");

    auto file = MappedFile::open(source.path, source.use_mmap);
    try {
        return load_image(file->data(), file->size(), source);
    } catch (const Error& e) {
        throw Error(e.code(), source.path + ": " + e.what());
    }
}

} // namespace tkb
