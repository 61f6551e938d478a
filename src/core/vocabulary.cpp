#include "vocabulary.hpp"
#include "error.hpp"

#include <algorithm>

namespace tkb {

// ============================================================================
// Vocabulary
// ============================================================================

Vocabulary::Vocabulary() {
    byte_ranks_.fill(-1);
}

const std::string& Vocabulary::token_bytes(int32_t id) const {
    const std::string* bytes = find_bytes(id);
    if (!bytes) {
        throw Error(TKB_ERROR_UNKNOWN_IDENTIFIER, "Unknown token id " + std::to_string(id));
    }
    return *bytes;
}

const std::string* Vocabulary::find_bytes(int32_t id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() ? &entries_[it->second].bytes : nullptr;
}

bool Vocabulary::is_special(int32_t id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() && entries_[it->second].special;
}

std::optional<int32_t> Vocabulary::rank(const std::string& bytes) const {
    if (bytes.size() == 1) {
        int32_t r = byte_ranks_[static_cast<uint8_t>(bytes[0])];
        if (r < 0) return std::nullopt;
        return r;
    }
    auto it = ranks_.find(bytes);
    if (it == ranks_.end()) return std::nullopt;
    return it->second;
}

std::optional<int32_t> Vocabulary::rank(const uint8_t* data, size_t len) const {
    if (len == 0 || len > max_token_bytes_) {
        return std::nullopt;
    }
    return rank(std::string(reinterpret_cast<const char*>(data), len));
}

std::optional<int32_t> Vocabulary::find(const std::string& bytes) const {
    auto r = rank(bytes);
    if (r) return r;
    auto it = special_ids_.find(bytes);
    if (it == special_ids_.end()) return std::nullopt;
    return it->second;
}

int32_t Vocabulary::id_of(const std::string& bytes) const {
    auto id = find(bytes);
    if (!id) {
        throw Error(TKB_ERROR_UNKNOWN_IDENTIFIER,
                    "No token for a fragment of " + std::to_string(bytes.size()) + " bytes");
    }
    return *id;
}

// ============================================================================
// Vocabulary::Builder
// ============================================================================

Vocabulary::Builder::Builder() : vocab_(new Vocabulary()) {}

Vocabulary::Builder& Vocabulary::Builder::set_name(const std::string& name) {
    vocab_->name_ = name;
    return *this;
}

Vocabulary::Builder& Vocabulary::Builder::set_pretokenizer(tkb_pretokenizer_t pretokenizer) {
    if (pretokenizer < 0 || pretokenizer >= TKB_PRETOKENIZER_COUNT) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Unknown pre-tokenizer");
    }
    vocab_->pretokenizer_ = pretokenizer;
    return *this;
}

Vocabulary::Builder& Vocabulary::Builder::set_unknown_id(int32_t id) {
    vocab_->unknown_id_ = id;
    return *this;
}

Vocabulary::Builder& Vocabulary::Builder::set_format_version(uint32_t version) {
    vocab_->format_version_ = version;
    return *this;
}

Vocabulary::Builder& Vocabulary::Builder::add(int32_t id, const std::string& bytes, bool special) {
    Vocabulary& v = *vocab_;

    if (id < 0) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Negative token id " + std::to_string(id));
    }
    if (bytes.empty()) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Empty fragment for token id " + std::to_string(id));
    }
    if (v.by_id_.count(id)) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Duplicate token id " + std::to_string(id));
    }
    if (v.ranks_.count(bytes) || v.special_ids_.count(bytes) ||
        (bytes.size() == 1 && v.byte_ranks_[static_cast<uint8_t>(bytes[0])] >= 0)) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Duplicate fragment for token id " + std::to_string(id));
    }

    if (special) {
        v.special_ids_.emplace(bytes, id);
    } else if (bytes.size() == 1) {
        v.byte_ranks_[static_cast<uint8_t>(bytes[0])] = id;
        v.byte_coverage_++;
    } else {
        v.ranks_.emplace(bytes, id);
    }

    v.by_id_.emplace(id, v.entries_.size());
    v.entries_.push_back({id, bytes, special});
    v.max_token_bytes_ = std::max(v.max_token_bytes_, bytes.size());
    v.max_id_ = std::max(v.max_id_, id);

    return *this;
}

std::shared_ptr<const Vocabulary> Vocabulary::Builder::build() {
    if (vocab_->entries_.empty()) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Vocabulary has no tokens");
    }
    if (vocab_->unknown_id_ >= 0 && !vocab_->contains(vocab_->unknown_id_)) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY,
                    "Unknown token id " + std::to_string(vocab_->unknown_id_) + " is not in the vocabulary");
    }
    if (vocab_->unknown_id_ < -1) {
        throw Error(TKB_ERROR_CORRUPT_VOCABULARY, "Invalid unknown token id");
    }

    std::shared_ptr<const Vocabulary> result(vocab_.release());
    vocab_.reset(new Vocabulary());
    return result;
}

} // namespace tkb
