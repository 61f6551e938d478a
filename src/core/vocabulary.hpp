#pragma once

#include <tkb/tkb_types.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tkb {

/**
 * Vocabulary - immutable identifier <-> byte fragment table
 *
 * Normal tokens take part in byte-pair merging; their identifier is also
 * their merge rank (lower merges first). Special tokens are only matched
 * as whole strings and never merged.
 *
 * Built once through Vocabulary::Builder and shared read-only between
 * tokenizers through std::shared_ptr<const Vocabulary>.
 */
class Vocabulary {
public:
    struct Entry {
        int32_t id;
        std::string bytes;
        bool special;
    };

    class Builder {
    public:
        Builder();

        Builder& set_name(const std::string& name);
        Builder& set_pretokenizer(tkb_pretokenizer_t pretokenizer);
        Builder& set_unknown_id(int32_t id);
        Builder& set_format_version(uint32_t version);

        // Throws Error(TKB_ERROR_CORRUPT_VOCABULARY) on a negative id, an
        // empty fragment, a duplicate id or a duplicate fragment
        Builder& add(int32_t id, const std::string& bytes, bool special = false);

        size_t size() const { return vocab_->entries_.size(); }

        // Validates cross-entry constraints and hands the table over.
        // The builder is empty afterwards.
        std::shared_ptr<const Vocabulary> build();

    private:
        std::unique_ptr<Vocabulary> vocab_;
    };

    // Prevent copying
    Vocabulary(const Vocabulary&) = delete;
    Vocabulary& operator=(const Vocabulary&) = delete;

    // Info
    const std::string& name() const { return name_; }
    tkb_pretokenizer_t pretokenizer() const { return pretokenizer_; }
    uint32_t format_version() const { return format_version_; }
    int32_t unknown_id() const { return unknown_id_; }
    size_t size() const { return entries_.size(); }
    size_t special_count() const { return special_ids_.size(); }
    size_t max_token_bytes() const { return max_token_bytes_; }
    int32_t max_id() const { return max_id_; }

    // True when every single byte has a normal token, so any input can
    // be encoded without an unknown token
    bool covers_all_bytes() const { return byte_coverage_ == 256; }

    // Entries in insertion order
    const std::vector<Entry>& entries() const { return entries_; }

    // id -> fragment
    bool contains(int32_t id) const { return by_id_.find(id) != by_id_.end(); }
    const std::string& token_bytes(int32_t id) const;
    const std::string* find_bytes(int32_t id) const;
    bool is_special(int32_t id) const;

    // fragment -> rank of a normal token (merge lookup)
    std::optional<int32_t> rank(const std::string& bytes) const;
    std::optional<int32_t> rank(const uint8_t* data, size_t len) const;
    int32_t byte_rank(uint8_t byte) const { return byte_ranks_[byte]; }

    // fragment -> id, normal or special. Throws UNKNOWN_IDENTIFIER.
    int32_t id_of(const std::string& bytes) const;
    std::optional<int32_t> find(const std::string& bytes) const;

    // Special token text -> id
    const std::unordered_map<std::string, int32_t>& special_tokens() const { return special_ids_; }

private:
    Vocabulary();

    std::string name_;
    tkb_pretokenizer_t pretokenizer_ = TKB_PRETOKENIZER_CL100K;
    uint32_t format_version_ = 0;
    int32_t unknown_id_ = -1;

    std::vector<Entry> entries_;
    std::unordered_map<int32_t, size_t> by_id_;
    std::unordered_map<std::string, int32_t> ranks_;
    std::unordered_map<std::string, int32_t> special_ids_;
    std::array<int32_t, 256> byte_ranks_;

    size_t max_token_bytes_ = 0;
    int32_t max_id_ = -1;
    int byte_coverage_ = 0;
};

} // namespace tkb
