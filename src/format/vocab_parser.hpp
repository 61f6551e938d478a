#pragma once

#include "vocab_types.hpp"
#include "../core/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tkb {

// Metadata value variant type
using MetadataValue = std::variant<
    uint8_t,
    int8_t,
    uint16_t,
    int16_t,
    uint32_t,
    int32_t,
    uint64_t,
    int64_t,
    float,
    double,
    bool,
    std::string,
    std::vector<int64_t>,
    std::vector<uint64_t>,
    std::vector<double>,
    std::vector<std::string>
>;

/**
 * Native vocabulary file parser
 *
 * Parses a complete .tkbv image held in memory (mapped file or embedded
 * resource). The image only has to outlive the parse call; the resulting
 * Vocabulary owns copies of every fragment.
 *
 * Any structural problem (bad magic, unsupported version, truncation,
 * unknown value type, bad flags, trailing bytes) throws
 * Error(TKB_ERROR_CORRUPT_VOCABULARY).
 */
class VocabFile {
public:
    static std::unique_ptr<VocabFile> parse(const uint8_t* data, size_t size);

    // Prevent copying
    VocabFile(const VocabFile&) = delete;
    VocabFile& operator=(const VocabFile&) = delete;

    uint32_t version() const { return version_; }

    // Metadata access
    size_t metadata_count() const { return metadata_.size(); }
    bool has_metadata(const std::string& key) const;
    const MetadataValue* get_metadata(const std::string& key) const;

    // Typed metadata getters (return default if not found or wrong type)
    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;

    size_t entry_count() const { return entry_count_; }

    // The parsed table
    const std::shared_ptr<const Vocabulary>& vocabulary() const { return vocab_; }

private:
    VocabFile() = default;

    void parse_header();
    void parse_metadata(uint64_t count);
    void parse_entries();
    void configure(Vocabulary::Builder& builder) const;

    // Read helpers
    template<typename T>
    T read();

    template<typename T, typename Stored = T>
    std::vector<Stored> read_array(uint64_t count);

    void require(uint64_t bytes, const char* what) const;
    size_t offset() const { return static_cast<size_t>(read_ptr_ - begin_ptr_); }

    std::string read_string();
    MetadataValue read_value(MetadataType type);

    uint32_t version_ = 0;

    // Current read position (for parsing)
    const uint8_t* begin_ptr_ = nullptr;
    const uint8_t* read_ptr_ = nullptr;
    const uint8_t* end_ptr_ = nullptr;

    std::unordered_map<std::string, MetadataValue> metadata_;
    size_t entry_count_ = 0;
    std::shared_ptr<const Vocabulary> vocab_;
};

// Parse a pre-tokenizer name stored in metadata
tkb_pretokenizer_t pretokenizer_from_name(const std::string& name);

} // namespace tkb
