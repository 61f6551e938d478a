#include "vocab_parser.hpp"
#include "../core/error.hpp"
#include "../util/logger.hpp"

#include <cstring>
#include <limits>

namespace tkb {

namespace {

constexpr size_t MIN_ENTRY_BYTES = sizeof(uint32_t) + sizeof(uint8_t) + sizeof(uint32_t);

[[noreturn]] void corrupt(const std::string& message) {
    throw Error(TKB_ERROR_CORRUPT_VOCABULARY, message);
}

} // namespace

tkb_pretokenizer_t pretokenizer_from_name(const std::string& name) {
    if (name == PRETOKENIZER_CL100K) return TKB_PRETOKENIZER_CL100K;
    if (name == PRETOKENIZER_NONE) return TKB_PRETOKENIZER_NONE;
    corrupt("Unknown pre-tokenizer \"" + name + "\"");
}

std::unique_ptr<VocabFile> VocabFile::parse(const uint8_t* data, size_t size) {
    if (data == nullptr && size != 0) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT, "Vocabulary data is NULL");
    }

    auto file = std::unique_ptr<VocabFile>(new VocabFile());
    file->begin_ptr_ = data;
    file->read_ptr_ = data;
    file->end_ptr_ = data + size;

    file->parse_header();
    file->parse_entries();

    if (file->read_ptr_ != file->end_ptr_) {
        corrupt(std::to_string(file->end_ptr_ - file->read_ptr_) +
                " trailing bytes after the last vocabulary entry");
    }

    return file;
}

void VocabFile::require(uint64_t bytes, const char* what) const {
    if (bytes > static_cast<uint64_t>(end_ptr_ - read_ptr_)) {
        corrupt(std::string("Unexpected end of vocabulary reading ") + what +
                " at byte " + std::to_string(offset()));
    }
}

template<typename T>
T VocabFile::read() {
    require(sizeof(T), "value");
    T value;
    std::memcpy(&value, read_ptr_, sizeof(T));
    read_ptr_ += sizeof(T);
    return value;
}

template<typename T, typename Stored>
std::vector<Stored> VocabFile::read_array(uint64_t count) {
    // Checked before allocating so a forged count cannot reserve gigabytes
    if (count > static_cast<uint64_t>(end_ptr_ - read_ptr_) / sizeof(T)) {
        corrupt("Array of " + std::to_string(count) + " elements overruns the vocabulary");
    }
    std::vector<Stored> arr;
    arr.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        arr.push_back(static_cast<Stored>(read<T>()));
    }
    return arr;
}

std::string VocabFile::read_string() {
    uint64_t len = read<uint64_t>();
    require(len, "string");
    std::string str(reinterpret_cast<const char*>(read_ptr_), static_cast<size_t>(len));
    read_ptr_ += len;
    return str;
}

MetadataValue VocabFile::read_value(MetadataType type) {
    switch (type) {
        case MetadataType::UINT8:   return read<uint8_t>();
        case MetadataType::INT8:    return read<int8_t>();
        case MetadataType::UINT16:  return read<uint16_t>();
        case MetadataType::INT16:   return read<int16_t>();
        case MetadataType::UINT32:  return read<uint32_t>();
        case MetadataType::INT32:   return read<int32_t>();
        case MetadataType::UINT64:  return read<uint64_t>();
        case MetadataType::INT64:   return read<int64_t>();
        case MetadataType::FLOAT32: return read<float>();
        case MetadataType::FLOAT64: return read<double>();
        case MetadataType::BOOL: {
            uint8_t b = read<uint8_t>();
            if (b > 1) corrupt("Invalid bool value " + std::to_string(b));
            return b != 0;
        }
        case MetadataType::STRING:  return read_string();

        case MetadataType::ARRAY: {
            MetadataType elem_type = static_cast<MetadataType>(read<uint32_t>());
            uint64_t count = read<uint64_t>();

            switch (elem_type) {
                case MetadataType::UINT8:   return read_array<uint8_t, uint64_t>(count);
                case MetadataType::BOOL:    return read_array<uint8_t, uint64_t>(count);
                case MetadataType::INT8:    return read_array<int8_t, int64_t>(count);
                case MetadataType::UINT16:  return read_array<uint16_t, uint64_t>(count);
                case MetadataType::INT16:   return read_array<int16_t, int64_t>(count);
                case MetadataType::UINT32:  return read_array<uint32_t, uint64_t>(count);
                case MetadataType::INT32:   return read_array<int32_t, int64_t>(count);
                case MetadataType::UINT64:  return read_array<uint64_t, uint64_t>(count);
                case MetadataType::INT64:   return read_array<int64_t, int64_t>(count);
                case MetadataType::FLOAT32: return read_array<float, double>(count);
                case MetadataType::FLOAT64: return read_array<double, double>(count);
                case MetadataType::STRING: {
                    if (count > static_cast<uint64_t>(end_ptr_ - read_ptr_) / sizeof(uint64_t)) {
                        corrupt("String array of " + std::to_string(count) + " elements overruns the vocabulary");
                    }
                    std::vector<std::string> arr;
                    arr.reserve(static_cast<size_t>(count));
                    for (uint64_t i = 0; i < count; ++i) arr.push_back(read_string());
                    return arr;
                }
                default:
                    corrupt("Unsupported array element type " +
                            std::to_string(static_cast<uint32_t>(elem_type)));
            }
        }

        default:
            corrupt("Unsupported metadata type " + std::to_string(static_cast<uint32_t>(type)));
    }
}

void VocabFile::parse_header() {
    TkbvHeader header;
    header.magic = read<uint32_t>();
    if (header.magic != TKBV_MAGIC) {
        corrupt("Invalid vocabulary magic number");
    }

    header.version = read<uint32_t>();
    version_ = header.version;
    if (version_ != TKBV_VERSION) {
        corrupt("Unsupported vocabulary version " + std::to_string(version_) +
                " (expected " + std::to_string(TKBV_VERSION) + ")");
    }

    header.metadata_kv_count = read<uint64_t>();
    parse_metadata(header.metadata_kv_count);
}

void VocabFile::parse_metadata(uint64_t count) {
    for (uint64_t i = 0; i < count; ++i) {
        std::string key = read_string();
        MetadataType type = static_cast<MetadataType>(read<uint32_t>());
        MetadataValue value = read_value(type);
        if (!metadata_.emplace(key, std::move(value)).second) {
            corrupt("Duplicate metadata key \"" + key + "\"");
        }
    }
}

void VocabFile::configure(Vocabulary::Builder& builder) const {
    builder.set_format_version(version_);
    builder.set_name(get_string(VocabKeys::GENERAL_NAME));

    if (has_metadata(VocabKeys::PRETOKENIZER)) {
        const auto* name = std::get_if<std::string>(get_metadata(VocabKeys::PRETOKENIZER));
        if (!name) corrupt("tokenizer.pretokenizer must be a string");
        builder.set_pretokenizer(pretokenizer_from_name(*name));
    }

    if (has_metadata(VocabKeys::UNKNOWN_ID)) {
        int64_t unk = get_int(VocabKeys::UNKNOWN_ID, std::numeric_limits<int64_t>::min());
        if (unk < 0 || unk > std::numeric_limits<int32_t>::max()) {
            corrupt("tokenizer.unknown_id must be a non-negative 32-bit integer");
        }
        builder.set_unknown_id(static_cast<int32_t>(unk));
    }
}

void VocabFile::parse_entries() {
    Vocabulary::Builder builder;
    configure(builder);

    uint64_t count = read<uint64_t>();
    if (count > static_cast<uint64_t>(end_ptr_ - read_ptr_) / MIN_ENTRY_BYTES) {
        corrupt("Entry count " + std::to_string(count) + " overruns the vocabulary");
    }

    for (uint64_t i = 0; i < count; ++i) {
        TkbvEntryHeader entry;
        entry.id = read<uint32_t>();
        entry.flags = read<uint8_t>();
        entry.length = read<uint32_t>();

        if (entry.id > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
            corrupt("Token id " + std::to_string(entry.id) + " out of range");
        }
        if (entry.flags & ~TKBV_FLAG_MASK) {
            corrupt("Invalid flags " + std::to_string(static_cast<unsigned>(entry.flags)) +
                    " on token id " + std::to_string(entry.id));
        }

        require(entry.length, "token bytes");
        std::string bytes(reinterpret_cast<const char*>(read_ptr_), entry.length);
        read_ptr_ += entry.length;

        builder.add(static_cast<int32_t>(entry.id), bytes, (entry.flags & TKBV_FLAG_SPECIAL) != 0);
    }

    entry_count_ = static_cast<size_t>(count);
    vocab_ = builder.build();

    TKB_LOG_DEBUG("Parsed vocabulary v%u: %zu entries, %zu metadata keys",
                  version_, entry_count_, metadata_.size());
}

bool VocabFile::has_metadata(const std::string& key) const {
    return metadata_.find(key) != metadata_.end();
}

const MetadataValue* VocabFile::get_metadata(const std::string& key) const {
    auto it = metadata_.find(key);
    return it != metadata_.end() ? &it->second : nullptr;
}

std::string VocabFile::get_string(const std::string& key, const std::string& default_val) const {
    auto* val = get_metadata(key);
    if (!val) return default_val;
    if (auto* s = std::get_if<std::string>(val)) return *s;
    return default_val;
}

int64_t VocabFile::get_int(const std::string& key, int64_t default_val) const {
    auto* val = get_metadata(key);
    if (!val) return default_val;

    // Try various integer types
    if (auto* v = std::get_if<int64_t>(val)) return *v;
    if (auto* v = std::get_if<uint64_t>(val)) {
        return *v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ? default_val
                                                                              : static_cast<int64_t>(*v);
    }
    if (auto* v = std::get_if<int32_t>(val)) return *v;
    if (auto* v = std::get_if<uint32_t>(val)) return *v;
    if (auto* v = std::get_if<int16_t>(val)) return *v;
    if (auto* v = std::get_if<uint16_t>(val)) return *v;
    if (auto* v = std::get_if<int8_t>(val)) return *v;
    if (auto* v = std::get_if<uint8_t>(val)) return *v;

    return default_val;
}

} // namespace tkb
