#pragma once

#include <cstdint>
#include <cstddef>

namespace tkb {

// Vocabulary file magic number: "TKBV" in little-endian
constexpr uint32_t TKBV_MAGIC = 0x56424B54;  // "TKBV"

// The only version this build reads. Any other value fails closed.
constexpr uint32_t TKBV_VERSION = 1;

// Entry flag bits
constexpr uint8_t TKBV_FLAG_SPECIAL = 0x01;
constexpr uint8_t TKBV_FLAG_MASK = TKBV_FLAG_SPECIAL;

// Metadata value types (same numbering as GGUF)
enum class MetadataType : uint32_t {
    UINT8   = 0,
    INT8    = 1,
    UINT16  = 2,
    INT16   = 3,
    UINT32  = 4,
    INT32   = 5,
    FLOAT32 = 6,
    BOOL    = 7,
    STRING  = 8,
    ARRAY   = 9,
    UINT64  = 10,
    INT64   = 11,
    FLOAT64 = 12,
};

// File header
struct TkbvHeader {
    uint32_t magic;             // TKBV_MAGIC
    uint32_t version;           // TKBV_VERSION
    uint64_t metadata_kv_count; // Number of metadata key-value pairs
};

// Entry header; `length` fragment bytes follow
struct TkbvEntryHeader {
    uint32_t id;
    uint8_t flags;
    uint32_t length;
};

// Standard metadata keys
namespace VocabKeys {
    constexpr const char* GENERAL_NAME = "general.name";
    constexpr const char* PRETOKENIZER = "tokenizer.pretokenizer";
    constexpr const char* UNKNOWN_ID = "tokenizer.unknown_id";
}

// Pre-tokenizer names stored under VocabKeys::PRETOKENIZER
constexpr const char* PRETOKENIZER_CL100K = "cl100k";
constexpr const char* PRETOKENIZER_NONE = "none";

} // namespace tkb
