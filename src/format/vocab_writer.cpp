#include "vocab_writer.hpp"
#include "../core/error.hpp"
#include "../util/logger.hpp"

#include <cstdio>
#include <cstring>

namespace tkb {

namespace {

class ByteWriter {
public:
    explicit ByteWriter(std::string& out) : out_(out) {}

    template<typename T>
    void write(T value) {
        char buf[sizeof(T)];
        std::memcpy(buf, &value, sizeof(T));
        out_.append(buf, sizeof(T));
    }

    void write_string(const std::string& s) {
        write<uint64_t>(s.size());
        out_.append(s);
    }

    void write_kv(const char* key, MetadataType type) {
        write_string(key);
        write<uint32_t>(static_cast<uint32_t>(type));
    }

private:
    std::string& out_;
};

} // namespace

std::string serialize_vocabulary(const Vocabulary& vocab) {
    std::string out;
    size_t payload = 0;
    for (const auto& e : vocab.entries()) {
        payload += sizeof(uint32_t) + sizeof(uint8_t) + sizeof(uint32_t) + e.bytes.size();
    }
    out.reserve(payload + 256);

    ByteWriter w(out);

    uint64_t kv_count = 2 + (vocab.unknown_id() >= 0 ? 1 : 0);
    w.write<uint32_t>(TKBV_MAGIC);
    w.write<uint32_t>(TKBV_VERSION);
    w.write<uint64_t>(kv_count);

    w.write_kv(VocabKeys::GENERAL_NAME, MetadataType::STRING);
    w.write_string(vocab.name());

    w.write_kv(VocabKeys::PRETOKENIZER, MetadataType::STRING);
    w.write_string(vocab.pretokenizer() == TKB_PRETOKENIZER_NONE ? PRETOKENIZER_NONE
                                                                 : PRETOKENIZER_CL100K);

    if (vocab.unknown_id() >= 0) {
        w.write_kv(VocabKeys::UNKNOWN_ID, MetadataType::INT32);
        w.write<int32_t>(vocab.unknown_id());
    }

    w.write<uint64_t>(vocab.entries().size());
    for (const auto& e : vocab.entries()) {
        w.write<uint32_t>(static_cast<uint32_t>(e.id));
        w.write<uint8_t>(e.special ? TKBV_FLAG_SPECIAL : 0);
        w.write<uint32_t>(static_cast<uint32_t>(e.bytes.size()));
        out.append(e.bytes);
    }

    return out;
}

void save_vocabulary(const Vocabulary& vocab, const std::string& path) {
    std::string image = serialize_vocabulary(vocab);

    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        throw Error(TKB_ERROR_FILE_WRITE, "Failed to open " + path + " for writing");
    }

    size_t written = std::fwrite(image.data(), 1, image.size(), f);
    bool ok = written == image.size();
    ok = (std::fclose(f) == 0) && ok;
    if (!ok) {
        std::remove(path.c_str());
        throw Error(TKB_ERROR_FILE_WRITE, "Failed to write " + path);
    }

    TKB_LOG_INFO("Saved vocabulary \"%s\" (%zu entries, %zu bytes) to %s",
                 vocab.name().c_str(), vocab.size(), image.size(), path.c_str());
}

} // namespace tkb
