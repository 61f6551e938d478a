/**
 * TokBridge - Vocabulary Format Unit Tests
 */

#include "format/mapped_file.hpp"
#include "format/vocab_parser.hpp"
#include "format/vocab_writer.hpp"
#include "format/vocab_loader.hpp"
#include "format/vocab_types.hpp"
#include "core/error.hpp"
#include "test_fixtures.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>

using namespace tkb;

// Hand-assembled images for the malformed cases
class ImageBuilder {
public:
    template<typename T>
    ImageBuilder& put(T value) {
        char buf[sizeof(T)];
        std::memcpy(buf, &value, sizeof(T));
        data_.append(buf, sizeof(T));
        return *this;
    }

    ImageBuilder& str(const std::string& s) {
        put<uint64_t>(s.size());
        data_ += s;
        return *this;
    }

    ImageBuilder& header(uint64_t kv_count, uint32_t version = TKBV_VERSION) {
        return put<uint32_t>(TKBV_MAGIC).put<uint32_t>(version).put<uint64_t>(kv_count);
    }

    ImageBuilder& entry(uint32_t id, const std::string& bytes, uint8_t flags = 0) {
        put<uint32_t>(id).put<uint8_t>(flags).put<uint32_t>(static_cast<uint32_t>(bytes.size()));
        data_ += bytes;
        return *this;
    }

    const std::string& data() const { return data_; }

private:
    std::string data_;
};

static tkb_error_t parse_error(const std::string& image) {
    try {
        VocabFile::parse(reinterpret_cast<const uint8_t*>(image.data()), image.size());
    } catch (const Error& e) {
        return e.code();
    }
    return TKB_SUCCESS;
}

static tkb_error_t error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return TKB_SUCCESS;
}

void test_serialize_and_parse() {
    std::cout << "Testing native format save/load... ";

    auto vocab = test::make_vocab();
    std::string image = serialize_vocabulary(*vocab);

    auto file = VocabFile::parse(reinterpret_cast<const uint8_t*>(image.data()), image.size());
    assert(file->version() == TKBV_VERSION);
    assert(file->get_string(VocabKeys::GENERAL_NAME) == "fixture");
    assert(file->get_string(VocabKeys::PRETOKENIZER) == "cl100k");
    assert(!file->has_metadata(VocabKeys::UNKNOWN_ID));
    assert(file->metadata_count() == 2);
    assert(file->entry_count() == vocab->size());

    const Vocabulary& loaded = *file->vocabulary();
    assert(loaded.size() == vocab->size());
    assert(loaded.special_count() == 1);
    assert(loaded.name() == "fixture");
    assert(loaded.format_version() == 1);
    assert(loaded.is_special(test::ENDOFTEXT_ID));
    assert(loaded.token_bytes(262) == " cat");
    assert(*loaded.rank("the") == 258);
    assert(loaded.covers_all_bytes());

    std::cout << "PASSED" << std::endl;
}

void test_metadata_options() {
    std::cout << "Testing vocabulary metadata... ";

    ImageBuilder b;
    b.header(3)
     .str(VocabKeys::GENERAL_NAME).put<uint32_t>(static_cast<uint32_t>(MetadataType::STRING)).str("tiny")
     .str(VocabKeys::PRETOKENIZER).put<uint32_t>(static_cast<uint32_t>(MetadataType::STRING)).str("none")
     .str(VocabKeys::UNKNOWN_ID).put<uint32_t>(static_cast<uint32_t>(MetadataType::UINT32)).put<uint32_t>(0)
     .put<uint64_t>(2)
     .entry(0, "?")
     .entry(1, "a");

    auto file = VocabFile::parse(reinterpret_cast<const uint8_t*>(b.data().data()), b.data().size());
    const Vocabulary& v = *file->vocabulary();
    assert(v.name() == "tiny");
    assert(v.pretokenizer() == TKB_PRETOKENIZER_NONE);
    assert(v.unknown_id() == 0);
    assert(!v.covers_all_bytes());

    // The unknown id survives a save/load cycle
    std::string again = serialize_vocabulary(v);
    auto reloaded = VocabFile::parse(reinterpret_cast<const uint8_t*>(again.data()), again.size());
    assert(reloaded->vocabulary()->unknown_id() == 0);
    assert(reloaded->vocabulary()->pretokenizer() == TKB_PRETOKENIZER_NONE);

    std::cout << "PASSED" << std::endl;
}

void test_version_mismatch() {
    std::cout << "Testing version mismatch fails closed... ";

    std::string image = serialize_vocabulary(*test::make_vocab());
    uint32_t future = TKBV_VERSION + 1;
    std::memcpy(&image[4], &future, sizeof(future));
    assert(parse_error(image) == TKB_ERROR_CORRUPT_VOCABULARY);

    uint32_t zero = 0;
    std::memcpy(&image[4], &zero, sizeof(zero));
    assert(parse_error(image) == TKB_ERROR_CORRUPT_VOCABULARY);

    std::cout << "PASSED" << std::endl;
}

void test_structural_corruption() {
    std::cout << "Testing corrupt images... ";

    std::string good = serialize_vocabulary(*test::make_vocab());
    assert(parse_error(good) == TKB_SUCCESS);

    std::string bad_magic = good;
    bad_magic[0] = 'X';
    assert(parse_error(bad_magic) == TKB_ERROR_CORRUPT_VOCABULARY);

    assert(parse_error(good.substr(0, good.size() - 1)) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(parse_error(good + std::string(1, '\0')) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(parse_error("") == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(parse_error("TKB") == TKB_ERROR_CORRUPT_VOCABULARY);

    // Flags outside the defined bits
    ImageBuilder flags;
    flags.header(0).put<uint64_t>(1).entry(0, "a", 0x80);
    assert(parse_error(flags.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Duplicate id
    ImageBuilder dup_id;
    dup_id.header(0).put<uint64_t>(2).entry(7, "a").entry(7, "b");
    assert(parse_error(dup_id.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Duplicate fragment
    ImageBuilder dup_bytes;
    dup_bytes.header(0).put<uint64_t>(2).entry(1, "ab").entry(2, "ab");
    assert(parse_error(dup_bytes.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Empty fragment
    ImageBuilder empty;
    empty.header(0).put<uint64_t>(1).entry(1, "");
    assert(parse_error(empty.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // No entries at all
    ImageBuilder none;
    none.header(0).put<uint64_t>(0);
    assert(parse_error(none.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Entry count far beyond the data
    ImageBuilder huge;
    huge.header(0).put<uint64_t>(1ull << 40).entry(0, "a");
    assert(parse_error(huge.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Unknown metadata type
    ImageBuilder bad_type;
    bad_type.header(1).str("x").put<uint32_t>(99).put<uint64_t>(1).entry(0, "a");
    assert(parse_error(bad_type.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Unknown pre-tokenizer name
    ImageBuilder bad_pre;
    bad_pre.header(1).str(VocabKeys::PRETOKENIZER)
           .put<uint32_t>(static_cast<uint32_t>(MetadataType::STRING)).str("gpt9")
           .put<uint64_t>(1).entry(0, "a");
    assert(parse_error(bad_pre.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Unknown token id that is not in the table
    ImageBuilder bad_unk;
    bad_unk.header(1).str(VocabKeys::UNKNOWN_ID)
           .put<uint32_t>(static_cast<uint32_t>(MetadataType::INT32)).put<int32_t>(5)
           .put<uint64_t>(1).entry(0, "a");
    assert(parse_error(bad_unk.data()) == TKB_ERROR_CORRUPT_VOCABULARY);

    // Array metadata is accepted and skipped
    ImageBuilder array;
    array.header(1).str("general.tags")
         .put<uint32_t>(static_cast<uint32_t>(MetadataType::ARRAY))
         .put<uint32_t>(static_cast<uint32_t>(MetadataType::UINT16)).put<uint64_t>(2)
         .put<uint16_t>(1).put<uint16_t>(2)
         .put<uint64_t>(1).entry(0, "a");
    assert(parse_error(array.data()) == TKB_SUCCESS);

    std::cout << "PASSED" << std::endl;
}

void test_file_loading() {
    std::cout << "Testing vocabulary files... ";

    auto vocab = test::make_vocab();
    const std::string path = "test_vocab_format.tkbv";
    save_vocabulary(*vocab, path);

    for (bool use_mmap : {true, false}) {
        VocabSource source;
        source.path = path;
        source.use_mmap = use_mmap;
        auto loaded = load_vocabulary(source);
        assert(loaded->size() == vocab->size());
        assert(loaded->token_bytes(268) == " mat");

        auto mapped = MappedFile::open(path, use_mmap);
        assert(mapped->path() == path);
        assert(mapped->is_mmap() == use_mmap);
        assert(mapped->size() == serialize_vocabulary(*vocab).size());
    }

    // Explicit format that does not match the content
    VocabSource wrong;
    wrong.path = path;
    wrong.format = TKB_VOCAB_FORMAT_TIKTOKEN;
    assert(error_of([&] { load_vocabulary(wrong); }) == TKB_ERROR_CORRUPT_VOCABULARY);

    std::remove(path.c_str());

    VocabSource missing;
    missing.path = "does-not-exist.tkbv";
    assert(error_of([&] { load_vocabulary(missing); }) == TKB_ERROR_FILE_NOT_FOUND);

    assert(error_of([&] { save_vocabulary(*vocab, "no-such-dir/out.tkbv"); }) == TKB_ERROR_FILE_WRITE);

    std::cout << "PASSED" << std::endl;
}

void test_source_validation() {
    std::cout << "Testing vocabulary source checks... ";

    std::string image = serialize_vocabulary(*test::make_vocab());

    VocabSource neither;
    assert(error_of([&] { load_vocabulary(neither); }) == TKB_ERROR_INVALID_ARGUMENT);

    VocabSource both;
    both.path = "x.tkbv";
    both.data = test::bytes(image);
    both.size = image.size();
    assert(error_of([&] { load_vocabulary(both); }) == TKB_ERROR_INVALID_ARGUMENT);

    VocabSource memory;
    memory.data = test::bytes(image);
    memory.size = image.size();
    assert(load_vocabulary(memory)->size() == test::make_vocab()->size());

    memory.special_tokens = "<|x|>=5000";
    assert(error_of([&] { load_vocabulary(memory); }) == TKB_ERROR_INVALID_ARGUMENT);

    assert(detect_vocab_format(test::bytes(image), image.size()) == TKB_VOCAB_FORMAT_NATIVE);
    std::string text = "IQ== 0\n";
    assert(detect_vocab_format(test::bytes(text), text.size()) == TKB_VOCAB_FORMAT_TIKTOKEN);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "TokBridge - Vocabulary Format Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_serialize_and_parse();
        test_metadata_options();
        test_version_mismatch();
        test_structural_corruption();
        test_file_loading();
        test_source_validation();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
