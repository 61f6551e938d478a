/**
 * TokBridge - tiktoken Import Unit Tests
 */

#include "format/tiktoken_import.hpp"
#include "format/vocab_loader.hpp"
#include "core/error.hpp"
#include "core/tokenizer.hpp"
#include "test_fixtures.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <functional>

using namespace tkb;

static tkb_error_t error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return TKB_SUCCESS;
}

static std::shared_ptr<const Vocabulary> import_text(const std::string& text,
                                                     const std::vector<SpecialToken>& specials = {}) {
    return import_tiktoken(test::bytes(text), text.size(), specials);
}

void test_base64() {
    std::cout << "Testing base64 decoding... ";

    auto decode = [](const std::string& s) { return base64_decode(s.data(), s.size()); };

    assert(decode("aGVsbG8=") == "hello");
    assert(decode("aGVsbG8") == "hello");
    assert(decode("IQ==") == "!");
    assert(decode("IHRoZQ==") == " the");
    assert(decode("") == "");
    assert(decode("/w==") == std::string(1, '\xFF'));

    assert(error_of([&] { decode("a$bc"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([&] { decode("A"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([&] { decode("QQ==="); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([&] { decode("QQ=A"); }) == TKB_ERROR_CORRUPT_VOCABULARY);

    std::cout << "PASSED" << std::endl;
}

void test_special_token_list() {
    std::cout << "Testing special token lists... ";

    auto specials = parse_special_tokens("<|endoftext|>=100257;<|fim_prefix|>=100258;");
    assert(specials.size() == 2);
    assert(specials[0].first == "<|endoftext|>" && specials[0].second == 100257);
    assert(specials[1].first == "<|fim_prefix|>" && specials[1].second == 100258);

    assert(parse_special_tokens("").empty());
    assert(parse_special_tokens(";;").empty());

    // The last '=' separates the id, so the text may contain '='
    auto eq = parse_special_tokens("<|a=b|>=7");
    assert(eq.size() == 1 && eq[0].first == "<|a=b|>" && eq[0].second == 7);

    assert(error_of([] { parse_special_tokens("<|x|>"); }) == TKB_ERROR_INVALID_ARGUMENT);
    assert(error_of([] { parse_special_tokens("=5"); }) == TKB_ERROR_INVALID_ARGUMENT);
    assert(error_of([] { parse_special_tokens("<|x|>=-1"); }) == TKB_ERROR_INVALID_ARGUMENT);
    assert(error_of([] { parse_special_tokens("<|x|>=99999999999"); }) == TKB_ERROR_INVALID_ARGUMENT);

    std::cout << "PASSED" << std::endl;
}

void test_import_rank_file() {
    std::cout << "Testing rank file import... ";

    auto vocab = import_text(test::tiktoken_text(), {{test::ENDOFTEXT, test::ENDOFTEXT_ID}});
    auto fixture = test::make_vocab();

    assert(vocab->size() == fixture->size());
    assert(vocab->special_count() == 1);
    assert(vocab->format_version() == 0);
    assert(vocab->pretokenizer() == TKB_PRETOKENIZER_CL100K);
    assert(vocab->covers_all_bytes());
    assert(*vocab->rank(" mat") == 268);
    assert(vocab->id_of(test::ENDOFTEXT) == test::ENDOFTEXT_ID);

    // Same ranks, same tokens
    Tokenizer a(vocab), b(fixture);
    const std::string text = "the cat sat on the mat, then the hat";
    assert(a.encode(text) == b.encode(text));

    std::cout << "PASSED" << std::endl;
}

void test_line_handling() {
    std::cout << "Testing line endings and blank lines... ";

    std::string text = "YQ== 0\r\n\r\nYg== 1\n\nYWI= 2";
    auto vocab = import_text(text);
    assert(vocab->size() == 3);
    assert(vocab->token_bytes(2) == "ab");

    std::cout << "PASSED" << std::endl;
}

void test_malformed_files() {
    std::cout << "Testing malformed rank files... ";

    assert(error_of([] { import_text(""); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("YQ==\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("YQ== x\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text(" 0\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("YQ== 0 1\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("Y$== 0\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("YQ== 0\nYg== 0\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);
    assert(error_of([] { import_text("YQ== 0\nYQ== 1\n"); }) == TKB_ERROR_CORRUPT_VOCABULARY);

    // A special token that collides with a rank
    assert(error_of([] { import_text("YQ== 0\n", {{"<|s|>", 0}}); }) == TKB_ERROR_CORRUPT_VOCABULARY);

    std::cout << "PASSED" << std::endl;
}

void test_load_from_file() {
    std::cout << "Testing tiktoken file loading... ";

    const std::string path = "fixture_base.tiktoken";
    {
        std::ofstream out(path, std::ios::binary);
        out << test::tiktoken_text();
    }

    VocabSource source;
    source.path = path;
    source.special_tokens = "<|endoftext|>=1000";
    auto vocab = load_vocabulary(source);
    assert(vocab->name() == "fixture_base");
    assert(vocab->is_special(1000));

    source.format = TKB_VOCAB_FORMAT_NATIVE;
    source.special_tokens.clear();
    assert(error_of([&] { load_vocabulary(source); }) == TKB_ERROR_CORRUPT_VOCABULARY);

    std::remove(path.c_str());

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "TokBridge - tiktoken Import Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_base64();
        test_special_token_list();
        test_import_rank_file();
        test_line_handling();
        test_malformed_files();
        test_load_from_file();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
