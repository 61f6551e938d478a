/**
 * TokBridge - Pre-tokenizer Unit Tests
 */

#include "text/pretokenizer.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace tkb;

static std::vector<std::string> pieces(const std::string& text,
                                       tkb_pretokenizer_t mode = TKB_PRETOKENIZER_CL100K) {
    Pretokenizer pre(mode);
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    std::vector<std::string> out;
    for (const Span& span : pre.split(data, 0, text.size())) {
        out.push_back(text.substr(span.start, span.size()));
    }
    return out;
}

static bool same(const std::vector<std::string>& got, const std::vector<std::string>& expected) {
    if (got != expected) {
        std::cerr << std::endl << "  got:";
        for (const auto& p : got) std::cerr << " [" << p << "]";
        std::cerr << std::endl;
        return false;
    }
    return true;
}

void test_words_and_spaces() {
    std::cout << "Testing words and spaces... ";

    assert(same(pieces("Hello world"), {"Hello", " world"}));
    assert(same(pieces("the cat sat"), {"the", " cat", " sat"}));
    assert(same(pieces("hello,  world!\n\nnext"), {"hello", ",", " ", " world", "!\n\n", "next"}));
    assert(same(pieces("hi  "), {"hi", "  "}));
    assert(same(pieces("a\n  b"), {"a", "\n", " ", " b"}));

    std::cout << "PASSED" << std::endl;
}

void test_contractions() {
    std::cout << "Testing contractions... ";

    assert(same(pieces("I'm here"), {"I", "'m", " here"}));
    assert(same(pieces("we'll"), {"we", "'ll"}));
    assert(same(pieces("IT'S"), {"IT", "'S"}));
    assert(same(pieces("they've"), {"they", "'ve"}));

    std::cout << "PASSED" << std::endl;
}

void test_numbers() {
    std::cout << "Testing number grouping... ";

    assert(same(pieces("12345"), {"123", "45"}));
    assert(same(pieces("x 2024"), {"x", " ", "202", "4"}));

    std::cout << "PASSED" << std::endl;
}

void test_non_ascii() {
    std::cout << "Testing non-ASCII text... ";

    assert(same(pieces("h\xC3\xA9llo w\xC3\xB6rld"), {"h\xC3\xA9llo", " w\xC3\xB6rld"}));
    assert(same(pieces("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"), {"\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"}));
    assert(same(pieces("hi\xF0\x9F\x98\x80"), {"hi", "\xF0\x9F\x98\x80"}));

    assert(Pretokenizer::is_letter(0x00E9));
    assert(!Pretokenizer::is_letter(0x1F600));
    assert(Pretokenizer::is_number(0x0661));
    assert(!Pretokenizer::is_number('a'));

    std::cout << "PASSED" << std::endl;
}

void test_pieces_tile_input() {
    std::cout << "Testing pieces tile the input... ";

    std::string text = "Some text, with 123 numbers\tand\r\nlines; it's \xC3\xA9t\xC3\xA9!  ";
    std::string joined;
    for (const auto& p : pieces(text)) {
        assert(!p.empty());
        joined += p;
    }
    assert(joined == text);

    std::cout << "PASSED" << std::endl;
}

void test_none_mode() {
    std::cout << "Testing pass-through mode... ";

    assert(same(pieces("Hello world, 123", TKB_PRETOKENIZER_NONE), {"Hello world, 123"}));
    assert(pieces("", TKB_PRETOKENIZER_NONE).empty());

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "TokBridge - Pre-tokenizer Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_words_and_spaces();
        test_contractions();
        test_numbers();
        test_non_ascii();
        test_pieces_tile_input();
        test_none_mode();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
