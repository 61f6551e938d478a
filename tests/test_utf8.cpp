/**
 * TokBridge - UTF-8 Unit Tests
 */

#include "text/utf8.hpp"
#include "core/error.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace tkb;

static size_t invalid_at(const std::string& s) {
    return utf8::find_invalid(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void test_valid_input() {
    std::cout << "Testing valid UTF-8... ";

    assert(invalid_at("") == utf8::npos);
    assert(invalid_at("plain ascii") == utf8::npos);
    assert(invalid_at("h\xC3\xA9llo") == utf8::npos);           // é
    assert(invalid_at("\xE2\x82\xAC 5") == utf8::npos);          // €
    assert(invalid_at("\xF0\x9F\x98\x80") == utf8::npos);        // U+1F600
    assert(invalid_at("\xF4\x8F\xBF\xBF") == utf8::npos);        // U+10FFFF

    std::cout << "PASSED" << std::endl;
}

void test_invalid_input() {
    std::cout << "Testing invalid UTF-8 offsets... ";

    assert(invalid_at("\x80") == 0);                    // stray continuation
    assert(invalid_at("ab\xC0\xAF") == 2);              // overlong '/'
    assert(invalid_at("ab\xED\xA0\x80") == 2);          // surrogate
    assert(invalid_at("\xF4\x90\x80\x80") == 0);        // above U+10FFFF
    assert(invalid_at("a\xE2\x82") == 1);               // truncated
    assert(invalid_at("ok\xFF") == 2);
    assert(invalid_at("x\xC3(") == 1);                  // bad continuation

    std::cout << "PASSED" << std::endl;
}

void test_validate_throws() {
    std::cout << "Testing validate error... ";

    std::string bad = "abc\xFE";
    bool thrown = false;
    try {
        utf8::validate(reinterpret_cast<const uint8_t*>(bad.data()), bad.size());
    } catch (const Error& e) {
        thrown = true;
        assert(e.code() == TKB_ERROR_ENCODING);
        assert(std::string(e.what()).find("byte 3") != std::string::npos);
    }
    assert(thrown);

    std::cout << "PASSED" << std::endl;
}

void test_decode() {
    std::cout << "Testing code point decoding... ";

    std::string s = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data());
    size_t n = 0;

    assert(utf8::decode(p, s.size(), 0, &n) == 'a' && n == 1);
    assert(utf8::decode(p, s.size(), 1, &n) == 0xE9 && n == 2);
    assert(utf8::decode(p, s.size(), 3, &n) == 0x20AC && n == 3);
    assert(utf8::decode(p, s.size(), 6, &n) == 0x1F600 && n == 4);

    assert(utf8::count_code_points(p, s.size()) == 4);

    std::cout << "PASSED" << std::endl;
}

void test_whitespace() {
    std::cout << "Testing whitespace classes... ";

    assert(utf8::is_whitespace(' '));
    assert(utf8::is_whitespace('\t'));
    assert(utf8::is_whitespace('\n'));
    assert(utf8::is_whitespace('\r'));
    assert(utf8::is_whitespace(0x00A0));
    assert(utf8::is_whitespace(0x3000));
    assert(!utf8::is_whitespace('a'));
    assert(!utf8::is_whitespace(0x200B));   // zero width space is not White_Space

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "TokBridge - UTF-8 Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_valid_input();
        test_invalid_input();
        test_validate_throws();
        test_decode();
        test_whitespace();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
