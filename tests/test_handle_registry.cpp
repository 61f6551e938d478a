/**
 * TokBridge - Handle Registry Unit Tests
 */

#include "core/handle_registry.hpp"
#include "test_fixtures.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>

using namespace tkb;

static std::shared_ptr<const Tokenizer> make_tokenizer() {
    return std::make_shared<Tokenizer>(test::make_vocab());
}

void test_insert_find_erase() {
    std::cout << "Testing insert/find/erase... ";

    HandleRegistry registry;
    auto tok = make_tokenizer();

    tkb_handle_t h = registry.insert(tok);
    assert(h != TKB_INVALID_HANDLE);
    assert(registry.find(h) == tok);
    assert(registry.size() == 1);

    assert(registry.erase(h));
    assert(!registry.erase(h));
    assert(registry.find(h) == nullptr);
    assert(registry.size() == 0);

    std::cout << "PASSED" << std::endl;
}

void test_invalid_keys() {
    std::cout << "Testing forged and zero keys... ";

    HandleRegistry registry;
    tkb_handle_t h = registry.insert(make_tokenizer());

    assert(!registry.contains(TKB_INVALID_HANDLE));
    assert(!registry.contains(h + 1));                          // other slot
    assert(!registry.contains(h ^ (1ull << 32)));               // other generation
    assert(!registry.contains(0xFFFFFFFFFFFFFFFFull));
    assert(!registry.erase(0x12345678));
    assert(registry.contains(h));

    std::cout << "PASSED" << std::endl;
}

void test_slot_reuse() {
    std::cout << "Testing slot reuse with generations... ";

    HandleRegistry registry;
    tkb_handle_t first = registry.insert(make_tokenizer());
    assert(registry.erase(first));

    tkb_handle_t second = registry.insert(make_tokenizer());
    assert(second != first);
    assert((second & 0xFFFFFFFFu) == (first & 0xFFFFFFFFu));     // same slot
    assert(!registry.contains(first));
    assert(registry.contains(second));

    std::cout << "PASSED" << std::endl;
}

void test_lookup_keeps_tokenizer_alive() {
    std::cout << "Testing in-flight lookups survive erase... ";

    HandleRegistry registry;
    tkb_handle_t h = registry.insert(make_tokenizer());

    auto held = registry.find(h);
    std::weak_ptr<const Tokenizer> weak = held;
    assert(registry.erase(h));
    assert(!weak.expired());
    assert(held->encode("the cat").size() == 2);

    held.reset();
    assert(weak.expired());

    std::cout << "PASSED" << std::endl;
}

void test_concurrent_access() {
    std::cout << "Testing concurrent access... ";

    HandleRegistry registry;
    tkb_handle_t shared = registry.insert(make_tokenizer());
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                tkb_handle_t own = registry.insert(make_tokenizer());
                auto tok = registry.find(shared);
                if (!tok || tok->encode("the mat") != std::vector<int32_t>{258, 268}) {
                    failures++;
                }
                if (!registry.erase(own)) {
                    failures++;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    assert(failures == 0);
    assert(registry.size() == 1);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "TokBridge - Handle Registry Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_insert_find_erase();
        test_invalid_keys();
        test_slot_reuse();
        test_lookup_keeps_tokenizer_alive();
        test_concurrent_access();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
