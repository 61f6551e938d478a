/**
 * TokBridge - Interactive Tokenizer Example
 *
 * Loads a vocabulary and tokenizes each line typed on stdin, printing
 * the token ids and the text each one covers.
 *
 * Usage: tokenize_example <vocabulary> [special-tokens]
 *
 *   tokenize_example cl100k_base.tiktoken "<|endoftext|>=100257"
 */

#include <tkb/tkb_tokenizer.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <vocabulary> [special-tokens]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  /quit              - Exit" << std::endl;
    std::cerr << "  /info              - Show vocabulary information" << std::endl;
    std::cerr << "  /decode <ids...>   - Decode token ids" << std::endl;
    std::cerr << "  /estimate <lang> <text> - Estimate without the vocabulary" << std::endl;
}

static void print_tokens(tkb_handle_t handle, const std::string& line) {
    tkb_token_t* tokens = nullptr;
    size_t count = 0;
    tkb_diagnostic_t diag;
    tkb_error_t err = tkb_tokenize_with_offsets(handle, reinterpret_cast<const uint8_t*>(line.data()),
                                                line.size(), &tokens, &count, &diag);
    if (err != TKB_SUCCESS) {
        std::cerr << "[Error: " << tkb_error_string(err) << ": " << diag.message << "]" << std::endl;
        return;
    }

    for (size_t i = 0; i < count; ++i) {
        std::string piece = line.substr(static_cast<size_t>(tokens[i].start),
                                        static_cast<size_t>(tokens[i].end - tokens[i].start));
        std::cout << "  " << tokens[i].id << "\t\"" << piece << "\"" << std::endl;
    }
    std::cout << "[" << count << " tokens, " << line.size() << " bytes]" << std::endl;
    tkb_free_tokens(tokens);
}

static void print_decoded(tkb_handle_t handle, const std::string& args) {
    std::istringstream in(args);
    std::vector<int32_t> ids;
    int32_t id;
    while (in >> id) {
        ids.push_back(id);
    }

    char* text = nullptr;
    size_t len = 0;
    tkb_diagnostic_t diag;
    tkb_error_t err = tkb_decode(handle, ids.data(), ids.size(), &text, &len, &diag);
    if (err != TKB_SUCCESS) {
        std::cerr << "[Error: " << tkb_error_string(err) << ": " << diag.message << "]" << std::endl;
        return;
    }
    std::cout << "\"" << std::string(text, len) << "\"" << std::endl;
    tkb_free_string(text);
}

static void print_estimate(const std::string& args) {
    size_t space = args.find(' ');
    std::string lang = args.substr(0, space);
    std::string text = space == std::string::npos ? std::string() : args.substr(space + 1);
    size_t estimate = tkb_estimate_tokens(reinterpret_cast<const uint8_t*>(text.data()), text.size(),
                                          lang.c_str());
    std::cout << "~" << estimate << " tokens (" << lang << ")" << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "TokBridge v" << tkb_get_version_string() << std::endl;
    std::cout << "=================" << std::endl;

    tkb_handle_config_t config = tkb_handle_config_default();
    config.vocabulary_path = argv[1];
    config.allow_special = argc > 2;
    config.special_tokens = argc > 2 ? argv[2] : nullptr;

    tkb_handle_t handle = TKB_INVALID_HANDLE;
    tkb_diagnostic_t diag;
    if (tkb_create_handle(&config, &handle, &diag) != TKB_SUCCESS) {
        std::cerr << "Failed to load vocabulary: " << diag.message << std::endl;
        return 1;
    }

    tkb_handle_info_t info;
    if (tkb_handle_get_info(handle, &info, nullptr) == TKB_SUCCESS) {
        std::cout << "Vocabulary: " << info.vocab_size << " tokens ("
                  << info.special_count << " special), pre-tokenizer "
                  << tkb_pretokenizer_name(info.pretokenizer) << std::endl;
    }
    std::cout << std::endl;

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") {
            break;
        } else if (line == "/info") {
            char* json = nullptr;
            if (tkb_handle_get_info_json(handle, &json, nullptr) == TKB_SUCCESS) {
                std::cout << json << std::endl;
                tkb_free_string(json);
            }
        } else if (line.compare(0, 8, "/decode ") == 0) {
            print_decoded(handle, line.substr(8));
        } else if (line.compare(0, 10, "/estimate ") == 0) {
            print_estimate(line.substr(10));
        } else {
            print_tokens(handle, line);
        }
    }

    tkb_destroy_handle(handle);
    return 0;
}
