/**
 * TokBridge - Vocabulary Tool
 *
 * Inspects vocabularies and converts tiktoken rank files to the native
 * versioned format.
 *
 * Usage:
 *   vocab_tool info <vocabulary>
 *   vocab_tool convert <input> <output.tkbv> [special-tokens]
 */

#include <tkb/tkb_tokenizer.h>
#include <iostream>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage:" << std::endl;
    std::cerr << "  " << program << " info <vocabulary>" << std::endl;
    std::cerr << "  " << program << " convert <input> <output.tkbv> [special-tokens]" << std::endl;
}

static tkb_handle_t open_vocabulary(const char* path, const char* specials) {
    tkb_handle_config_t config = tkb_handle_config_default();
    config.vocabulary_path = path;
    config.special_tokens = specials;

    tkb_handle_t handle = TKB_INVALID_HANDLE;
    tkb_diagnostic_t diag;
    if (tkb_create_handle(&config, &handle, &diag) != TKB_SUCCESS) {
        std::cerr << "Failed to load " << path << ": " << diag.message << std::endl;
        return TKB_INVALID_HANDLE;
    }
    return handle;
}

static int run_info(const char* path) {
    tkb_handle_t handle = open_vocabulary(path, nullptr);
    if (handle == TKB_INVALID_HANDLE) return 1;

    char* json = nullptr;
    tkb_diagnostic_t diag;
    if (tkb_handle_get_info_json(handle, &json, &diag) != TKB_SUCCESS) {
        std::cerr << "Failed to describe vocabulary: " << diag.message << std::endl;
        tkb_destroy_handle(handle);
        return 1;
    }

    std::cout << json << std::endl;
    tkb_free_string(json);
    tkb_destroy_handle(handle);
    return 0;
}

static int run_convert(const char* input, const char* output, const char* specials) {
    tkb_handle_t handle = open_vocabulary(input, specials);
    if (handle == TKB_INVALID_HANDLE) return 1;

    tkb_diagnostic_t diag;
    if (tkb_save_vocabulary(handle, output, &diag) != TKB_SUCCESS) {
        std::cerr << "Failed to write " << output << ": " << diag.message << std::endl;
        tkb_destroy_handle(handle);
        return 1;
    }

    tkb_handle_info_t info;
    if (tkb_handle_get_info(handle, &info, nullptr) == TKB_SUCCESS) {
        std::cout << "Wrote " << info.vocab_size << " tokens (" << info.special_count
                  << " special) to " << output << std::endl;
    }
    tkb_destroy_handle(handle);
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "info" && argc == 3) {
        return run_info(argv[2]);
    }
    if (command == "convert" && (argc == 4 || argc == 5)) {
        return run_convert(argv[2], argv[3], argc == 5 ? argv[4] : nullptr);
    }

    print_usage(argv[0]);
    return 1;
}
