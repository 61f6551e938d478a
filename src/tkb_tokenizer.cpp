/**
 * TokBridge - C ABI Wrapper
 *
 * This file implements the public C API defined in tkb_tokenizer.h
 * by wrapping the internal C++ implementation. No exception leaves
 * this file.
 */

#include <tkb/tkb_tokenizer.h>
#include <tkb/tkb_types.h>
#include <tkb/tkb_error.h>

#include "core/error.hpp"
#include "core/estimator.hpp"
#include "core/handle_registry.hpp"
#include "core/tokenizer.hpp"
#include "format/vocab_loader.hpp"
#include "format/vocab_writer.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

// Thread-local error state
static thread_local tkb_error_t g_last_error = TKB_SUCCESS;
static thread_local char g_last_error_msg[TKB_DIAGNOSTIC_MESSAGE_SIZE] = {0};

namespace {

tkb::HandleRegistry& registry() {
    static tkb::HandleRegistry instance;
    return instance;
}

void copy_message(char* dst, size_t size, const char* message) {
    if (message) {
        strncpy(dst, message, size - 1);
        dst[size - 1] = '\0';
    } else {
        dst[0] = '\0';
    }
}

void set_error(tkb_error_t error, const char* message, tkb_diagnostic_t* diag) {
    g_last_error = error;
    copy_message(g_last_error_msg, sizeof(g_last_error_msg), message);
    if (diag) {
        diag->code = error;
        copy_message(diag->message, sizeof(diag->message), message);
    }
}

tkb_error_t fail(const char* op, tkb_diagnostic_t* diag, tkb_error_t code, const char* message) {
    set_error(code, message, diag);
    // Probing with a short buffer is routine
    if (code == TKB_ERROR_BUFFER_TOO_SMALL) {
        TKB_LOG_DEBUG("%s: %s", op, message);
    } else {
        TKB_LOG_WARNING("%s failed (%s): %s", op, tkb_error_string(code), message);
    }
    return code;
}

// Runs fn and converts whatever it throws into a status code
template<typename Fn>
tkb_error_t guarded(const char* op, tkb_diagnostic_t* diag, Fn&& fn) {
    set_error(TKB_SUCCESS, nullptr, diag);
    try {
        fn();
        return TKB_SUCCESS;
    } catch (const tkb::Error& e) {
        return fail(op, diag, e.code(), e.what());
    } catch (const std::bad_alloc&) {
        return fail(op, diag, TKB_ERROR_OUT_OF_MEMORY, "Out of memory");
    } catch (const std::exception& e) {
        return fail(op, diag, TKB_ERROR_UNKNOWN, e.what());
    } catch (...) {
        return fail(op, diag, TKB_ERROR_UNKNOWN, "Non-standard exception");
    }
}

void require(bool condition, const char* message) {
    if (!condition) {
        throw tkb::Error(TKB_ERROR_INVALID_ARGUMENT, message);
    }
}

std::shared_ptr<const tkb::Tokenizer> lookup(tkb_handle_t handle) {
    auto tokenizer = registry().find(handle);
    if (!tokenizer) {
        char buf[64];
        snprintf(buf, sizeof(buf), "Invalid handle 0x%llx", static_cast<unsigned long long>(handle));
        throw tkb::Error(TKB_ERROR_INVALID_HANDLE, buf);
    }
    return tokenizer;
}

template<typename T>
T* allocate(size_t count) {
    T* ptr = static_cast<T*>(malloc(count * sizeof(T)));
    if (!ptr) {
        throw tkb::Error(TKB_ERROR_OUT_OF_MEMORY,
                         "Failed to allocate " + std::to_string(count * sizeof(T)) + " bytes");
    }
    return ptr;
}

char* copy_string(const std::string& s) {
    char* result = allocate<char>(s.size() + 1);
    memcpy(result, s.data(), s.size());
    result[s.size()] = '\0';
    return result;
}

} // namespace

extern "C" {

// ============================================================================
// Error handling
// ============================================================================

const char* tkb_error_string(tkb_error_t error) {
    switch (error) {
        case TKB_SUCCESS: return "Success";
        case TKB_ERROR_UNKNOWN: return "Unknown error";
        case TKB_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case TKB_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case TKB_ERROR_INVALID_HANDLE: return "Invalid handle";
        case TKB_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case TKB_ERROR_FILE_NOT_FOUND: return "File not found";
        case TKB_ERROR_FILE_READ: return "File read error";
        case TKB_ERROR_FILE_WRITE: return "File write error";
        case TKB_ERROR_MMAP_FAILED: return "Memory map failed";
        case TKB_ERROR_CORRUPT_VOCABULARY: return "Corrupt vocabulary";
        case TKB_ERROR_UNKNOWN_IDENTIFIER: return "Unknown token identifier";
        case TKB_ERROR_ENCODING: return "Invalid UTF-8 input";
        case TKB_ERROR_UNREPRESENTABLE_INPUT: return "Input not representable in vocabulary";
        case TKB_ERROR_INPUT_TOO_LARGE: return "Input too large";
        default: return "Unknown error code";
    }
}

tkb_error_t tkb_get_last_error(void) {
    return g_last_error;
}

const char* tkb_get_last_error_message(void) {
    return g_last_error_msg;
}

void tkb_clear_error(void) {
    g_last_error = TKB_SUCCESS;
    g_last_error_msg[0] = '\0';
}

// ============================================================================
// Version
// ============================================================================

void tkb_get_version(int* major, int* minor, int* patch) {
    if (major) *major = TKB_VERSION_MAJOR;
    if (minor) *minor = TKB_VERSION_MINOR;
    if (patch) *patch = TKB_VERSION_PATCH;
}

#define TKB_STR_(x) #x
#define TKB_STR(x) TKB_STR_(x)

const char* tkb_get_version_string(void) {
    return TKB_STR(TKB_VERSION_MAJOR) "." TKB_STR(TKB_VERSION_MINOR) "." TKB_STR(TKB_VERSION_PATCH);
}

// ============================================================================
// Utility functions
// ============================================================================

const char* tkb_vocab_format_name(tkb_vocab_format_t format) {
    switch (format) {
        case TKB_VOCAB_FORMAT_AUTO: return "auto";
        case TKB_VOCAB_FORMAT_NATIVE: return "native";
        case TKB_VOCAB_FORMAT_TIKTOKEN: return "tiktoken";
        default: return "unknown";
    }
}

const char* tkb_pretokenizer_name(tkb_pretokenizer_t pretokenizer) {
    switch (pretokenizer) {
        case TKB_PRETOKENIZER_CL100K: return "cl100k";
        case TKB_PRETOKENIZER_NONE: return "none";
        default: return "unknown";
    }
}

// ============================================================================
// Handle lifecycle
// ============================================================================

tkb_error_t tkb_create_handle(const tkb_handle_config_t* config, tkb_handle_t* out_handle,
                              tkb_diagnostic_t* diag) {
    if (out_handle) *out_handle = TKB_INVALID_HANDLE;

    return guarded("tkb_create_handle", diag, [&] {
        require(config != nullptr, "config is NULL");
        require(out_handle != nullptr, "out_handle is NULL");

        if (config->verbose) {
            tkb::log::set_level(TKB_LOG_DEBUG);
        }

        tkb::VocabSource source;
        if (config->vocabulary_path) source.path = config->vocabulary_path;
        source.data = config->vocabulary_data;
        source.size = config->vocabulary_size;
        source.format = config->format;
        source.use_mmap = config->use_mmap;
        if (config->special_tokens) source.special_tokens = config->special_tokens;

        auto vocab = tkb::load_vocabulary(source);

        tkb::TokenizerOptions options;
        options.allow_special = config->allow_special;
        options.max_input_bytes = config->max_input_bytes;

        std::shared_ptr<const tkb::Tokenizer> tokenizer = std::make_shared<tkb::Tokenizer>(vocab, options);
        *out_handle = registry().insert(tokenizer);

        TKB_LOG_INFO("Created handle 0x%llx: vocabulary \"%s\" (%zu tokens, %zu special, %s)",
                     static_cast<unsigned long long>(*out_handle), vocab->name().c_str(),
                     vocab->size(), vocab->special_count(),
                     tkb_pretokenizer_name(vocab->pretokenizer()));
    });
}

tkb_error_t tkb_clone_handle(tkb_handle_t source, tkb_handle_t* out_handle, tkb_diagnostic_t* diag) {
    if (out_handle) *out_handle = TKB_INVALID_HANDLE;

    return guarded("tkb_clone_handle", diag, [&] {
        require(out_handle != nullptr, "out_handle is NULL");

        auto original = lookup(source);
        std::shared_ptr<const tkb::Tokenizer> tokenizer =
            std::make_shared<tkb::Tokenizer>(original->shared_vocab(), original->options());
        *out_handle = registry().insert(tokenizer);

        TKB_LOG_DEBUG("Cloned handle 0x%llx -> 0x%llx",
                      static_cast<unsigned long long>(source),
                      static_cast<unsigned long long>(*out_handle));
    });
}

void tkb_destroy_handle(tkb_handle_t handle) {
    if (handle == TKB_INVALID_HANDLE) return;

    try {
        if (registry().erase(handle)) {
            TKB_LOG_DEBUG("Destroyed handle 0x%llx", static_cast<unsigned long long>(handle));
        }
    } catch (const std::exception& e) {
        TKB_LOG_ERROR("tkb_destroy_handle: %s", e.what());
    }
}

int tkb_handle_is_valid(tkb_handle_t handle) {
    if (handle == TKB_INVALID_HANDLE) return 0;

    try {
        return registry().contains(handle) ? 1 : 0;
    } catch (const std::exception& e) {
        TKB_LOG_ERROR("tkb_handle_is_valid: %s", e.what());
        return 0;
    }
}

tkb_error_t tkb_handle_get_info(tkb_handle_t handle, tkb_handle_info_t* out_info, tkb_diagnostic_t* diag) {
    return guarded("tkb_handle_get_info", diag, [&] {
        require(out_info != nullptr, "out_info is NULL");

        auto tokenizer = lookup(handle);
        const tkb::Vocabulary& v = tokenizer->vocab();

        tkb_handle_info_t info;
        memset(&info, 0, sizeof(info));
        info.vocab_size = v.size();
        info.special_count = v.special_count();
        info.max_token_bytes = v.max_token_bytes();
        info.max_token_id = v.max_id();
        info.unknown_id = v.unknown_id();
        info.format_version = v.format_version();
        info.pretokenizer = v.pretokenizer();
        info.share_count = static_cast<uint32_t>(tokenizer->shared_vocab().use_count());
        *out_info = info;
    });
}

tkb_error_t tkb_handle_get_info_json(tkb_handle_t handle, char** out_json, tkb_diagnostic_t* diag) {
    if (out_json) *out_json = nullptr;

    return guarded("tkb_handle_get_info_json", diag, [&] {
        require(out_json != nullptr, "out_json is NULL");
        *out_json = copy_string(lookup(handle)->get_info_json());
    });
}

// ============================================================================
// Tokenization
// ============================================================================

tkb_error_t tkb_tokenize(tkb_handle_t handle, const uint8_t* input, size_t input_len,
                         int32_t** out_ids, size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_ids) *out_ids = nullptr;
    if (out_len) *out_len = 0;

    return guarded("tkb_tokenize", diag, [&] {
        require(out_ids != nullptr && out_len != nullptr, "out_ids and out_len are required");
        require(input != nullptr || input_len == 0, "input is NULL");

        auto tokenizer = lookup(handle);
        std::vector<int32_t> ids = tokenizer->encode(input, input_len);
        if (ids.empty()) return;

        int32_t* result = allocate<int32_t>(ids.size());
        memcpy(result, ids.data(), ids.size() * sizeof(int32_t));
        *out_ids = result;
        *out_len = ids.size();

        TKB_LOG_DEBUG("Tokenized %zu bytes into %zu tokens", input_len, ids.size());
    });
}

tkb_error_t tkb_tokenize_into(tkb_handle_t handle, const uint8_t* input, size_t input_len,
                              int32_t* ids, size_t capacity, size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_len) *out_len = 0;

    return guarded("tkb_tokenize_into", diag, [&] {
        require(out_len != nullptr, "out_len is NULL");
        require(ids != nullptr || capacity == 0, "ids is NULL");
        require(input != nullptr || input_len == 0, "input is NULL");

        auto tokenizer = lookup(handle);
        std::vector<int32_t> result = tokenizer->encode(input, input_len);

        *out_len = result.size();
        if (result.size() > capacity) {
            throw tkb::Error(TKB_ERROR_BUFFER_TOO_SMALL,
                             std::to_string(result.size()) + " tokens do not fit in a buffer of " +
                             std::to_string(capacity));
        }
        if (!result.empty()) {
            memcpy(ids, result.data(), result.size() * sizeof(int32_t));
        }
    });
}

tkb_error_t tkb_tokenize_with_offsets(tkb_handle_t handle, const uint8_t* input, size_t input_len,
                                      tkb_token_t** out_tokens, size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_tokens) *out_tokens = nullptr;
    if (out_len) *out_len = 0;

    return guarded("tkb_tokenize_with_offsets", diag, [&] {
        require(out_tokens != nullptr && out_len != nullptr, "out_tokens and out_len are required");
        require(input != nullptr || input_len == 0, "input is NULL");

        auto tokenizer = lookup(handle);
        std::vector<tkb::Token> tokens = tokenizer->encode_with_offsets(input, input_len);
        if (tokens.empty()) return;

        tkb_token_t* result = allocate<tkb_token_t>(tokens.size());
        for (size_t i = 0; i < tokens.size(); ++i) {
            result[i].id = tokens[i].id;
            result[i].reserved = 0;
            result[i].start = tokens[i].start;
            result[i].end = tokens[i].end;
        }
        *out_tokens = result;
        *out_len = tokens.size();
    });
}

tkb_error_t tkb_count_tokens(tkb_handle_t handle, const uint8_t* input, size_t input_len,
                             size_t* out_count, tkb_diagnostic_t* diag) {
    if (out_count) *out_count = 0;

    return guarded("tkb_count_tokens", diag, [&] {
        require(out_count != nullptr, "out_count is NULL");
        require(input != nullptr || input_len == 0, "input is NULL");

        *out_count = lookup(handle)->count(input, input_len);
    });
}

// ============================================================================
// Decoding
// ============================================================================

tkb_error_t tkb_decode(tkb_handle_t handle, const int32_t* ids, size_t count,
                       char** out_text, size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_text) *out_text = nullptr;
    if (out_len) *out_len = 0;

    return guarded("tkb_decode", diag, [&] {
        require(out_text != nullptr && out_len != nullptr, "out_text and out_len are required");
        require(ids != nullptr || count == 0, "ids is NULL");

        std::string text = lookup(handle)->decode(ids, count);
        *out_text = copy_string(text);
        *out_len = text.size();
    });
}

tkb_error_t tkb_decode_into(tkb_handle_t handle, const int32_t* ids, size_t count,
                            char* buffer, size_t capacity, size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_len) *out_len = 0;

    return guarded("tkb_decode_into", diag, [&] {
        require(out_len != nullptr, "out_len is NULL");
        require(buffer != nullptr || capacity == 0, "buffer is NULL");
        require(ids != nullptr || count == 0, "ids is NULL");

        auto tokenizer = lookup(handle);
        size_t needed = tokenizer->decoded_size(ids, count);

        *out_len = needed;
        if (needed >= capacity) {
            throw tkb::Error(TKB_ERROR_BUFFER_TOO_SMALL,
                             std::to_string(needed + 1) + " bytes do not fit in a buffer of " +
                             std::to_string(capacity));
        }

        const tkb::Vocabulary& v = tokenizer->vocab();
        size_t pos = 0;
        for (size_t i = 0; i < count; ++i) {
            const std::string& bytes = v.token_bytes(ids[i]);
            memcpy(buffer + pos, bytes.data(), bytes.size());
            pos += bytes.size();
        }
        buffer[pos] = '\0';
    });
}

tkb_error_t tkb_token_to_bytes(tkb_handle_t handle, int32_t id, const uint8_t** out_bytes,
                               size_t* out_len, tkb_diagnostic_t* diag) {
    if (out_bytes) *out_bytes = nullptr;
    if (out_len) *out_len = 0;

    return guarded("tkb_token_to_bytes", diag, [&] {
        require(out_bytes != nullptr && out_len != nullptr, "out_bytes and out_len are required");

        const std::string& bytes = lookup(handle)->vocab().token_bytes(id);
        *out_bytes = reinterpret_cast<const uint8_t*>(bytes.data());
        *out_len = bytes.size();
    });
}

tkb_error_t tkb_bytes_to_token(tkb_handle_t handle, const uint8_t* bytes, size_t len,
                               int32_t* out_id, tkb_diagnostic_t* diag) {
    if (out_id) *out_id = -1;

    return guarded("tkb_bytes_to_token", diag, [&] {
        require(out_id != nullptr, "out_id is NULL");
        require(bytes != nullptr || len == 0, "bytes is NULL");

        auto tokenizer = lookup(handle);
        std::string fragment(reinterpret_cast<const char*>(bytes), len);
        *out_id = tokenizer->vocab().id_of(fragment);
    });
}

// ============================================================================
// Vocabulary export
// ============================================================================

tkb_error_t tkb_save_vocabulary(tkb_handle_t handle, const char* path, tkb_diagnostic_t* diag) {
    return guarded("tkb_save_vocabulary", diag, [&] {
        require(path != nullptr && path[0] != '\0', "path is empty");
        tkb::save_vocabulary(lookup(handle)->vocab(), path);
    });
}

// ============================================================================
// Estimation
// ============================================================================

size_t tkb_estimate_tokens(const uint8_t* text, size_t len, const char* language_hint) {
    if (text == nullptr || len == 0) return 0;

    try {
        return tkb::estimate_tokens(text, len, language_hint ? language_hint : "");
    } catch (const std::bad_alloc&) {
        set_error(TKB_ERROR_OUT_OF_MEMORY, "Out of memory", nullptr);
        TKB_LOG_ERROR("tkb_estimate_tokens: out of memory");
        return 0;
    }
}

// ============================================================================
// Logging
// ============================================================================

void tkb_set_log_level(tkb_log_level_t level) {
    if (level < TKB_LOG_DEBUG || level > TKB_LOG_NONE) {
        TKB_LOG_WARNING("Ignoring invalid log level %d", static_cast<int>(level));
        return;
    }
    tkb::log::set_level(level);
}

tkb_log_level_t tkb_get_log_level(void) {
    return tkb::log::get_level();
}

void tkb_set_log_callback(tkb_log_callback_t callback, void* user_data) {
    tkb::log::set_callback(callback, user_data);
}

// ============================================================================
// Memory
// ============================================================================

void tkb_free_output(int32_t* ids) {
    free(ids);
}

void tkb_free_tokens(tkb_token_t* tokens) {
    free(tokens);
}

void tkb_free_string(char* str) {
    free(str);
}

} // extern "C"
