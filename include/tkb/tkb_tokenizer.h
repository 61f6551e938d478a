#ifndef TKB_TOKENIZER_H
#define TKB_TOKENIZER_H

#include "tkb_types.h"
#include "tkb_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/*
 * TokBridge - byte-pair-encoding tokenizer with a C ABI
 *
 * Every function takes and returns plain C data. No C++ exception ever
 * leaves the library: failures come back as a tkb_error_t, with details in
 * the optional tkb_diagnostic_t out-parameter and in the thread-local last
 * error.
 *
 * Ownership rules:
 *   - Input buffers always stay owned by the caller.
 *   - Buffers returned through `**out` parameters are owned by the caller
 *     after return and must be released with the matching tkb_free_* call.
 *   - The *_into variants write into caller-provided storage and fail with
 *     TKB_ERROR_BUFFER_TOO_SMALL (reporting the required size) instead of
 *     truncating.
 *   - Pointers returned by tkb_token_to_bytes are borrowed from the handle
 *     and stay valid until the handle is destroyed.
 *
 * Threading: a handle may be used from several threads at once; the
 * tokenizer behind it is immutable.
 *
 * Basic usage:
 *   tkb_handle_config_t cfg = tkb_handle_config_default();
 *   cfg.vocabulary_path = "cl100k_base.tiktoken";
 *
 *   tkb_handle_t h;
 *   if (tkb_create_handle(&cfg, &h, NULL) != TKB_SUCCESS) { ... }
 *
 *   int32_t* ids; size_t n;
 *   tkb_tokenize(h, (const uint8_t*)"Hello", 5, &ids, &n, NULL);
 *   tkb_free_output(ids);
 *
 *   tkb_destroy_handle(h);
 */

/* ============================================================================
 * Version
 * ============================================================================ */

/* Get version numbers */
TKB_API void tkb_get_version(int* major, int* minor, int* patch);

/* Get version string (e.g., "0.3.0") */
TKB_API const char* tkb_get_version_string(void);

/* ============================================================================
 * Handle lifecycle
 * ============================================================================ */

/*
 * Load a vocabulary and create a tokenizer handle.
 * Exactly one of config->vocabulary_path / config->vocabulary_data must be set.
 * On failure *out_handle is TKB_INVALID_HANDLE.
 *
 * @param config      Handle configuration (required)
 * @param out_handle  Receives the new handle
 * @param diag        Failure details (may be NULL)
 * @return            TKB_SUCCESS, or e.g. TKB_ERROR_CORRUPT_VOCABULARY
 */
TKB_API tkb_error_t tkb_create_handle(
    const tkb_handle_config_t* config,
    tkb_handle_t* out_handle,
    tkb_diagnostic_t* diag
);

/*
 * Create a second handle sharing the vocabulary of an existing one.
 * The vocabulary is released when the last handle using it is destroyed.
 *
 * @param source      Existing handle
 * @param out_handle  Receives the new handle
 * @param diag        Failure details (may be NULL)
 * @return            TKB_SUCCESS or TKB_ERROR_INVALID_HANDLE
 */
TKB_API tkb_error_t tkb_clone_handle(
    tkb_handle_t source,
    tkb_handle_t* out_handle,
    tkb_diagnostic_t* diag
);

/*
 * Destroy a handle. Destroying TKB_INVALID_HANDLE, an unknown value or an
 * already destroyed handle is a no-op.
 *
 * @param handle  Handle to destroy
 */
TKB_API void tkb_destroy_handle(tkb_handle_t handle);

/*
 * Check whether a handle is live.
 *
 * @return  1 if the handle can be used, 0 otherwise
 */
TKB_API int tkb_handle_is_valid(tkb_handle_t handle);

/*
 * Describe a handle's vocabulary.
 *
 * @param handle    Handle
 * @param out_info  Receives the summary
 * @param diag      Failure details (may be NULL)
 */
TKB_API tkb_error_t tkb_handle_get_info(
    tkb_handle_t handle,
    tkb_handle_info_t* out_info,
    tkb_diagnostic_t* diag
);

/*
 * Describe a handle as a JSON string.
 *
 * @param handle    Handle
 * @param out_json  Receives a NUL-terminated string (free with tkb_free_string)
 * @param diag      Failure details (may be NULL)
 */
TKB_API tkb_error_t tkb_handle_get_info_json(
    tkb_handle_t handle,
    char** out_json,
    tkb_diagnostic_t* diag
);

/* ============================================================================
 * Tokenization
 * ============================================================================ */

/*
 * Tokenize UTF-8 text. Empty input succeeds with *out_ids == NULL and
 * *out_len == 0.
 *
 * @param handle     Handle
 * @param input      UTF-8 bytes (may be NULL when input_len is 0)
 * @param input_len  Number of bytes
 * @param out_ids    Receives the token ids (free with tkb_free_output)
 * @param out_len    Receives the number of ids
 * @param diag       Failure details (may be NULL)
 * @return           TKB_SUCCESS, TKB_ERROR_ENCODING, ...
 */
TKB_API tkb_error_t tkb_tokenize(
    tkb_handle_t handle,
    const uint8_t* input,
    size_t input_len,
    int32_t** out_ids,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Tokenize into a caller-provided array.
 * If capacity is too small nothing is written, *out_len receives the
 * required count and TKB_ERROR_BUFFER_TOO_SMALL is returned.
 *
 * @param ids       Output array (may be NULL when capacity is 0)
 * @param capacity  Number of elements in ids
 * @param out_len   Receives the number of ids (or the required number)
 */
TKB_API tkb_error_t tkb_tokenize_into(
    tkb_handle_t handle,
    const uint8_t* input,
    size_t input_len,
    int32_t* ids,
    size_t capacity,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Tokenize and report the byte span of every token. Spans tile the input.
 *
 * @param out_tokens  Receives the tokens (free with tkb_free_tokens)
 * @param out_len     Receives the number of tokens
 */
TKB_API tkb_error_t tkb_tokenize_with_offsets(
    tkb_handle_t handle,
    const uint8_t* input,
    size_t input_len,
    tkb_token_t** out_tokens,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Count the tokens of UTF-8 text.
 *
 * @param out_count  Receives the number of tokens
 */
TKB_API tkb_error_t tkb_count_tokens(
    tkb_handle_t handle,
    const uint8_t* input,
    size_t input_len,
    size_t* out_count,
    tkb_diagnostic_t* diag
);

/* ============================================================================
 * Decoding
 * ============================================================================ */

/*
 * Decode token ids back to bytes. The result is NUL-terminated for
 * convenience; *out_len excludes the terminator. The bytes are not
 * guaranteed to be valid UTF-8 if the ids split a character.
 *
 * @param ids       Token ids (may be NULL when count is 0)
 * @param count     Number of ids
 * @param out_text  Receives the text (free with tkb_free_string)
 * @param out_len   Receives the text length in bytes
 * @return          TKB_SUCCESS or TKB_ERROR_UNKNOWN_IDENTIFIER
 */
TKB_API tkb_error_t tkb_decode(
    tkb_handle_t handle,
    const int32_t* ids,
    size_t count,
    char** out_text,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Decode into a caller-provided buffer. capacity must leave room for the
 * NUL terminator; otherwise *out_len receives the required length (without
 * terminator) and TKB_ERROR_BUFFER_TOO_SMALL is returned.
 */
TKB_API tkb_error_t tkb_decode_into(
    tkb_handle_t handle,
    const int32_t* ids,
    size_t count,
    char* buffer,
    size_t capacity,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Look up the byte fragment of one token id.
 *
 * @param out_bytes  Receives a pointer owned by the handle (not NUL-terminated)
 * @param out_len    Receives the fragment length
 */
TKB_API tkb_error_t tkb_token_to_bytes(
    tkb_handle_t handle,
    int32_t id,
    const uint8_t** out_bytes,
    size_t* out_len,
    tkb_diagnostic_t* diag
);

/*
 * Look up the id of an exact byte fragment.
 *
 * @param out_id  Receives the id
 * @return        TKB_SUCCESS or TKB_ERROR_UNKNOWN_IDENTIFIER
 */
TKB_API tkb_error_t tkb_bytes_to_token(
    tkb_handle_t handle,
    const uint8_t* bytes,
    size_t len,
    int32_t* out_id,
    tkb_diagnostic_t* diag
);

/* ============================================================================
 * Vocabulary export
 * ============================================================================ */

/*
 * Write the handle's vocabulary to a file in the native versioned format.
 *
 * @param path  Destination path
 */
TKB_API tkb_error_t tkb_save_vocabulary(
    tkb_handle_t handle,
    const char* path,
    tkb_diagnostic_t* diag
);

/* ============================================================================
 * Estimation
 * ============================================================================ */

/*
 * Estimate a token count without a vocabulary from the character count and
 * a per-language characters-per-token ratio ("swift", "py", "json", ...).
 * Returns 0 for empty text and at least 1 otherwise.
 *
 * @param text           UTF-8 bytes (may be NULL when len is 0)
 * @param len            Number of bytes
 * @param language_hint  Language name or file extension, or NULL
 */
TKB_API size_t tkb_estimate_tokens(const uint8_t* text, size_t len, const char* language_hint);

/* ============================================================================
 * Logging
 * ============================================================================ */

TKB_API void tkb_set_log_level(tkb_log_level_t level);
TKB_API tkb_log_level_t tkb_get_log_level(void);

/*
 * Route log lines to a callback instead of stderr. Pass NULL to restore
 * stderr output. The callback runs without any library lock held and may
 * call back into the library.
 */
TKB_API void tkb_set_log_callback(tkb_log_callback_t callback, void* user_data);

/* ============================================================================
 * Memory
 * ============================================================================ */

/* Release an array returned by tkb_tokenize (NULL is ignored) */
TKB_API void tkb_free_output(int32_t* ids);

/* Release an array returned by tkb_tokenize_with_offsets (NULL is ignored) */
TKB_API void tkb_free_tokens(tkb_token_t* tokens);

/* Release a string returned by tkb_decode or tkb_handle_get_info_json */
TKB_API void tkb_free_string(char* str);

#ifdef __cplusplus
}
#endif

#endif /* TKB_TOKENIZER_H */
