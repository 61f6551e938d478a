#ifndef TKB_TYPES_H
#define TKB_TYPES_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Version info */
#define TKB_VERSION_MAJOR 0
#define TKB_VERSION_MINOR 3
#define TKB_VERSION_PATCH 0

/* Export macros */
#if defined(TKB_STATIC)
    #define TKB_API
#elif defined(_WIN32)
    #ifdef TKB_BUILD_SHARED
        #define TKB_API __declspec(dllexport)
    #else
        #define TKB_API __declspec(dllimport)
    #endif
#else
    #define TKB_API __attribute__((visibility("default")))
#endif

/* Length of the message buffer inside tkb_diagnostic_t */
#define TKB_DIAGNOSTIC_MESSAGE_SIZE 256

/*
 * Opaque tokenizer handle.
 * A key into the library's handle table, never a pointer. 0 is never valid.
 */
typedef uint64_t tkb_handle_t;

#define TKB_INVALID_HANDLE ((tkb_handle_t)0)

/*
 * Vocabulary source formats. AUTO reads anything without the .tkbv magic as
 * a tiktoken file; tiktoken files carry no version and are not version checked.
 */
typedef enum tkb_vocab_format {
    TKB_VOCAB_FORMAT_AUTO = 0,      /* Sniff the magic number */
    TKB_VOCAB_FORMAT_NATIVE = 1,    /* Versioned .tkbv binary */
    TKB_VOCAB_FORMAT_TIKTOKEN = 2,  /* "<base64> <rank>" lines */
    TKB_VOCAB_FORMAT_COUNT
} tkb_vocab_format_t;

/* Pre-tokenizers a vocabulary can request */
typedef enum tkb_pretokenizer {
    TKB_PRETOKENIZER_CL100K = 0,    /* cl100k_base splitting rules */
    TKB_PRETOKENIZER_NONE = 1,      /* Whole input is one piece */
    TKB_PRETOKENIZER_COUNT
} tkb_pretokenizer_t;

/* Log levels */
typedef enum tkb_log_level {
    TKB_LOG_DEBUG = 0,
    TKB_LOG_INFO = 1,
    TKB_LOG_WARNING = 2,
    TKB_LOG_ERROR = 3,
    TKB_LOG_NONE = 4
} tkb_log_level_t;

/* Handle creation options */
typedef struct tkb_handle_config {
    const char* vocabulary_path;    /* Vocabulary file, or NULL */
    const uint8_t* vocabulary_data; /* In-memory vocabulary, or NULL (copied) */
    size_t vocabulary_size;         /* Size of vocabulary_data in bytes */
    tkb_vocab_format_t format;      /* Vocabulary format (default: AUTO) */
    bool use_mmap;                  /* Memory-map vocabulary_path */
    bool allow_special;             /* Match special token text in input */
    const char* special_tokens;     /* Extra specials for tiktoken files: "<|a|>=1;<|b|>=2" */
    size_t max_input_bytes;         /* Reject larger inputs (0 = unlimited) */
    bool verbose;                   /* Lower the process-wide log level to DEBUG; not undone on destroy */
} tkb_handle_config_t;

/* One token with its byte span in the input */
typedef struct tkb_token {
    int32_t id;                     /* Token identifier */
    uint32_t reserved;              /* Always 0 */
    uint64_t start;                 /* First byte of the token in the input */
    uint64_t end;                   /* One past the last byte */
} tkb_token_t;

/* Failure details returned through an optional out-parameter */
typedef struct tkb_diagnostic {
    int32_t code;                   /* tkb_error_t value */
    char message[TKB_DIAGNOSTIC_MESSAGE_SIZE];
} tkb_diagnostic_t;

/* Summary of a loaded handle */
typedef struct tkb_handle_info {
    size_t vocab_size;              /* Number of entries, specials included */
    size_t special_count;           /* Number of special tokens */
    size_t max_token_bytes;         /* Longest fragment */
    int32_t max_token_id;           /* Largest identifier */
    int32_t unknown_id;             /* Unknown token, or -1 */
    uint32_t format_version;        /* Native format version it was loaded as (0 for tiktoken) */
    tkb_pretokenizer_t pretokenizer;
    uint32_t share_count;           /* Handles sharing this vocabulary */
} tkb_handle_info_t;

/* Log sink: receives every formatted line (without trailing newline) */
typedef void (*tkb_log_callback_t)(tkb_log_level_t level, const char* message, void* user_data);

/* Helper functions for default configs */
static inline tkb_handle_config_t tkb_handle_config_default(void) {
    tkb_handle_config_t config;
    config.vocabulary_path = NULL;
    config.vocabulary_data = NULL;
    config.vocabulary_size = 0;
    config.format = TKB_VOCAB_FORMAT_AUTO;
    config.use_mmap = true;
    config.allow_special = false;
    config.special_tokens = NULL;
    config.max_input_bytes = 0;
    config.verbose = false;
    return config;
}

/* Utility functions */
TKB_API const char* tkb_vocab_format_name(tkb_vocab_format_t format);
TKB_API const char* tkb_pretokenizer_name(tkb_pretokenizer_t pretokenizer);

#ifdef __cplusplus
}
#endif

#endif /* TKB_TYPES_H */
