#ifndef TKB_ERROR_H
#define TKB_ERROR_H

#include "tkb_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Error codes */
typedef enum tkb_error {
    TKB_SUCCESS = 0,

    /* General errors (1-99) */
    TKB_ERROR_UNKNOWN = 1,
    TKB_ERROR_INVALID_ARGUMENT = 2,
    TKB_ERROR_OUT_OF_MEMORY = 3,
    TKB_ERROR_INVALID_HANDLE = 4,
    TKB_ERROR_BUFFER_TOO_SMALL = 5,

    /* File/IO errors (100-199) */
    TKB_ERROR_FILE_NOT_FOUND = 100,
    TKB_ERROR_FILE_READ = 101,
    TKB_ERROR_FILE_WRITE = 102,
    TKB_ERROR_MMAP_FAILED = 103,

    /* Vocabulary errors (200-299) */
    TKB_ERROR_CORRUPT_VOCABULARY = 200,
    TKB_ERROR_UNKNOWN_IDENTIFIER = 201,

    /* Input errors (300-399) */
    TKB_ERROR_ENCODING = 300,
    TKB_ERROR_UNREPRESENTABLE_INPUT = 301,
    TKB_ERROR_INPUT_TOO_LARGE = 302
} tkb_error_t;

/* Get human-readable error string (static, never NULL) */
TKB_API const char* tkb_error_string(tkb_error_t error);

/* Thread-local last error */
TKB_API tkb_error_t tkb_get_last_error(void);
TKB_API const char* tkb_get_last_error_message(void);
TKB_API void tkb_clear_error(void);

#ifdef __cplusplus
}
#endif

#endif /* TKB_ERROR_H */
