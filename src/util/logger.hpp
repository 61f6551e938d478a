#pragma once

#include <tkb/tkb_types.h>

// Arguments are only evaluated when the level is enabled.
#define TKB_LOG(level, ...) \
    do { if (::tkb::log::enabled(level)) ::tkb::log::write(level, __VA_ARGS__); } while (0)

#define TKB_LOG_DEBUG(...)   TKB_LOG(TKB_LOG_DEBUG, __VA_ARGS__)
#define TKB_LOG_INFO(...)    TKB_LOG(TKB_LOG_INFO, __VA_ARGS__)
#define TKB_LOG_WARNING(...) TKB_LOG(TKB_LOG_WARNING, __VA_ARGS__)
#define TKB_LOG_ERROR(...)   TKB_LOG(TKB_LOG_ERROR, __VA_ARGS__)

namespace tkb {
namespace log {

#if defined(__GNUC__) || defined(__clang__)
void write(tkb_log_level_t level, const char* format, ...) __attribute__((format(printf, 2, 3)));
#else
void write(tkb_log_level_t level, const char* format, ...);
#endif

bool enabled(tkb_log_level_t level);

void set_level(tkb_log_level_t level);
tkb_log_level_t get_level();

// NULL restores stderr
void set_callback(tkb_log_callback_t callback, void* user_data);

const char* level_name(tkb_log_level_t level);

} // namespace log
} // namespace tkb
