#include "logger.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace tkb {
namespace log {

namespace {

std::atomic<int> current_level{TKB_LOG_WARNING};

std::mutex sink_mutex;
tkb_log_callback_t sink_callback = nullptr;
void* sink_user_data = nullptr;

} // namespace

const char* level_name(tkb_log_level_t level) {
    switch (level) {
        case TKB_LOG_DEBUG: return "DEBUG";
        case TKB_LOG_INFO: return "INFO";
        case TKB_LOG_WARNING: return "WARNING";
        case TKB_LOG_ERROR: return "ERROR";
        default: return "NONE";
    }
}

bool enabled(tkb_log_level_t level) {
    return level != TKB_LOG_NONE && static_cast<int>(level) >= current_level.load(std::memory_order_relaxed);
}

void write(tkb_log_level_t level, const char* format, ...) {
    if (!enabled(level)) {
        return;
    }

    char message[1024];

    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    tkb_log_callback_t callback;
    void* user_data;
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        callback = sink_callback;
        user_data = sink_user_data;
        if (!callback) {
            std::fprintf(stderr, "[tokbridge] [%s] %s\n", level_name(level), message);
            return;
        }
    }

    // Called unlocked: the host may call back into the library
    callback(level, message, user_data);
}

void set_level(tkb_log_level_t level) {
    current_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

tkb_log_level_t get_level() {
    return static_cast<tkb_log_level_t>(current_level.load(std::memory_order_relaxed));
}

void set_callback(tkb_log_callback_t callback, void* user_data) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    sink_callback = callback;
    sink_user_data = callback ? user_data : nullptr;
}

} // namespace log
} // namespace tkb
