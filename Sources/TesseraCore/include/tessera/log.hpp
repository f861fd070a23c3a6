#pragma once

#ifdef __cplusplus

#include <atomic>
#include <optional>
#include <string>

namespace tessera {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in TesseraCore/src/tessera.cpp.
extern std::atomic<log_level> g_log_level;

/// Set once set_log_level() has been called explicitly, so the
/// TESSERA_LOG_LEVEL environment variable no longer applies.
extern std::atomic<bool> g_log_level_explicit;

inline void set_log_level(log_level level) {
    g_log_level_explicit.store(true, std::memory_order_relaxed);
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// Parse "off", "error", "warn", "info" or "debug".
std::optional<log_level> parse_log_level(const std::string& name);

const char* log_level_name(log_level level);

/// Seed the level from TESSERA_LOG_LEVEL unless set_log_level() already ran.
void init_log_level_from_env();

inline bool log_enabled(log_level level) {
    return level != log_level::off &&
           static_cast<int>(level) <= static_cast<int>(g_log_level.load(std::memory_order_relaxed));
}

/// Format one line and hand it to stderr in a single write, so lines from
/// threads sharing a connection do not interleave.
/// Output: "tessera <level> [<tag>] <message>".
void log_write(log_level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace tessera

// Arguments are only evaluated when the level is enabled
#define TESSERA_LOG(level, tag, fmt, ...) \
    do { \
        if (tessera::log_enabled(level)) { \
            tessera::log_write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define LOG_ERROR(tag, fmt, ...) TESSERA_LOG(tessera::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  TESSERA_LOG(tessera::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  TESSERA_LOG(tessera::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) TESSERA_LOG(tessera::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
