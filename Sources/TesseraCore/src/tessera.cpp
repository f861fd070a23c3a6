// tessera.cpp - process-wide state shared by every translation unit

#include "tessera/log.hpp"
#include "tessera/registry.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace tessera {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};
std::atomic<bool> g_log_level_explicit{false};

std::optional<log_level> parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "?";
}

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    char message[1024];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    if (written < 0) {
        return;
    }
    // Over-long messages are cut at the buffer size
    std::fprintf(stderr, "tessera %-5s [%s] %s\n", log_level_name(level), tag, message);
}

void init_log_level_from_env() {
    if (g_log_level_explicit.load(std::memory_order_relaxed)) {
        return;
    }
    const char* value = std::getenv("TESSERA_LOG_LEVEL");
    if (!value || value[0] == '\0') {
        return;
    }
    if (auto level = parse_log_level(value)) {
        g_log_level.store(*level, std::memory_order_relaxed);
    } else {
        // Bypasses the level check
        log_write(log_level::warn, "log", "Ignoring unknown TESSERA_LOG_LEVEL \"%s\"", value);
    }
}

// Singleton instance - defined here to ensure single copy across all translation units
connection_registry& connection_registry::shared() {
    // Intentionally leaked: shared-memory connections live for the whole process.
    static connection_registry* registry = new connection_registry();
    return *registry;
}

} // namespace tessera
