#include "lifemesh/log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace lifemesh {

static std::atomic<int>& level_slot() {
    static std::atomic<int> level([] {
        LogLevel parsed = LogLevel::Warn;
        const char* env = std::getenv("LIFEMESH_LOG_LEVEL");
        if (env && !parse_log_level(env, parsed)) {
            std::fprintf(stderr, "[W][log] unknown LIFEMESH_LOG_LEVEL '%s', using warn\n", env);
        }
        return static_cast<int>(parsed);
    }());
    return level;
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) {
    level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool parse_log_level(const char* text, LogLevel& out) {
    if (std::strcmp(text, "error") == 0) out = LogLevel::Error;
    else if (std::strcmp(text, "warn") == 0) out = LogLevel::Warn;
    else if (std::strcmp(text, "info") == 0) out = LogLevel::Info;
    else if (std::strcmp(text, "debug") == 0) out = LogLevel::Debug;
    else return false;
    return true;
}

void log_write(LogLevel level, const char* tag, const char* format, ...) {
    static const char kLetters[] = {'E', 'W', 'I', 'D'};
    char line[512];
    va_list args;
    va_start(args, format);
    std::vsnprintf(line, sizeof(line), format, args);
    va_end(args);
    // one fprintf per line keeps concurrent writers from interleaving
    std::fprintf(stderr, "[%c][%s] %s\n", kLetters[static_cast<int>(level)], tag, line);
}

}
