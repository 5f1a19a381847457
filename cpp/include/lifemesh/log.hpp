#pragma once

// Tagged printf-style logging to stderr. Define LIFEMESH_LOG_TAG before
// including this header to name the source of the lines.

namespace lifemesh {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Initial level comes from LIFEMESH_LOG_LEVEL (error|warn|info|debug), else warn.
LogLevel log_level();
void set_log_level(LogLevel level);
bool parse_log_level(const char* text, LogLevel& out);

void log_write(LogLevel level, const char* tag, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;
}

#ifndef LIFEMESH_LOG_TAG
#define LIFEMESH_LOG_TAG "lifemesh"
#endif

#define LIFEMESH_LOG_AT(level, ...)                                        \
    do {                                                                   \
        if (::lifemesh::log_level() >= (level))                            \
            ::lifemesh::log_write((level), LIFEMESH_LOG_TAG, __VA_ARGS__); \
    } while (0)

#define LIFEMESH_LOGE(...) LIFEMESH_LOG_AT(::lifemesh::LogLevel::Error, __VA_ARGS__)
#define LIFEMESH_LOGW(...) LIFEMESH_LOG_AT(::lifemesh::LogLevel::Warn, __VA_ARGS__)
#define LIFEMESH_LOGI(...) LIFEMESH_LOG_AT(::lifemesh::LogLevel::Info, __VA_ARGS__)
#define LIFEMESH_LOGD(...) LIFEMESH_LOG_AT(::lifemesh::LogLevel::Debug, __VA_ARGS__)
