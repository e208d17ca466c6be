#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdarg>

// Fixed-size formatting buffer to avoid heap usage
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 256
#endif

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

// Receives every message that passes the level gate, already formatted.
typedef void (*LogSink)(LogLevel level, const char* tag, const char* message);

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    static void warn(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void info(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    // Replace the output sink (nullptr restores the console sink)
    static void setSink(LogSink sink);

private:
    static void logFormatted(LogLevel gate_level, const char* tag, const char* fmt, va_list args);
    static void consoleSink(LogLevel level, const char* tag, const char* message);
    static LogLevel s_level;
};

// Convenience macros (no heap, fixed buffer)
#define LOG_ERROR(TAG, FMT, ...) Logger::error((TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::warn((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::info((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::debug((TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_HPP
