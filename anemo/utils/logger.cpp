#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <atomic>
#include <cinttypes>
#include <cstdio>

// Default log level
LogLevel Logger::s_level = LogLevel::INFO;

namespace {
    static std::atomic<LogSink> s_active_sink{nullptr};

    static char levelLetter(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return 'E';
            case LogLevel::WARN:  return 'W';
            case LogLevel::INFO:  return 'I';
            case LogLevel::DEBUG: return 'D';
        }
        return 'I';
    }
}

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

void Logger::setSink(LogSink sink) {
    s_active_sink.store(sink);
}

void Logger::consoleSink(LogLevel level, const char* tag, const char* message) {
    // Same shape as the ESP-IDF console: "I (1234) TAG: message"
    std::fprintf(stderr, "%c (%" PRIu64 ") %s: %s\n",
                 levelLetter(level), TimeFormat::uptimeMs(), tag, message);
}

void Logger::logFormatted(LogLevel gate_level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(gate_level)) {
        return;
    }
    LogSink sink = s_active_sink.load();
    if (sink == nullptr) {
        sink = &Logger::consoleSink;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        // Formatting error; emit a minimal message without heap
        sink(gate_level, tag, "formatting error");
        return;
    }
    // Ensure null-terminated within fixed buffer
    buffer[sizeof(buffer) - 1] = '\0';
    sink(gate_level, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
