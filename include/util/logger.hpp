#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace billsync {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Short tag printed on every line, e.g. the sync id of the running session.
    // Empty clears it.
    void SetContext(std::string tag);
    std::string Context() const;

    // printf-style logging
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::billsync::Logger::Instance().LogWithSource(::billsync::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::billsync::Logger::Instance().LogWithSource(::billsync::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::billsync::Logger::Instance().LogWithSource(::billsync::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::billsync::Logger::Instance().LogWithSource(::billsync::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace billsync
