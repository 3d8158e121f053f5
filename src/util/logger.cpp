#include "util/logger.hpp"
#include "sync/progress_sinks.hpp"

#include <cctype>
#include <chrono>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace billsync {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::string g_context;

const char* LevelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None:  break;
    }
    return "LOG";
}

// Local time with milliseconds; stream events often land within one second.
std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) return {};

    char buf[40]{};
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
    return buf;
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}
} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none") return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::SetContext(std::string tag) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_context = std::move(tag);
}

std::string Logger::Context() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_context;
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level || lvl == LogLevel::None) return;

    // The read loop and the signal watcher both log; keep each line whole.
    if (IsProgressLineActive()) {
        ClearProgressLine();
    }
    const std::string ts = Timestamp();
    if (!ts.empty()) {
        std::fprintf(stderr, "[%s] [%s] ", ts.c_str(), LevelTag(lvl));
    } else {
        std::fprintf(stderr, "[%s] ", LevelTag(lvl));
    }
    if (!g_context.empty()) {
        std::fprintf(stderr, "[%s] ", g_context.c_str());
    }
    const char* base = BaseName(file);
    if (base && line > 0) {
        std::fprintf(stderr, "[%s:%d] ", base, line);
    }
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}

} // namespace billsync
