#include "util/logger.hpp"
#include "fwunpack/progress_sinks.hpp"

#include <cctype>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace fwunpack {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}

bool EqualsNoCase(std::string_view a, const char* b) {
    const size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
    }
    return true;
}
} // namespace

bool ParseLogLevel(std::string_view s, LogLevel& out) {
    if (EqualsNoCase(s, "debug")) { out = LogLevel::Debug; return true; }
    if (EqualsNoCase(s, "info"))  { out = LogLevel::Info;  return true; }
    if (EqualsNoCase(s, "warn"))  { out = LogLevel::Warn;  return true; }
    if (EqualsNoCase(s, "error")) { out = LogLevel::Error; return true; }
    if (EqualsNoCase(s, "none"))  { out = LogLevel::None;  return true; }
    return false;
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

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
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

    if (IsProgressLineActive()) {
        ClearProgressLine();
    }
    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    if (ts[0] != '\0') {
        std::fprintf(stderr, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(stderr, "[%s] ", ToStr(lvl));
    }
    const char* base = BaseName(file);
    if (base && line > 0) {
        std::fprintf(stderr, "[%s:%d] ", base, line);
    }
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}

} // namespace fwunpack
