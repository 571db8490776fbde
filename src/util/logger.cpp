#include "util/logger.hpp"
#include "progress/progress_sinks.hpp"

#include <cerrno>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace ovaup {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::FILE* g_file = nullptr;

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

void WriteRecord(std::FILE* out,
                 const char* ts,
                 LogLevel lvl,
                 const char* base,
                 int line,
                 const char* fmt,
                 va_list ap) {
    if (ts[0] != '\0') {
        std::fprintf(out, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::vfprintf(out, fmt, ap);
    std::fprintf(out, "\n");
}
} // namespace

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

Result Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty()) return Result::Ok();

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file) {
        return Result::FailErrno(
            errno, "failed to open log file: " + path + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
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
    const bool to_console = lvl >= g_level && g_level != LogLevel::None;
    const bool to_file = g_file != nullptr;
    if (!to_console && !to_file) return;

    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    const char* base = BaseName(file);

    if (to_file) {
        va_list file_ap;
        va_copy(file_ap, ap);
        WriteRecord(g_file, ts, lvl, base, line, fmt, file_ap);
        va_end(file_ap);
        std::fflush(g_file);
    }

    if (to_console) {
        // Print to stderr (typical for tools)
        if (IsProgressLineActive()) {
            ClearProgressLine();
        }
        va_list console_ap;
        va_copy(console_ap, ap);
        WriteRecord(stderr, ts, lvl, base, line, fmt, console_ap);
        va_end(console_ap);
    }
}

} // namespace ovaup
