#pragma once

#include <cstdarg>
#include <string>

#include "util/result.hpp"

namespace ovaup {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Appends every record (Debug and above) to `path`, independent of the
    // console level. An empty path closes the current file.
    Result SetLogFile(const std::string& path);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
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

#define LogDebug(...) ::ovaup::Logger::Instance().LogWithSource(::ovaup::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::ovaup::Logger::Instance().LogWithSource(::ovaup::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::ovaup::Logger::Instance().LogWithSource(::ovaup::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::ovaup::Logger::Instance().LogWithSource(::ovaup::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace ovaup
