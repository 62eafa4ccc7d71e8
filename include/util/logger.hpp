#pragma once

#include <cstdarg>
#include <cstdio>
#include <string_view>

namespace fwsync {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (any case).
bool ParseLogLevel(std::string_view text, LogLevel& out);
const char* ToString(LogLevel lvl);

class Logger {
  public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Defaults to stderr. The stream is not owned.
    void SetOutput(std::FILE* out);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
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

#define LogDebug(...) ::fwsync::Logger::Instance().LogWithSource(::fwsync::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::fwsync::Logger::Instance().LogWithSource(::fwsync::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::fwsync::Logger::Instance().LogWithSource(::fwsync::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::fwsync::Logger::Instance().LogWithSource(::fwsync::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace fwsync
