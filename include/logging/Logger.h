//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional file sink and stderr routing for stdio hosts.
//==========================================================================================================
#pragma once

#include <atomic>
#include <format>
#include <string>

//==========================================================================================================
// Logger
// Purpose: Static facade behind the LOG_* macros. Lines look like
//          "2025-01-01 12:00:00.123 [INFO] Gateway.cpp:42: message".
// Notes:
//   - Console output goes to stdout unless setUseStderr(true); stdio hosts must route to stderr since
//     stdout carries protocol lines.
//   - The file sink, when set, receives every line that passes the level filter, without colour codes.
//   - Thread-safe; one mutex serializes console and file writes.
//==========================================================================================================
class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Case-insensitive; "WARNING" is accepted. Unknown strings map to INFO.
    static Level levelFromString(const std::string& lvl);
    static const char* levelName(Level level);

    static void setLevel(Level level) { sLevel.store(static_cast<int>(level)); }
    static void setLogLevelFromString(const std::string& lvl) { setLevel(levelFromString(lvl)); }
    static Level level() { return static_cast<Level>(sLevel.load()); }
    static bool enabled(Level level) { return static_cast<int>(level) >= sLevel.load(); }

    static void setUseStderr(bool v);
    static void setColorEnabled(bool v);

    // Opens filePath in append mode. Returns false (and reports on stderr) when it cannot be opened.
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    // Runtime format string; a bad pattern is logged as a format error instead of throwing.
    template <typename... Args>
    static void logf(Level level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error in \"{}\": {}", fmt, e.what());
        }
        write(level, buffer, file, line);
    }

    static void write(Level level, const std::string& msg, const char* file, unsigned int line);

private:
    static std::atomic<int> sLevel;
};

#define DLAB_LOG_AT(lvl, fmt, ...)                                                          \
    do {                                                                                    \
        if (Logger::enabled(lvl)) Logger::logf(lvl, fmt, __FILE__, __LINE__, ##__VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(fmt, ...) DLAB_LOG_AT(Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  DLAB_LOG_AT(Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  DLAB_LOG_AT(Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) DLAB_LOG_AT(Logger::Level::ERROR, fmt, ##__VA_ARGS__)

// Function entry/exit tracing, compiled in for _DEBUG builds only.
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
