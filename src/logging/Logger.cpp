//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, level parsing and line layout
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

#include "env/EnvVars.h"

namespace {

std::mutex gLogMutex;
std::ofstream gLogFile;
std::atomic<bool> gUseStderr{GetEnvFlag("DLAB_STDIO_MODE", false)};
std::atomic<bool> gColorEnabled{GetEnvFlag("DLAB_LOG_COLOR", true)};

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
#ifdef _WIN32
    const char* back = std::strrchr(path, '\\');
    if (back != nullptr && (slash == nullptr || back > slash)) slash = back;
#endif
    return slash ? slash + 1 : path;
}

std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    ::localtime_s(&tm, &t);
#else
    ::localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::format("{}.{:03}", buf, ms.count());
}

const char* labelColor(Logger::Level level) {
    switch (level) {
        case Logger::Level::DEBUG: return "\033[90m";
        case Logger::Level::INFO:  return "\033[35m";
        case Logger::Level::WARN:  return "\033[33m";
        default:                   return "\033[38;5;88m";
    }
}

} // namespace

std::atomic<int> Logger::sLevel{static_cast<int>(Logger::levelFromString(GetEnvOrDefault("DLAB_LOG_LEVEL", "INFO")))};

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return Level::DEBUG;
    if (s == "WARN" || s == "WARNING") return Level::WARN;
    if (s == "ERROR") return Level::ERROR;
    if (s == "FATAL") return Level::FATAL;
    return Level::INFO;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
    }
    return "INFO";
}

void Logger::setUseStderr(bool v) {
    gUseStderr.store(v);
}

void Logger::setColorEnabled(bool v) {
    gColorEnabled.store(v);
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) {
        gLogFile.close();
    }
    gLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!gLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    gLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    gLogFile.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) {
        gLogFile.close();
    }
}

void Logger::write(Level level, const std::string& msg, const char* file, unsigned int line) {
    const std::string prefix = timestamp();
    const char* name = levelName(level);
    const std::string tail = std::format("{}:{}: {}\n", baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::ostream& console = gUseStderr.load() ? std::cerr : std::cout;
    if (gColorEnabled.load()) {
        console << prefix << " [" << labelColor(level) << name << "\033[0m] " << tail;
    } else {
        console << prefix << " [" << name << "] " << tail;
    }
    console.flush();

    if (gLogFile.is_open()) {
        gLogFile << prefix << " [" << name << "] " << tail;
        gLogFile.flush();
    }
}
