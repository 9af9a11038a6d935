/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace orchestra {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Receives fully formatted lines. The default sink writes to stderr.
// Sinks may be called from several threads at once and may log themselves.
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // Re-reads ORCHESTRA_LOG_LEVEL; unset or unknown means INFO.
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Passing an empty sink restores stderr output.
    static void setSink(LogSink sink);

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static const char* levelToString(LogLevel level) noexcept;
};

// Case-insensitive; accepts error, warn, warning, info, debug, trace.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(const std::string& name);

// Names the calling thread in log lines until cleared.
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::orchestra::Logger::error(msg)
#define LOG_WARN(msg)  ::orchestra::Logger::warn(msg)
#define LOG_INFO(msg)  ::orchestra::Logger::info(msg)
#define LOG_DEBUG(msg) ::orchestra::Logger::debug(msg)
#define LOG_TRACE(msg) ::orchestra::Logger::trace(msg)
