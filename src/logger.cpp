/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/logger.hpp"
#include "orchestra/clock.hpp"
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace orchestra {

namespace {
std::atomic<LogLevel> g_level{LogLevel::INFO};

std::mutex g_sink_mutex;
LogSink g_sink;
std::mutex g_stderr_mutex;

thread_local std::string t_thread_name;

LogLevel envLevel() noexcept {
    const char* env_val = std::getenv("ORCHESTRA_LOG_LEVEL");
    if (!env_val) {
        return LogLevel::INFO;
    }
    try {
        return parseLogLevel(env_val).value_or(LogLevel::INFO);
    } catch (const std::exception&) {
        return LogLevel::INFO;
    }
}

// First use picks up ORCHESTRA_LOG_LEVEL; explicit setLevel() wins after that.
void ensureEnvLevel() noexcept {
    static const bool initialized = [] {
        g_level.store(envLevel());
        return true;
    }();
    (void)initialized;
}

std::string threadLabel() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    ensureEnvLevel();
    g_level.store(level);
}

void Logger::initFromEnv() noexcept {
    ensureEnvLevel();
    g_level.store(envLevel());
}

LogLevel Logger::level() noexcept {
    ensureEnvLevel();
    return g_level.load();
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        std::string line = "[" + toIso8601(Clock::now()) + "] [" + levelToString(level) + "] [" +
                           threadLabel() + "] " + message;

        // Called outside the lock, so a sink may itself log
        LogSink sink;
        {
            std::lock_guard<std::mutex> lock(g_sink_mutex);
            sink = g_sink;
        }
        if (sink) {
            sink(level, line);
            return;
        }

        std::lock_guard<std::mutex> lock(g_stderr_mutex);
        std::cerr << line << std::endl;
    } catch (...) {
        // Logging must never take down a worker loop
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lowered(name);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

void clearThreadName() {
    t_thread_name.clear();
}

}
